#include "widgettree.h"

#include <SDL.h>

#include <algorithm>

using namespace DropMenu;

static bool isHitTestable(WidgetRole role)
{
    switch (role) {
    case WidgetRole::ModalSurface:
    case WidgetRole::Panel:
    case WidgetRole::Entry:
    case WidgetRole::Viewport:
    case WidgetRole::Content:
    case WidgetRole::Scrollbar:
        return true;
    default:
        return false;
    }
}

WidgetTree::WidgetTree()
    : m_NextId(1)
{
}

WidgetTree::~WidgetTree()
{
}

// ---------------------------------------------------------------------------
// Creation / destruction
// ---------------------------------------------------------------------------

WidgetTree::Widget* WidgetTree::widgetPtr(WidgetId widget)
{
    auto it = m_Widgets.find(widget);
    return it != m_Widgets.end() ? &it->second : nullptr;
}

const WidgetTree::Widget* WidgetTree::findWidget(WidgetId widget) const
{
    auto it = m_Widgets.find(widget);
    return it != m_Widgets.end() ? &it->second : nullptr;
}

WidgetId WidgetTree::allocate(WidgetId parent, WidgetRole role)
{
    if (parent != InvalidWidget && !isWidgetAlive(parent)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "WidgetTree: parent widget %u is gone", parent);
        return InvalidWidget;
    }

    WidgetId id = m_NextId++;
    Widget& w = m_Widgets[id];
    w.id = id;
    w.parent = parent;
    w.role = role;

    siblingsOf(w).push_back(id);
    return id;
}

std::vector<WidgetId>& WidgetTree::siblingsOf(const Widget& widget)
{
    if (widget.parent == InvalidWidget)
        return m_Roots;
    return m_Widgets.at(widget.parent).children;
}

void WidgetTree::detach(Widget& widget)
{
    auto& siblings = siblingsOf(widget);
    siblings.erase(std::remove(siblings.begin(), siblings.end(), widget.id), siblings.end());
}

WidgetId WidgetTree::createModalSurface(const QColor& color, bool visible)
{
    WidgetId id = allocate(InvalidWidget, WidgetRole::ModalSurface);
    Widget& w = m_Widgets.at(id);
    w.geometry = surfaceRect();
    w.color = color;
    w.visible = visible;
    widgetsChanged();
    return id;
}

WidgetId WidgetTree::createRect(WidgetId parent, WidgetRole role, const QColor& color)
{
    WidgetId id = allocate(parent, role);
    if (id == InvalidWidget)
        return id;

    m_Widgets.at(id).color = color;
    widgetsChanged();
    return id;
}

WidgetId WidgetTree::createLabel(WidgetId parent, const QString& text, const QFont& font,
                                 const QColor& color, Qt::Alignment alignment)
{
    WidgetId id = allocate(parent, WidgetRole::Label);
    if (id == InvalidWidget)
        return id;

    Widget& w = m_Widgets.at(id);
    w.text = text;
    w.font = font;
    w.color = color;
    w.alignment = alignment;
    w.geometry = QRectF(QPointF(0, 0), measureText(text, font));
    widgetsChanged();
    return id;
}

WidgetId WidgetTree::createImage(WidgetId parent, const QImage& image)
{
    WidgetId id = allocate(parent, WidgetRole::Image);
    if (id == InvalidWidget)
        return id;

    Widget& w = m_Widgets.at(id);
    w.image = image;
    w.color = Qt::white;
    w.geometry = QRectF(QPointF(0, 0), QSizeF(image.size()));
    widgetsChanged();
    return id;
}

ScrollView WidgetTree::createScrollView(WidgetId parent, const QRectF& viewportRect,
                                        qreal contentHeight, qreal scrollbarWidth,
                                        qreal sensitivity)
{
    ScrollView view;
    view.viewport = allocate(parent, WidgetRole::Viewport);
    if (view.viewport == InvalidWidget)
        return view;

    view.content = allocate(view.viewport, WidgetRole::Content);
    view.scrollbar = allocate(parent, WidgetRole::Scrollbar);
    view.thumb = allocate(view.scrollbar, WidgetRole::ScrollThumb);

    Widget& viewport = m_Widgets.at(view.viewport);
    viewport.geometry = viewportRect;
    viewport.color = Qt::transparent;
    viewport.scroll = view;
    viewport.contentHeight = contentHeight;
    viewport.scrollSensitivity = sensitivity;

    Widget& content = m_Widgets.at(view.content);
    content.geometry = QRectF(0, 0, viewportRect.width(), contentHeight);
    content.color = Qt::transparent;

    m_Widgets.at(view.scrollbar).geometry =
            QRectF(viewportRect.right(), viewportRect.top(), scrollbarWidth, viewportRect.height());

    updateScrollLayout(viewport);
    widgetsChanged();
    return view;
}

void WidgetTree::eraseRecursive(WidgetId widget)
{
    auto it = m_Widgets.find(widget);
    if (it == m_Widgets.end())
        return;

    std::vector<WidgetId> children;
    children.swap(it->second.children);
    m_Widgets.erase(it);

    for (WidgetId child : children)
        eraseRecursive(child);
}

void WidgetTree::destroyWidget(WidgetId widget)
{
    Widget* w = widgetPtr(widget);
    if (!w)
        return;

    detach(*w);
    eraseRecursive(widget);
    widgetsChanged();
}

bool WidgetTree::isWidgetAlive(WidgetId widget) const
{
    return m_Widgets.find(widget) != m_Widgets.end();
}

void WidgetTree::setWidgetColor(WidgetId widget, const QColor& color)
{
    if (Widget* w = widgetPtr(widget)) {
        w->color = color;
        widgetsChanged();
    }
}

// ---------------------------------------------------------------------------
// Interactive controls
// ---------------------------------------------------------------------------

void WidgetTree::makeInteractive(WidgetId widget, const ControlColors& colors, bool enabled)
{
    Widget* w = widgetPtr(widget);
    if (!w)
        return;

    w->interactive = true;
    w->enabled = enabled;
    w->colors = colors;
    w->state = enabled ? ControlState::Normal : ControlState::Disabled;
    widgetsChanged();
}

bool WidgetTree::isInteractable(WidgetId widget) const
{
    const Widget* w = findWidget(widget);
    return w && w->interactive && w->enabled;
}

void WidgetTree::setControlState(WidgetId widget, ControlState state)
{
    Widget* w = widgetPtr(widget);
    if (!w || !w->interactive || !w->enabled)
        return;

    if (w->state != state) {
        w->state = state;
        widgetsChanged();
    }
}

ControlState WidgetTree::controlState(WidgetId widget) const
{
    const Widget* w = findWidget(widget);
    return w ? w->state : ControlState::Normal;
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

void WidgetTree::setWidgetGeometry(WidgetId widget, const QRectF& rect)
{
    Widget* w = widgetPtr(widget);
    if (!w)
        return;

    w->geometry = rect;
    if (w->role == WidgetRole::Viewport)
        updateScrollLayout(*w);
    widgetsChanged();
}

QRectF WidgetTree::widgetGeometry(WidgetId widget) const
{
    const Widget* w = findWidget(widget);
    return w ? w->geometry : QRectF();
}

QRectF WidgetTree::widgetScreenRect(WidgetId widget) const
{
    const Widget* w = findWidget(widget);
    if (!w)
        return QRectF();

    QRectF rect = w->geometry;
    for (const Widget* p = findWidget(w->parent); p; p = findWidget(p->parent))
        rect.translate(p->geometry.topLeft());
    return rect;
}

void WidgetTree::moveWidgetToScreen(WidgetId widget, const QPointF& screenTopLeft)
{
    Widget* w = widgetPtr(widget);
    if (!w)
        return;

    QPointF origin(0, 0);
    if (w->parent != InvalidWidget)
        origin = widgetScreenRect(w->parent).topLeft();

    w->geometry.moveTopLeft(screenTopLeft - origin);
    widgetsChanged();
}

void WidgetTree::reparentWidget(WidgetId widget, WidgetId newParent)
{
    Widget* w = widgetPtr(widget);
    if (!w || !isWidgetAlive(newParent) || widget == newParent)
        return;

    detach(*w);
    w->parent = newParent;
    m_Widgets.at(newParent).children.push_back(widget);
    widgetsChanged();
}

std::vector<WidgetId> WidgetTree::widgetChildren(WidgetId widget) const
{
    const Widget* w = findWidget(widget);
    return w ? w->children : std::vector<WidgetId>();
}

// ---------------------------------------------------------------------------
// Sibling order
// ---------------------------------------------------------------------------

void WidgetTree::raiseWidget(WidgetId widget)
{
    Widget* w = widgetPtr(widget);
    if (!w)
        return;

    auto& siblings = siblingsOf(*w);
    siblings.erase(std::remove(siblings.begin(), siblings.end(), widget), siblings.end());
    siblings.push_back(widget);
    widgetsChanged();
}

void WidgetTree::stackWidgetUnder(WidgetId widget, WidgetId sibling)
{
    Widget* w = widgetPtr(widget);
    const Widget* s = findWidget(sibling);
    if (!w || !s || widget == sibling)
        return;

    if (w->parent != s->parent) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "WidgetTree: cannot stack %u under %u, different parents",
                    widget, sibling);
        return;
    }

    auto& siblings = siblingsOf(*w);
    siblings.erase(std::remove(siblings.begin(), siblings.end(), widget), siblings.end());
    siblings.insert(std::find(siblings.begin(), siblings.end(), sibling), widget);
    widgetsChanged();
}

int WidgetTree::widgetSiblingIndex(WidgetId widget) const
{
    const Widget* w = findWidget(widget);
    if (!w)
        return -1;

    const auto& siblings = w->parent == InvalidWidget ? m_Roots : m_Widgets.at(w->parent).children;
    auto it = std::find(siblings.begin(), siblings.end(), widget);
    return it != siblings.end() ? (int)(it - siblings.begin()) : -1;
}

// ---------------------------------------------------------------------------
// Scrolling
// ---------------------------------------------------------------------------

void WidgetTree::updateScrollLayout(Widget& viewport)
{
    qreal viewH = viewport.geometry.height();
    qreal range = qMax<qreal>(0, viewport.contentHeight - viewH);

    if (Widget* content = widgetPtr(viewport.scroll.content)) {
        content->geometry = QRectF(0, -viewport.scrollPosition * range,
                                   viewport.geometry.width(), viewport.contentHeight);
    }

    if (Widget* thumb = widgetPtr(viewport.scroll.thumb)) {
        qreal trackH = viewH;
        qreal thumbH = viewport.contentHeight > 0
                ? qMax<qreal>(16, trackH * qMin<qreal>(1, viewH / viewport.contentHeight))
                : trackH;
        thumbH = qMin(thumbH, trackH);
        qreal thumbW = 0;
        if (const Widget* bar = findWidget(viewport.scroll.scrollbar))
            thumbW = bar->geometry.width();
        thumb->geometry = QRectF(0, (trackH - thumbH) * viewport.scrollPosition, thumbW, thumbH);
    }
}

void WidgetTree::setScrollPosition(WidgetId viewport, qreal normalized)
{
    Widget* w = widgetPtr(viewport);
    if (!w || w->role != WidgetRole::Viewport)
        return;

    w->scrollPosition = qBound<qreal>(0, normalized, 1);
    updateScrollLayout(*w);
    widgetsChanged();
}

qreal WidgetTree::scrollPosition(WidgetId viewport) const
{
    const Widget* w = findWidget(viewport);
    return w ? w->scrollPosition : 0;
}

void WidgetTree::scrollBy(WidgetId viewport, qreal pixels)
{
    Widget* w = widgetPtr(viewport);
    if (!w || w->role != WidgetRole::Viewport)
        return;

    qreal range = w->contentHeight - w->geometry.height();
    if (range <= 0)
        return;

    qreal pos = qBound<qreal>(0, w->scrollPosition + pixels / range, 1);
    if (qFuzzyCompare(pos + 1, w->scrollPosition + 1))
        return;

    w->scrollPosition = pos;
    updateScrollLayout(*w);
    widgetsChanged();
    notifyScrollChanged(viewport);
}

WidgetId WidgetTree::enclosingViewport(WidgetId widget) const
{
    for (const Widget* w = findWidget(widget); w; w = findWidget(w->parent)) {
        if (w->role == WidgetRole::Viewport)
            return w->id;
    }
    return InvalidWidget;
}

// ---------------------------------------------------------------------------
// Hit testing
// ---------------------------------------------------------------------------

WidgetId WidgetTree::hitTestWidget(const Widget& widget, const QPointF& pos,
                                   const QPointF& origin) const
{
    QRectF rect = widget.geometry.translated(origin);
    if (!rect.contains(pos))
        return InvalidWidget;

    // Children are clipped to their parent
    for (auto it = widget.children.rbegin(); it != widget.children.rend(); ++it) {
        WidgetId hit = hitTestWidget(m_Widgets.at(*it), pos, rect.topLeft());
        if (hit != InvalidWidget)
            return hit;
    }

    return isHitTestable(widget.role) ? widget.id : InvalidWidget;
}

WidgetId WidgetTree::hitTest(const QPointF& screenPos) const
{
    for (auto it = m_Roots.rbegin(); it != m_Roots.rend(); ++it) {
        WidgetId hit = hitTestWidget(m_Widgets.at(*it), screenPos, QPointF(0, 0));
        if (hit != InvalidWidget)
            return hit;
    }
    return InvalidWidget;
}

// ---------------------------------------------------------------------------
// Listeners
// ---------------------------------------------------------------------------

void WidgetTree::addInputListener(IMenuInputListener* listener)
{
    if (listener && !hasListener(listener))
        m_Listeners.push_back(listener);
}

void WidgetTree::removeInputListener(IMenuInputListener* listener)
{
    m_Listeners.erase(std::remove(m_Listeners.begin(), m_Listeners.end(), listener),
                      m_Listeners.end());
}

bool WidgetTree::hasListener(IMenuInputListener* listener) const
{
    return std::find(m_Listeners.begin(), m_Listeners.end(), listener) != m_Listeners.end();
}

// Listeners may unregister (or be destroyed) while an event is being delivered
void WidgetTree::notifyPointerEntered(WidgetId widget)
{
    std::vector<IMenuInputListener*> listeners = m_Listeners;
    for (IMenuInputListener* listener : listeners) {
        if (hasListener(listener))
            listener->pointerEntered(widget);
    }
}

void WidgetTree::notifyPointerPressed(WidgetId widget)
{
    std::vector<IMenuInputListener*> listeners = m_Listeners;
    for (IMenuInputListener* listener : listeners) {
        if (hasListener(listener))
            listener->pointerPressed(widget);
    }
}

void WidgetTree::notifyClicked(WidgetId widget)
{
    std::vector<IMenuInputListener*> listeners = m_Listeners;
    for (IMenuInputListener* listener : listeners) {
        if (hasListener(listener))
            listener->clicked(widget);
    }
}

void WidgetTree::notifyScrollChanged(WidgetId viewport)
{
    std::vector<IMenuInputListener*> listeners = m_Listeners;
    for (IMenuInputListener* listener : listeners) {
        if (hasListener(listener))
            listener->scrollChanged(viewport);
    }
}
