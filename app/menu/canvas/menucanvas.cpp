#include "menucanvas.h"

#include "menu/menustyle.h"

#include <QFontMetricsF>
#include <QPainterPath>
#include <QSurfaceFormat>

#include <SDL.h>

using namespace DropMenu;

MenuCanvas::MenuCanvas(QWindow* parent)
    : QRasterWindow(parent),
      m_BackgroundColor(32, 32, 32),
      m_HoverWidget(InvalidWidget),
      m_PressWidget(InvalidWidget),
      m_PressButton(Qt::NoButton),
      m_BorderRadius(8),
      m_EntryRadius(4),
      m_ShadowMargin(8)
{
    QSurfaceFormat fmt;
    fmt.setAlphaBufferSize(8);
    setFormat(fmt);
}

MenuCanvas::~MenuCanvas()
{
}

QRectF MenuCanvas::surfaceRect() const
{
    return QRectF(0, 0, width(), height());
}

QSizeF MenuCanvas::measureText(const QString& text, const QFont& font) const
{
    QFontMetricsF fm(font);
#if QT_VERSION >= QT_VERSION_CHECK(5, 11, 0)
    return QSizeF(fm.horizontalAdvance(text), fm.height());
#else
    return QSizeF(fm.width(text), fm.height());
#endif
}

void MenuCanvas::setBackgroundColor(const QColor& color)
{
    m_BackgroundColor = color;
    requestUpdate();
}

void MenuCanvas::widgetsChanged()
{
    requestUpdate();
}

void MenuCanvas::resizeEvent(QResizeEvent* event)
{
    // Modal surfaces always cover the whole window
    for (WidgetId root : rootWidgets()) {
        const Widget* w = findWidget(root);
        if (w && w->role == WidgetRole::ModalSurface) {
            setWidgetGeometry(root, surfaceRect());
        }
    }
    QRasterWindow::resizeEvent(event);
}

// ---------------------------------------------------------------------------
// Painting
// ---------------------------------------------------------------------------

QColor MenuCanvas::colorForState(const Widget& widget) const
{
    if (!widget.interactive) {
        return widget.color;
    }

    switch (widget.state) {
    case ControlState::Highlighted:
        return widget.colors.highlighted;
    case ControlState::Pressed:
        return widget.colors.pressed;
    case ControlState::Disabled:
        return widget.colors.disabled;
    default:
        return widget.colors.normal;
    }
}

void MenuCanvas::paintWidget(QPainter& p, const Widget& widget, const QPointF& origin)
{
    QRectF rect = widget.geometry.translated(origin);

    p.save();

    switch (widget.role) {
    case WidgetRole::ModalSurface:
        if (widget.visible) {
            p.fillRect(rect, widget.color);
        }
        break;

    case WidgetRole::Shadow: {
        // Soft drop shadow, strongest next to the panel
        int sm = m_ShadowMargin;
        for (int i = sm; i >= 1; i--) {
            qreal t = 1.0 - (qreal)i / sm;
            QColor c = widget.color;
            c.setAlphaF(widget.color.alphaF() * t * t);
            QPainterPath sp;
            sp.addRoundedRect(rect.adjusted(-i, -i, i, i), m_BorderRadius + i, m_BorderRadius + i);
            p.fillPath(sp, c);
        }
        break;
    }

    case WidgetRole::Panel: {
        QPainterPath bgPath;
        bgPath.addRoundedRect(rect, m_BorderRadius, m_BorderRadius);
        p.fillPath(bgPath, widget.color);

        // Thin light outline
        p.setPen(QPen(QColor(255, 255, 255, 20), 1.0));
        p.drawPath(bgPath);

        p.setClipPath(bgPath, Qt::IntersectClip);
        break;
    }

    case WidgetRole::Entry: {
        QColor c = colorForState(widget);
        if (c.alpha() > 0) {
            QPainterPath hlPath;
            hlPath.addRoundedRect(rect.adjusted(0, 1, 0, -1), m_EntryRadius, m_EntryRadius);
            p.fillPath(hlPath, c);
        }
        if (!widget.enabled) {
            p.setOpacity(0.35);
        }
        break;
    }

    case WidgetRole::Label:
        p.setFont(widget.font);
        p.setPen(widget.color);
        p.drawText(rect, widget.alignment, widget.text);
        break;

    case WidgetRole::Image:
        p.drawImage(rect, widget.image);
        break;

    case WidgetRole::Separator:
        p.fillRect(rect, widget.color);
        break;

    case WidgetRole::Viewport:
        p.setClipRect(rect, Qt::IntersectClip);
        break;

    case WidgetRole::Scrollbar:
    case WidgetRole::ScrollThumb: {
        QPainterPath path;
        qreal r = rect.width() / 2;
        path.addRoundedRect(rect.adjusted(1, 1, -1, -1), r, r);
        p.fillPath(path, widget.color);
        break;
    }

    default:
        break;
    }

    for (WidgetId child : widget.children) {
        if (const Widget* c = findWidget(child)) {
            paintWidget(p, *c, rect.topLeft());
        }
    }

    p.restore();
}

void MenuCanvas::paintEvent(QPaintEvent*)
{
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.setRenderHint(QPainter::TextAntialiasing);
    p.setRenderHint(QPainter::SmoothPixmapTransform);

    p.fillRect(0, 0, width(), height(), m_BackgroundColor);

    for (WidgetId root : rootWidgets()) {
        if (const Widget* w = findWidget(root)) {
            paintWidget(p, *w, QPointF(0, 0));
        }
    }
}

// ---------------------------------------------------------------------------
// Mouse input
// ---------------------------------------------------------------------------

void MenuCanvas::deliver(const std::function<void()>& event)
{
    try {
        event();
    }
    catch (const ConfigurationError& e) {
        // Nothing can propagate through the Qt event loop
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Menu configuration error: %s",
                     e.what());
    }
}

void MenuCanvas::updateHover(const QPointF& pos)
{
    if (m_HoverWidget != InvalidWidget && !isWidgetAlive(m_HoverWidget)) {
        m_HoverWidget = InvalidWidget;
    }

    WidgetId hit = hitTest(pos);
    if (hit == m_HoverWidget) {
        return;
    }

    m_HoverWidget = hit;
    if (hit != InvalidWidget) {
        setCursor(findWidget(hit)->role == WidgetRole::Entry && isInteractable(hit)
                  ? Qt::PointingHandCursor : Qt::ArrowCursor);
        deliver([this, hit]() { notifyPointerEntered(hit); });
    }
    else {
        setCursor(Qt::ArrowCursor);
    }
}

void MenuCanvas::mouseMoveEvent(QMouseEvent* event)
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    updateHover(event->position());
#else
    updateHover(event->localPos());
#endif
}

void MenuCanvas::mousePressEvent(QMouseEvent* event)
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    QPointF pos = event->position();
#else
    QPointF pos = event->localPos();
#endif

    WidgetId hit = hitTest(pos);

    if (hit == InvalidWidget) {
        if (event->button() == Qt::RightButton) {
            emit contextRequested(pos);
        }
        return;
    }

    // Any button counts as a press, so outside presses close open menus
    m_PressWidget = hit;
    m_PressButton = event->button();
    deliver([this, hit]() { notifyPointerPressed(hit); });
}

void MenuCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != m_PressButton) return;

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    WidgetId hit = hitTest(event->position());
#else
    WidgetId hit = hitTest(event->localPos());
#endif

    WidgetId pressed = m_PressWidget;
    m_PressWidget = InvalidWidget;
    m_PressButton = Qt::NoButton;

    // A click needs a left press and release on the same live widget
    if (hit != InvalidWidget && hit == pressed && event->button() == Qt::LeftButton) {
        deliver([this, hit]() { notifyClicked(hit); });
        return;
    }

    if (isWidgetAlive(pressed) && controlState(pressed) == ControlState::Pressed) {
        setControlState(pressed, pressed == m_HoverWidget ? ControlState::Highlighted
                                                          : ControlState::Normal);
    }
}

void MenuCanvas::wheelEvent(QWheelEvent* event)
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    WidgetId hit = hitTest(event->position());
#else
    WidgetId hit = hitTest(event->posF());
#endif

    WidgetId viewport = enclosingViewport(hit);
    if (viewport == InvalidWidget) {
        event->ignore();
        return;
    }

    qreal pixels = -event->angleDelta().y() / 120.0 * findWidget(viewport)->scrollSensitivity;
    deliver([this, viewport, pixels]() { scrollBy(viewport, pixels); });
    event->accept();
}
