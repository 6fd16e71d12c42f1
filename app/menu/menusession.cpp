#include "menusession.h"
#include "menurouter.h"

#include <SDL.h>

#include <algorithm>
#include <stdexcept>

using namespace DropMenu;

MenuSession::MenuSession(IMenuHost* host, const MenuStyle& style, const MenuOptions& options)
    : m_Host(host),
      m_Style(style),
      m_Options(options),
      m_Builder(host, m_Style),
      m_Direction(options.growDirection),
      m_ModalSurface(InvalidWidget),
      m_Destroyed(false),
      m_Destroying(false)
{
    if (m_Host == nullptr) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Menu session created without a host");
        throw ConfigurationError(QStringLiteral("menu session needs a host"));
    }

    m_Style.validate();

    m_Router = std::make_unique<MenuRouter>(this);

    m_ModalSurface = m_Host->createModalSurface(m_Style.modalScrimColor, m_Style.modalScrimVisible);
    m_Router->registerModalSurface(m_ModalSurface);
    m_Host->addInputListener(m_Router.get());
}

MenuSession::~MenuSession()
{
    destroy();
}

// ---------------------------------------------------------------------------
// Opening panels
// ---------------------------------------------------------------------------

void MenuSession::requireMenu(const MenuNode* menu) const
{
    if (menu == nullptr) {
        throw std::invalid_argument("MenuSession: null menu");
    }
    if (menu->type() != MenuNode::Type::Menu) {
        throw std::invalid_argument("MenuSession: only menu nodes can be opened");
    }
}

bool MenuSession::showTitle() const
{
    switch (m_Options.title) {
    case MenuOptions::Title::ForceShow:
        return true;
    case MenuOptions::Title::ForceHide:
        return false;
    default:
        return m_Style.showTitles;
    }
}

PanelRecord* MenuSession::openDropdown(const MenuNode* menu, const QRectF& hotspot)
{
    requireMenu(menu);

    if (isClosing()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Ignoring open of '%s' on a closed menu session",
                    qPrintable(menu->label()));
        return nullptr;
    }
    if (!m_Stack.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Menu session already shows '%s'",
                    qPrintable(m_Stack.front()->ownerNode->label()));
        return nullptr;
    }

    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION,
                "Opening menu '%s' at %.0f,%.0f %.0fx%.0f",
                qPrintable(menu->label()),
                hotspot.x(), hotspot.y(), hotspot.width(), hotspot.height());

    return pushPanel(nullptr, menu, hotspot, PlacementEngine::dropdownPlan(m_Direction), false);
}

PanelRecord* MenuSession::pushSubmenu(PanelRecord* parent, const MenuNode* menu, const QRectF& hotspot)
{
    requireMenu(menu);

    if (isClosing()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Ignoring submenu '%s' on a closed menu session",
                    qPrintable(menu->label()));
        return nullptr;
    }

    QRectF spot = hotspot;
    if (parent != nullptr && parent->hasScrollActive) {
        // Keep the parent's scrollbar uncovered
        spot.setRight(spot.right() + m_Style.scrollbarWidth + m_Style.outerPadding.right());
    }

    PanelRecord* panel = pushPanel(parent, menu, spot, PlacementEngine::submenuPlan(m_Direction),
                                   m_Style.useGoBack);

    auto callbacks = m_SubmenuOpenedCallbacks;
    for (const auto& callback : callbacks) {
        callback(this, panel);
    }

    return panel;
}

PanelRecord* MenuSession::pushPanel(PanelRecord* parent, const MenuNode* menu, const QRectF& hotspot,
                                    const PlacementPlan& plan, bool addGoBack)
{
    std::unique_ptr<PanelRecord> record = m_Builder.build(m_ModalSurface, menu, parent,
                                                          showTitle(), addGoBack);
    PanelRecord* panel = record.get();
    m_Stack.push_back(std::move(record));

    QRectF screen = m_Host->surfaceRect();
    QRectF rect(PlacementEngine::initialTopLeft(plan, hotspot, panel->naturalSize),
                panel->naturalSize);

    VerticalPlacement vertical = PlacementEngine::resolveVertical(rect, screen, m_Style.scrollbarWidth);
    if (vertical.scrollMode) {
        m_Builder.applyScrollMode(*panel, vertical.rect.size());
        m_Builder.centerOnSelected(*panel);
    }

    rect = PlacementEngine::resolveHorizontal(plan, vertical.rect, hotspot, screen, m_Direction);

    m_Host->moveWidgetToScreen(panel->body, rect.topLeft());
    m_Host->raiseWidget(panel->body);
    layoutShadow(*panel);

    m_Router->registerPanel(*panel);
    return panel;
}

// Shadow sits behind its own body and behind the panel it cascades from
void MenuSession::layoutShadow(PanelRecord& panel)
{
    QRectF body = m_Host->widgetGeometry(panel.body);
    m_Host->setWidgetGeometry(panel.shadow, body.translated(m_Style.shadowOffset));

    WidgetId under = panel.parent != nullptr ? panel.parent->body : panel.body;
    m_Host->stackWidgetUnder(panel.shadow, under);
}

// ---------------------------------------------------------------------------
// Closing panels
// ---------------------------------------------------------------------------

void MenuSession::destroyPanelWidgets(PanelRecord& panel)
{
    m_Host->destroyWidget(panel.shadow);
    m_Host->destroyWidget(panel.body);
    panel.clear();
}

bool MenuSession::rejectIfClosed(const char* operation) const
{
    if (!isClosing()) {
        return false;
    }

    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "Ignoring %s on a closed menu session",
                operation);
    return true;
}

bool MenuSession::popTop()
{
    if (rejectIfClosed("popTop") || m_Stack.empty()) {
        return false;
    }

    // Off the stack before its widgets go away
    std::unique_ptr<PanelRecord> panel = std::move(m_Stack.back());
    m_Stack.pop_back();

    m_Router->unregisterPanel(*panel);
    destroyPanelWidgets(*panel);

    if (m_Stack.empty()) {
        destroy();
    }
    return true;
}

bool MenuSession::popTo(const MenuNode* menu, bool checkFirst)
{
    if (rejectIfClosed("popTo")) {
        return false;
    }

    if (checkFirst) {
        auto it = std::find_if(m_Stack.begin(), m_Stack.end(),
                               [menu](const std::unique_ptr<PanelRecord>& p) { return p->ownerNode == menu; });
        if (it == m_Stack.end()) {
            return false;
        }
    }

    while (!m_Stack.empty()) {
        if (m_Stack.back()->ownerNode == menu) {
            return true;
        }
        popTop();
    }
    return false;
}

bool MenuSession::popTo(const PanelRecord* panel, bool checkFirst)
{
    if (rejectIfClosed("popTo")) {
        return false;
    }

    if (checkFirst) {
        auto it = std::find_if(m_Stack.begin(), m_Stack.end(),
                               [panel](const std::unique_ptr<PanelRecord>& p) { return p.get() == panel; });
        if (it == m_Stack.end()) {
            return false;
        }
    }

    while (!m_Stack.empty()) {
        if (m_Stack.back().get() == panel) {
            return true;
        }
        popTop();
    }
    return false;
}

void MenuSession::breakDownTo(int depth)
{
    if (rejectIfClosed("breakDownTo")) {
        return;
    }

    while (!isClosing() && (int)m_Stack.size() > qMax(depth, 0)) {
        popTop();
    }
}

void MenuSession::destroy()
{
    if (isClosing()) {
        return;
    }
    m_Destroying = true;

    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION,
                "Closing menu session with %d open panel(s)",
                (int)m_Stack.size());

    auto callbacks = m_SessionEndedCallbacks;
    for (const auto& callback : callbacks) {
        callback(this);
    }

    m_Host->removeInputListener(m_Router.get());
    m_Router->clear();

    std::vector<std::unique_ptr<PanelRecord>> stack;
    stack.swap(m_Stack);

    // Panels are children of the modal surface
    m_Host->destroyWidget(m_ModalSurface);
    m_ModalSurface = InvalidWidget;
    for (auto& panel : stack) {
        panel->clear();
    }

    m_Destroyed = true;
    m_Destroying = false;
}

// ---------------------------------------------------------------------------
// Accessors / notifications
// ---------------------------------------------------------------------------

PanelRecord* MenuSession::panelAt(int index) const
{
    if (index < 0 || index >= (int)m_Stack.size()) {
        return nullptr;
    }
    return m_Stack[index].get();
}

PanelRecord* MenuSession::topPanel() const
{
    return m_Stack.empty() ? nullptr : m_Stack.back().get();
}

void MenuSession::addSessionEndedCallback(SessionCallback callback)
{
    m_SessionEndedCallbacks.push_back(std::move(callback));
}

void MenuSession::addActionSelectedCallback(ActionCallback callback)
{
    m_ActionSelectedCallbacks.push_back(std::move(callback));
}

void MenuSession::addSubmenuOpenedCallback(SubmenuCallback callback)
{
    m_SubmenuOpenedCallbacks.push_back(std::move(callback));
}

void MenuSession::notifyActionSelected(const MenuNode* node)
{
    auto callbacks = m_ActionSelectedCallbacks;
    for (const auto& callback : callbacks) {
        callback(node);
    }
}
