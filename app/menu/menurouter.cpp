#include "menurouter.h"
#include "menusession.h"

#include <SDL.h>

using namespace DropMenu;

MenuRouter::MenuRouter(MenuSession* session)
    : m_Session(session)
{
}

MenuRouter::~MenuRouter()
{
}

// ---------------------------------------------------------------------------
// Registrations
// ---------------------------------------------------------------------------

void MenuRouter::registerModalSurface(WidgetId modalSurface)
{
    Registration reg;
    reg.widget = modalSurface;
    reg.kind = RouteKind::ModalSurface;
    m_Registrations[modalSurface] = reg;
}

void MenuRouter::registerPanel(PanelRecord& panel)
{
    for (const PanelEntry& entry : panel.entries) {
        if (panel.widgetFor(entry.node) == InvalidWidget) {
            continue;
        }

        Registration reg;
        reg.widget = entry.plate;
        reg.target = entry.node;
        reg.panel = &panel;

        switch (entry.node->type()) {
        case MenuNode::Type::Action:
            reg.kind = RouteKind::Action;
            break;
        case MenuNode::Type::Menu:
            reg.kind = RouteKind::Submenu;
            break;
        case MenuNode::Type::GoBack:
            reg.kind = RouteKind::GoBack;
            break;
        default:
            continue;
        }

        m_Registrations[reg.widget] = reg;
    }

    if (panel.hasScrollActive) {
        Registration reg;
        reg.widget = panel.scroll.viewport;
        reg.kind = RouteKind::ScrollView;
        reg.target = panel.ownerNode;
        reg.panel = &panel;
        m_Registrations[reg.widget] = reg;
    }
}

void MenuRouter::unregisterPanel(const PanelRecord& panel)
{
    for (auto it = m_Registrations.begin(); it != m_Registrations.end();) {
        if (it->second.panel == &panel) {
            it = m_Registrations.erase(it);
        }
        else {
            ++it;
        }
    }
}

void MenuRouter::clear()
{
    m_Registrations.clear();
}

const MenuRouter::Registration* MenuRouter::registrationFor(WidgetId widget) const
{
    auto it = m_Registrations.find(widget);
    return it != m_Registrations.end() ? &it->second : nullptr;
}

// ---------------------------------------------------------------------------
// Input
// ---------------------------------------------------------------------------

void MenuRouter::pointerEntered(WidgetId widget)
{
    dispatch(Event::PointerEntered, widget);
}

void MenuRouter::pointerPressed(WidgetId widget)
{
    dispatch(Event::PointerPressed, widget);
}

void MenuRouter::clicked(WidgetId widget)
{
    dispatch(Event::Clicked, widget);
}

void MenuRouter::scrollChanged(WidgetId viewport)
{
    dispatch(Event::ScrollChanged, viewport);
}

void MenuRouter::dispatch(Event event, WidgetId widget)
{
    const Registration* found = registrationFor(widget);
    if (found == nullptr) {
        return;
    }

    // Handlers below may pop panels and unregister this record
    Registration reg = *found;

    // Callbacks may drop the last reference to the session
    std::shared_ptr<MenuSession> keepAlive = m_Session->weak_from_this().lock();
    if (m_Session->isDestroyed()) {
        return;
    }

    IMenuHost* host = m_Session->host();

    switch (reg.kind) {
    case RouteKind::Action:
    case RouteKind::GoBack:
        if (event == Event::PointerEntered) {
            highlightEntry(reg);
            m_Session->popTo(reg.panel->ownerNode, false);
        }
        else if (event == Event::PointerPressed) {
            host->setControlState(reg.widget, ControlState::Pressed);
        }
        else if (event == Event::Clicked) {
            selectEntry(reg);
        }
        break;

    case RouteKind::Submenu:
        if (event == Event::PointerEntered || event == Event::Clicked) {
            highlightEntry(reg);
            enterSubmenu(reg);
        }
        break;

    case RouteKind::ModalSurface:
        if ((event == Event::PointerPressed && m_Session->style().closeMethod == CloseMethod::PointerDown) ||
                (event == Event::Clicked && m_Session->style().closeMethod == CloseMethod::Click)) {
            dismiss();
        }
        break;

    case RouteKind::ScrollView:
        if (event == Event::ScrollChanged) {
            // Deeper submenus no longer line up with their entries
            m_Session->popTo(reg.panel->ownerNode, true);
        }
        break;
    }
}

void MenuRouter::highlightEntry(const Registration& reg)
{
    IMenuHost* host = m_Session->host();

    for (const auto& sibling : reg.panel->entryWidgetByNode) {
        if (host->isInteractable(sibling.second)) {
            host->setControlState(sibling.second, ControlState::Normal);
        }
    }
    if (host->isInteractable(reg.widget)) {
        host->setControlState(reg.widget, ControlState::Highlighted);
    }
}

void MenuRouter::enterSubmenu(const Registration& reg)
{
    IMenuHost* host = m_Session->host();

    if (!host->isInteractable(reg.widget)) {
        m_Session->popTo(reg.panel->ownerNode, false);
        return;
    }

    // Already open: just close whatever is deeper
    if (m_Session->popTo(reg.target, true)) {
        return;
    }

    m_Session->popTo(reg.panel->ownerNode, false);
    if (m_Session->isDestroyed()) {
        return;
    }

    m_Session->pushSubmenu(reg.panel, reg.target, host->widgetScreenRect(reg.widget));
}

void MenuRouter::selectEntry(const Registration& reg)
{
    if (!m_Session->host()->isInteractable(reg.widget)) {
        return;
    }

    reg.target->select();
    if (m_Session->isDestroyed()) {
        // The callback closed the session itself
        return;
    }

    if (reg.kind == RouteKind::Action) {
        m_Session->notifyActionSelected(reg.target);
        m_Session->destroy();
        return;
    }

    // Go back: leave the current submenu and the level that opened it
    const PanelRecord* target = reg.panel->parent != nullptr ? reg.panel->parent : reg.panel;
    m_Session->popTo(target, false);
    m_Session->popTop();
}

void MenuRouter::dismiss()
{
    m_Session->notifyActionSelected(nullptr);
    m_Session->destroy();
}
