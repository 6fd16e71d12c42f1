#pragma once

#include "menuhost.h"

#include <unordered_map>

namespace DropMenu {

class MenuNode;
class MenuSession;
struct PanelRecord;

/**
 * MenuRouter - turns host pointer events into session operations.
 *
 * Every widget the session cares about gets one registration record;
 * a single dispatch function looks the widget up and acts on the
 * record's kind.
 */
class MenuRouter : public IMenuInputListener
{
public:
    enum class RouteKind {
        Action,
        Submenu,
        GoBack,
        ModalSurface,
        ScrollView,
    };

    struct Registration {
        WidgetId        widget = InvalidWidget;
        RouteKind       kind = RouteKind::Action;
        const MenuNode* target = nullptr;
        PanelRecord*    panel = nullptr;
    };

    explicit MenuRouter(MenuSession* session);
    ~MenuRouter() override;

    void registerModalSurface(WidgetId modalSurface);
    void registerPanel(PanelRecord& panel);
    void unregisterPanel(const PanelRecord& panel);
    void clear();

    const Registration* registrationFor(WidgetId widget) const;
    int registrationCount() const { return (int)m_Registrations.size(); }

    void pointerEntered(WidgetId widget) override;
    void pointerPressed(WidgetId widget) override;
    void clicked(WidgetId widget) override;
    void scrollChanged(WidgetId viewport) override;

private:
    enum class Event {
        PointerEntered,
        PointerPressed,
        Clicked,
        ScrollChanged,
    };

    void dispatch(Event event, WidgetId widget);
    void highlightEntry(const Registration& reg);
    void enterSubmenu(const Registration& reg);
    void selectEntry(const Registration& reg);
    void dismiss();

    MenuSession* m_Session;
    std::unordered_map<WidgetId, Registration> m_Registrations;
};

}
