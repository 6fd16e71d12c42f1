#pragma once

#include "menulayout.h"
#include "placementengine.h"

#include <functional>
#include <memory>
#include <vector>

namespace DropMenu {

class MenuRouter;

struct MenuOptions {
    enum class Title {
        UseStyle,
        ForceShow,
        ForceHide,
    };

    Title         title = Title::UseStyle;
    GrowDirection growDirection = GrowDirection::Right;
};

/**
 * MenuSession - one open menu invocation.
 *
 * Owns the modal surface that captures outside clicks, the stack of open
 * panels (index 0 is the root panel) and the grow direction shared by
 * every panel of the session. Active until destroy(), which is terminal
 * and idempotent. Popping the last panel destroys the session.
 *
 * The host and the menu tree must outlive the session. Sessions are
 * normally held by std::shared_ptr so input handlers can keep them
 * alive while a callback closes them.
 */
class MenuSession : public std::enable_shared_from_this<MenuSession>
{
public:
    using SessionCallback = std::function<void(MenuSession*)>;
    using ActionCallback = std::function<void(const MenuNode*)>;
    using SubmenuCallback = std::function<void(MenuSession*, PanelRecord*)>;

    // Throws ConfigurationError for a null host or an invalid style
    MenuSession(IMenuHost* host, const MenuStyle& style,
                const MenuOptions& options = MenuOptions());
    ~MenuSession();

    MenuSession(const MenuSession&) = delete;
    MenuSession& operator=(const MenuSession&) = delete;

    // Opens the root panel. Throws std::invalid_argument for a null or non-Menu node.
    PanelRecord* openDropdown(const MenuNode* menu, const QRectF& hotspot);

    // Cascades a submenu from an entry rect of the parent panel
    PanelRecord* pushSubmenu(PanelRecord* parent, const MenuNode* menu, const QRectF& hotspot);

    // Closes the deepest panel. False when nothing was open.
    bool popTop();

    // Pops until the panel for the given node (or the given panel) is the deepest one.
    // With checkFirst, nothing is popped unless the target is open.
    bool popTo(const MenuNode* menu, bool checkFirst);
    bool popTo(const PanelRecord* panel, bool checkFirst);

    void breakDownTo(int depth);

    void destroy();
    bool isDestroyed() const { return m_Destroyed; }

    int depth() const { return (int)m_Stack.size(); }
    PanelRecord* panelAt(int index) const;
    PanelRecord* topPanel() const;

    GrowDirection growDirection() const { return m_Direction; }
    WidgetId modalSurface() const { return m_ModalSurface; }
    IMenuHost* host() const { return m_Host; }
    const MenuStyle& style() const { return m_Style; }
    const MenuOptions& options() const { return m_Options; }
    MenuRouter* router() const { return m_Router.get(); }

    void addSessionEndedCallback(SessionCallback callback);
    void addActionSelectedCallback(ActionCallback callback);
    void addSubmenuOpenedCallback(SubmenuCallback callback);

    // node is null when the session was dismissed without choosing anything
    void notifyActionSelected(const MenuNode* node);

private:
    bool isClosing() const { return m_Destroyed || m_Destroying; }
    bool rejectIfClosed(const char* operation) const;
    bool showTitle() const;
    void requireMenu(const MenuNode* menu) const;
    PanelRecord* pushPanel(PanelRecord* parent, const MenuNode* menu, const QRectF& hotspot,
                           const PlacementPlan& plan, bool addGoBack);
    void layoutShadow(PanelRecord& panel);
    void destroyPanelWidgets(PanelRecord& panel);

    IMenuHost*        m_Host;
    MenuStyle         m_Style;
    MenuOptions       m_Options;
    MenuLayoutBuilder m_Builder;
    GrowDirection     m_Direction;
    WidgetId          m_ModalSurface;
    std::vector<std::unique_ptr<PanelRecord>> m_Stack;
    std::unique_ptr<MenuRouter> m_Router;
    bool              m_Destroyed;
    bool              m_Destroying;

    std::vector<SessionCallback> m_SessionEndedCallbacks;
    std::vector<ActionCallback>  m_ActionSelectedCallbacks;
    std::vector<SubmenuCallback> m_SubmenuOpenedCallbacks;
};

}
