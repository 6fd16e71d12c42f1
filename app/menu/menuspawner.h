#pragma once

#include "menusession.h"

#include <functional>
#include <memory>

namespace DropMenu {

/**
 * MenuSpawner - opens menu sessions on one host with one style.
 *
 * Hooks set here are copied into every session opened afterwards.
 */
class MenuSpawner
{
public:
    // Throws ConfigurationError for a null host or an invalid style
    MenuSpawner(IMenuHost* host, const MenuStyle& style);

    // Throws std::invalid_argument for a null or non-Menu root
    std::shared_ptr<MenuSession> open(const MenuNode* root, const QRectF& hotspot,
                                      const MenuOptions& options = MenuOptions());
    std::shared_ptr<MenuSession> open(const MenuNode* root, const QPointF& point,
                                      const MenuOptions& options = MenuOptions());

    const MenuStyle& style() const { return m_Style; }
    void setStyle(const MenuStyle& style);

    std::function<void(MenuSession*)>               onSessionStarted;
    std::function<void(MenuSession*)>               onSessionEnded;
    std::function<void(const MenuNode*)>            onActionSelected;
    std::function<void(MenuSession*, PanelRecord*)> onSubmenuOpened;
    std::function<void(WidgetId)>                   onModalSurfaceCreated;

private:
    IMenuHost* m_Host;
    MenuStyle  m_Style;
};

}
