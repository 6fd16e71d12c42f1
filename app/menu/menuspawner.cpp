#include "menuspawner.h"

#include <SDL.h>

#include <stdexcept>

using namespace DropMenu;

MenuSpawner::MenuSpawner(IMenuHost* host, const MenuStyle& style)
    : m_Host(host),
      m_Style(style)
{
    if (m_Host == nullptr) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Menu spawner created without a host");
        throw ConfigurationError(QStringLiteral("menu spawner needs a host"));
    }

    m_Style.validate();
}

void MenuSpawner::setStyle(const MenuStyle& style)
{
    style.validate();
    m_Style = style;
}

std::shared_ptr<MenuSession> MenuSpawner::open(const MenuNode* root, const QRectF& hotspot,
                                               const MenuOptions& options)
{
    if (root == nullptr) {
        throw std::invalid_argument("MenuSpawner: null root menu");
    }
    if (root->type() != MenuNode::Type::Menu) {
        throw std::invalid_argument("MenuSpawner: root must be a menu node");
    }

    auto session = std::make_shared<MenuSession>(m_Host, m_Style, options);

    if (onModalSurfaceCreated) {
        onModalSurfaceCreated(session->modalSurface());
    }
    if (onActionSelected) {
        session->addActionSelectedCallback(onActionSelected);
    }
    if (onSubmenuOpened) {
        session->addSubmenuOpenedCallback(onSubmenuOpened);
    }

    session->openDropdown(root, hotspot);

    // A session that failed to open never started, so it never ends either
    if (onSessionEnded) {
        session->addSessionEndedCallback(onSessionEnded);
    }

    if (onSessionStarted) {
        onSessionStarted(session.get());
    }

    return session;
}

std::shared_ptr<MenuSession> MenuSpawner::open(const MenuNode* root, const QPointF& point,
                                               const MenuOptions& options)
{
    return open(root, PlacementEngine::hotspotFromPoint(point), options);
}
