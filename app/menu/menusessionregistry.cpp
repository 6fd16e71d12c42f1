#include "menusessionregistry.h"
#include "menusession.h"

using namespace DropMenu;

MenuSessionRegistry::~MenuSessionRegistry()
{
    closeActive();
}

void MenuSessionRegistry::track(std::shared_ptr<MenuSession> session)
{
    if (m_Active && m_Active != session) {
        m_Active->destroy();
    }
    m_Active = std::move(session);
}

std::shared_ptr<MenuSession> MenuSessionRegistry::active() const
{
    if (m_Active && !m_Active->isDestroyed()) {
        return m_Active;
    }
    return nullptr;
}

void MenuSessionRegistry::closeActive()
{
    // Destroy callbacks may re-enter the registry
    std::shared_ptr<MenuSession> session = std::move(m_Active);
    m_Active.reset();
    if (session) {
        session->destroy();
    }
}
