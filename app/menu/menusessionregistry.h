#pragma once

#include <memory>

namespace DropMenu {

class MenuSession;

// Keeps at most one menu session open application-wide
class MenuSessionRegistry
{
public:
    ~MenuSessionRegistry();

    // Closes the previously tracked session before tracking this one
    void track(std::shared_ptr<MenuSession> session);

    // Null once the tracked session has been destroyed
    std::shared_ptr<MenuSession> active() const;

    void closeActive();

private:
    std::shared_ptr<MenuSession> m_Active;
};

}
