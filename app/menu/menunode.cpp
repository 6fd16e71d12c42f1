#include "menunode.h"

#include <stdexcept>

using namespace DropMenu;

std::unique_ptr<MenuNode> MenuNode::createMenu(const QString& label, Flags flags)
{
    return std::make_unique<MenuNode>(Type::Menu, label, Callback(), flags);
}

std::unique_ptr<MenuNode> MenuNode::createAction(const QString& label, Callback onSelect, Flags flags)
{
    return std::make_unique<MenuNode>(Type::Action, label, std::move(onSelect), flags);
}

std::unique_ptr<MenuNode> MenuNode::createSeparator()
{
    return std::make_unique<MenuNode>(Type::Separator, QString());
}

std::unique_ptr<MenuNode> MenuNode::createGoBack(const QString& label, Callback onSelect)
{
    return std::make_unique<MenuNode>(Type::GoBack, label, std::move(onSelect));
}

MenuNode::MenuNode(Type type, const QString& label, Callback onSelect, Flags flags)
    : m_Type(type),
      m_Label(label),
      m_OnSelect(std::move(onSelect)),
      m_Color(Qt::white),
      m_Alignment(TextAlignment::Default),
      m_Flags(flags)
{
    bool selectable = (type == Type::Action || type == Type::GoBack);
    if (selectable && !m_OnSelect) {
        throw std::invalid_argument("MenuNode: action and go-back entries need a callback");
    }
    if (!selectable && m_OnSelect) {
        throw std::invalid_argument("MenuNode: only action and go-back entries take a callback");
    }
}

MenuNode::~MenuNode()
{
}

bool MenuNode::isInteractive() const
{
    return m_Type == Type::Action || m_Type == Type::Menu || m_Type == Type::GoBack;
}

void MenuNode::select() const
{
    if (m_OnSelect) {
        m_OnSelect();
    }
}

MenuNode* MenuNode::addChild(std::unique_ptr<MenuNode> child)
{
    if (m_Type != Type::Menu) {
        throw std::invalid_argument("MenuNode: only menu entries can own children");
    }
    if (!child) {
        throw std::invalid_argument("MenuNode: null child");
    }

    m_Children.push_back(std::move(child));
    return m_Children.back().get();
}

MenuNode* MenuNode::addSubmenu(const QString& label, Flags flags)
{
    return addChild(createMenu(label, flags));
}

MenuNode* MenuNode::addAction(const QString& label, Callback onSelect)
{
    return addAction(QImage(), Qt::white, label, std::move(onSelect));
}

MenuNode* MenuNode::addAction(const QImage& icon, const QColor& color, const QString& label,
                              Callback onSelect, Flags flags)
{
    MenuNode* node = addChild(createAction(label, std::move(onSelect), flags));
    node->setIcon(icon);
    node->setColor(color);
    return node;
}

MenuNode* MenuNode::addSeparator()
{
    return addChild(createSeparator());
}

const MenuNode* MenuNode::childAt(int index) const
{
    if (index < 0 || index >= (int)m_Children.size()) return nullptr;
    return m_Children[index].get();
}

const char* MenuNode::typeName(Type type)
{
    switch (type) {
    case Type::Menu:      return "Menu";
    case Type::Action:    return "Action";
    case Type::Separator: return "Separator";
    case Type::GoBack:    return "GoBack";
    }
    return "Unknown";
}
