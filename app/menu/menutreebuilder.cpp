#include "menutreebuilder.h"

#include <stdexcept>

using namespace DropMenu;

MenuTreeBuilder::MenuTreeBuilder(const QString& title)
    : m_Root(MenuNode::createMenu(title)),
      m_Current(nullptr)
{
    m_Current = m_Root.get();
}

MenuNode* MenuTreeBuilder::requireCurrent() const
{
    if (m_Current == nullptr) {
        throw std::logic_error("MenuTreeBuilder: tree was already taken");
    }
    return m_Current;
}

MenuNode* MenuTreeBuilder::pushSubmenu(const QString& label, MenuNode::Flags flags)
{
    MenuNode* parent = requireCurrent();
    m_Stack.push_back(parent);
    m_Current = parent->addSubmenu(label, flags);
    return m_Current;
}

void MenuTreeBuilder::popMenu()
{
    if (m_Stack.empty()) return;

    m_Current = m_Stack.back();
    m_Stack.pop_back();
}

MenuNode* MenuTreeBuilder::addSeparator()
{
    return requireCurrent()->addSeparator();
}

MenuNode* MenuTreeBuilder::addAction(const QString& label, MenuNode::Callback onSelect, bool selected)
{
    return requireCurrent()->addAction(QImage(), Qt::white, label, std::move(onSelect),
                                       selected ? MenuNode::Selected : MenuNode::NoFlags);
}

MenuNode* MenuTreeBuilder::addAction(const QColor& color, const QString& label, MenuNode::Callback onSelect)
{
    return requireCurrent()->addAction(QImage(), color, label, std::move(onSelect), MenuNode::Colored);
}

MenuNode* MenuTreeBuilder::addAction(const QImage& icon, const QString& label, MenuNode::Callback onSelect)
{
    return requireCurrent()->addAction(icon, Qt::white, label, std::move(onSelect));
}

MenuNode* MenuTreeBuilder::addAction(const QImage& icon, const QColor& color, const QString& label,
                                     MenuNode::Callback onSelect, MenuNode::Flags flags)
{
    return requireCurrent()->addAction(icon, color, label, std::move(onSelect),
                                       flags | MenuNode::Colored);
}

MenuNode* MenuTreeBuilder::addAction(bool selected, const QImage& icon, const QString& label,
                                     MenuNode::Callback onSelect)
{
    return requireCurrent()->addAction(icon, Qt::white, label, std::move(onSelect),
                                       selected ? MenuNode::Selected : MenuNode::NoFlags);
}

MenuNode* MenuTreeBuilder::addAction(bool selected, const QImage& icon, const QColor& color,
                                     const QString& label, MenuNode::Callback onSelect)
{
    MenuNode::Flags flags = MenuNode::Colored;
    if (selected) flags |= MenuNode::Selected;
    return requireCurrent()->addAction(icon, color, label, std::move(onSelect), flags);
}

MenuNode* MenuTreeBuilder::addShortcutAction(const QString& label, const QString& shortcut,
                                             MenuNode::Callback onSelect)
{
    MenuNode* node = requireCurrent()->addAction(label, std::move(onSelect));
    node->setShortcutText(shortcut);
    return node;
}

MenuNode* MenuTreeBuilder::addGoBack(const QString& label, MenuNode::Callback onSelect)
{
    return requireCurrent()->addChild(MenuNode::createGoBack(label, std::move(onSelect)));
}

std::unique_ptr<MenuNode> MenuTreeBuilder::takeRoot()
{
    m_Stack.clear();
    m_Current = nullptr;
    return std::move(m_Root);
}
