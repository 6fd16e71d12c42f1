#pragma once

#include "menunode.h"

namespace DropMenu {

/**
 * MenuTreeBuilder - builds a MenuNode tree without manual parent/child wiring.
 *
 *   MenuTreeBuilder b("File");
 *   b.addAction("New", onNew);
 *   b.pushSubmenu("Recent");
 *       b.addAction("a.txt", openA);
 *   b.popMenu();
 *   b.addSeparator();
 *   b.addAction("Quit", onQuit);
 *   std::unique_ptr<MenuNode> root = b.takeRoot();
 */
class MenuTreeBuilder
{
public:
    explicit MenuTreeBuilder(const QString& title = QString());

    // Add a submenu to the current menu and make it current
    MenuNode* pushSubmenu(const QString& label, MenuNode::Flags flags = MenuNode::NoFlags);

    // Return to the menu that was current before the last pushSubmenu(). The root is never popped.
    void popMenu();

    MenuNode* addSeparator();
    MenuNode* addAction(const QString& label, MenuNode::Callback onSelect, bool selected = false);
    MenuNode* addAction(const QColor& color, const QString& label, MenuNode::Callback onSelect);
    MenuNode* addAction(const QImage& icon, const QString& label, MenuNode::Callback onSelect);
    MenuNode* addAction(const QImage& icon, const QColor& color, const QString& label,
                        MenuNode::Callback onSelect, MenuNode::Flags flags = MenuNode::NoFlags);
    MenuNode* addAction(bool selected, const QImage& icon, const QString& label,
                        MenuNode::Callback onSelect);
    MenuNode* addAction(bool selected, const QImage& icon, const QColor& color,
                        const QString& label, MenuNode::Callback onSelect);
    MenuNode* addShortcutAction(const QString& label, const QString& shortcut,
                                MenuNode::Callback onSelect);
    MenuNode* addGoBack(const QString& label, MenuNode::Callback onSelect);

    MenuNode* root() const { return m_Root.get(); }
    MenuNode* current() const { return m_Current; }
    int depth() const { return (int)m_Stack.size(); }

    // Hands the tree over to the caller; the builder is empty afterwards
    std::unique_ptr<MenuNode> takeRoot();

private:
    MenuNode* requireCurrent() const;

    std::unique_ptr<MenuNode> m_Root;
    std::vector<MenuNode*>    m_Stack;
    MenuNode*                 m_Current;
};

}
