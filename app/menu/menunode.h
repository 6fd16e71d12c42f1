#pragma once

#include <QColor>
#include <QFlags>
#include <QImage>
#include <QString>

#include <functional>
#include <memory>
#include <vector>

namespace DropMenu {

enum class TextAlignment {
    Left,
    Middle,
    Right,
    Default     // resolved through MenuStyle::defaultTextAlignment
};

/**
 * MenuNode - one entry of a logical menu tree.
 *
 * A Menu node exclusively owns its children. Trees are built once by the
 * caller (directly or through MenuTreeBuilder) and are only read by menu
 * sessions, so the same tree can be opened any number of times. Sessions
 * refer to nodes by address.
 */
class MenuNode
{
public:
    enum class Type {
        Menu,       // opens a cascading submenu
        Action,     // dispatch callback + close the session
        Separator,
        GoBack,     // retract the cascade
    };

    enum Flag {
        NoFlags                = 0,
        Selected               = 1 << 1,
        Disabled               = 1 << 2,
        Colored                = 1 << 3,
        // Scroll-mode submenus with a single selected child scroll to it
        CenterScrollOnSelected = 1 << 4,
    };
    Q_DECLARE_FLAGS(Flags, Flag)

    using Callback = std::function<void()>;

    static std::unique_ptr<MenuNode> createMenu(const QString& label, Flags flags = NoFlags);
    static std::unique_ptr<MenuNode> createAction(const QString& label, Callback onSelect,
                                                  Flags flags = NoFlags);
    static std::unique_ptr<MenuNode> createSeparator();
    static std::unique_ptr<MenuNode> createGoBack(const QString& label, Callback onSelect);

    // Action and GoBack nodes require a callback, other kinds must not carry one
    MenuNode(Type type, const QString& label, Callback onSelect = Callback(),
             Flags flags = NoFlags);
    ~MenuNode();

    MenuNode(const MenuNode&) = delete;
    MenuNode& operator=(const MenuNode&) = delete;

    Type type() const { return m_Type; }
    bool isInteractive() const;

    const QString& label() const { return m_Label; }
    void setLabel(const QString& label) { m_Label = label; }

    const QImage& icon() const { return m_Icon; }
    void setIcon(const QImage& icon) { m_Icon = icon; }

    const QString& shortcutText() const { return m_ShortcutText; }
    void setShortcutText(const QString& text) { m_ShortcutText = text; }

    const QColor& color() const { return m_Color; }
    void setColor(const QColor& color) { m_Color = color; }

    TextAlignment alignment() const { return m_Alignment; }
    void setAlignment(TextAlignment alignment) { m_Alignment = alignment; }

    Flags flags() const { return m_Flags; }
    bool hasFlag(Flag flag) const { return m_Flags.testFlag(flag); }
    void setFlags(Flags flags) { m_Flags = flags; }

    bool hasCallback() const { return static_cast<bool>(m_OnSelect); }
    void select() const;

    // Children, Menu nodes only
    MenuNode* addChild(std::unique_ptr<MenuNode> child);
    MenuNode* addSubmenu(const QString& label, Flags flags = NoFlags);
    MenuNode* addAction(const QString& label, Callback onSelect);
    MenuNode* addAction(const QImage& icon, const QColor& color, const QString& label,
                        Callback onSelect, Flags flags = NoFlags);
    MenuNode* addSeparator();

    int childCount() const { return (int)m_Children.size(); }
    const MenuNode* childAt(int index) const;
    const std::vector<std::unique_ptr<MenuNode>>& children() const { return m_Children; }

    static const char* typeName(Type type);

private:
    Type          m_Type;
    QString       m_Label;
    Callback      m_OnSelect;
    QImage        m_Icon;
    QString       m_ShortcutText;
    QColor        m_Color;
    TextAlignment m_Alignment;
    Flags         m_Flags;
    std::vector<std::unique_ptr<MenuNode>> m_Children;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(MenuNode::Flags)

}
