#include "testsupport.h"

#include "menu/menunode.h"
#include "menu/menustyle.h"
#include "menu/menutreebuilder.h"

#include <QSettings>
#include <QTemporaryDir>

#include <stdexcept>

using namespace DropMenu;

static bool roughlyEqual(qreal a, qreal b)
{
    return qAbs(a - b) <= 1.0;
}

static bool TestNodeInvariants()
{
    bool threw = false;
    try {
        MenuNode node(MenuNode::Type::Action, QStringLiteral("No callback"));
    }
    catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        return false;
    }

    threw = false;
    try {
        MenuNode node(MenuNode::Type::Separator, QString(), [] {});
    }
    catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        return false;
    }

    std::unique_ptr<MenuNode> action = MenuNode::createAction(QStringLiteral("Leaf"), [] {});
    threw = false;
    try {
        action->addSeparator();
    }
    catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        return false;
    }

    std::unique_ptr<MenuNode> menu = MenuNode::createMenu(QStringLiteral("Empty"));
    return menu->childCount() == 0 &&
           menu->childAt(0) == nullptr &&
           menu->isInteractive() &&
           !MenuNode::createSeparator()->isInteractive() &&
           QString::fromLatin1(MenuNode::typeName(MenuNode::Type::GoBack)) == QLatin1String("GoBack");
}

static bool TestSelectRunsCallback()
{
    int calls = 0;
    std::unique_ptr<MenuNode> action = MenuNode::createAction(QStringLiteral("Run"), [&calls] { calls++; });
    action->select();
    action->select();

    // Menus have nothing to run
    MenuNode::createMenu(QStringLiteral("Menu"))->select();

    return calls == 2 && action->hasCallback();
}

static bool TestBuilderNesting()
{
    MenuTreeBuilder builder(QStringLiteral("Root"));
    builder.addAction(QStringLiteral("New"), [] {});
    MenuNode* recent = builder.pushSubmenu(QStringLiteral("Recent"));
    if (builder.depth() != 1 || builder.current() != recent) {
        return false;
    }
    builder.addAction(QStringLiteral("a.txt"), [] {});
    builder.addAction(QStringLiteral("b.txt"), [] {});
    builder.popMenu();
    builder.popMenu();   // root stays current
    builder.addSeparator();
    builder.addGoBack(QStringLiteral("Back"), [] {});

    MenuNode* root = builder.root();
    if (builder.current() != root || root->childCount() != 4) {
        return false;
    }
    if (root->childAt(1)->type() != MenuNode::Type::Menu || root->childAt(1)->childCount() != 2) {
        return false;
    }
    if (root->childAt(2)->type() != MenuNode::Type::Separator ||
            root->childAt(3)->type() != MenuNode::Type::GoBack) {
        return false;
    }

    std::unique_ptr<MenuNode> taken = builder.takeRoot();
    if (taken.get() != root || builder.root() != nullptr) {
        return false;
    }

    bool threw = false;
    try {
        builder.addAction(QStringLiteral("Late"), [] {});
    }
    catch (const std::logic_error&) {
        threw = true;
    }
    return threw;
}

static bool TestBuilderFlags()
{
    QImage icon(8, 8, QImage::Format_ARGB32);
    icon.fill(Qt::red);

    MenuTreeBuilder builder(QStringLiteral("Root"));
    MenuNode* colored = builder.addAction(QColor(Qt::red), QStringLiteral("Red"), [] {});
    MenuNode* selected = builder.addAction(QStringLiteral("Current"), [] {}, true);
    MenuNode* both = builder.addAction(true, icon, QColor(Qt::green), QStringLiteral("Both"), [] {});
    MenuNode* withIcon = builder.addAction(icon, QStringLiteral("Icon"), [] {});
    MenuNode* shortcut = builder.addShortcutAction(QStringLiteral("Quit"), QStringLiteral("Ctrl+Q"), [] {});
    MenuNode* disabled = builder.addAction(icon, QColor(Qt::blue), QStringLiteral("Off"), [] {},
                                           MenuNode::Disabled);

    return colored->hasFlag(MenuNode::Colored) && colored->color() == QColor(Qt::red) &&
           selected->hasFlag(MenuNode::Selected) && !selected->hasFlag(MenuNode::Colored) &&
           both->hasFlag(MenuNode::Selected) && both->hasFlag(MenuNode::Colored) &&
           withIcon->icon().width() == 8 && !withIcon->hasFlag(MenuNode::Colored) &&
           shortcut->shortcutText() == QLatin1String("Ctrl+Q") &&
           disabled->hasFlag(MenuNode::Disabled) && disabled->hasFlag(MenuNode::Colored);
}

static bool TestEntryColors()
{
    MenuStyle style = testStyle();
    style.unselectedColor = QColor(10, 10, 10);
    style.selectedColor = QColor(20, 20, 20);

    std::unique_ptr<MenuNode> plain = MenuNode::createAction(QStringLiteral("a"), [] {});
    std::unique_ptr<MenuNode> selected = MenuNode::createAction(QStringLiteral("b"), [] {}, MenuNode::Selected);
    std::unique_ptr<MenuNode> colored = MenuNode::createAction(QStringLiteral("c"), [] {},
                                                               MenuNode::Selected | MenuNode::Colored);
    colored->setColor(QColor(30, 40, 50));

    if (style.entryColorFor(*plain) != style.unselectedColor ||
            style.entryColorFor(*selected) != style.selectedColor ||
            style.entryColorFor(*colored) != QColor(30, 40, 50)) {
        return false;
    }

    style.highlightTint = QColor(128, 128, 128, 255);
    style.pressedTint = QColor(0, 0, 0, 128);
    style.disabledTint = QColor(0, 0, 0, 0);
    ControlColors colors = style.controlColorsFor(QColor(200, 100, 50));

    if (colors.normal != QColor(200, 100, 50) ||
            !roughlyEqual(colors.highlighted.red(), 128) || !roughlyEqual(colors.highlighted.blue(), 128) ||
            !roughlyEqual(colors.pressed.red(), 100) || !roughlyEqual(colors.pressed.alpha(), 255) ||
            !roughlyEqual(colors.disabled.red(), 200) || !roughlyEqual(colors.disabled.alpha(), 255)) {
        return false;
    }

    // Tints still show on a transparent plate
    style.highlightTint = QColor(255, 255, 255, 20);
    colors = style.controlColorsFor(QColor(255, 255, 255, 0));

    return colors.normal.alpha() == 0 &&
           roughlyEqual(colors.highlighted.alpha(), 20) && roughlyEqual(colors.highlighted.red(), 255);
}

static bool TestAlignmentLookup()
{
    MenuStyle style = testStyle();
    style.defaultTextAlignment = TextAlignment::Right;

    return style.alignmentFor(TextAlignment::Middle) == (Qt::AlignHCenter | Qt::AlignVCenter) &&
           style.alignmentFor(TextAlignment::Left) == (Qt::AlignLeft | Qt::AlignVCenter) &&
           style.alignmentFor(TextAlignment::Default) == (Qt::AlignRight | Qt::AlignVCenter);
}

static bool TestStyleValidation()
{
    MenuStyle style = MenuStyle::defaults();
    style.validate();

    if (style.submenuArrow.isNull()) {
        return false;
    }

    style.closeMethod = static_cast<CloseMethod>(9);
    bool threw = false;
    try {
        style.validate();
    }
    catch (const ConfigurationError&) {
        threw = true;
    }
    if (!threw) {
        return false;
    }

    style = MenuStyle::defaults();
    style.scrollbarWidth = 0;
    threw = false;
    try {
        style.validate();
    }
    catch (const ConfigurationError&) {
        threw = true;
    }
    return threw;
}

static bool TestSettingsOverrides()
{
    QTemporaryDir dir;
    if (!dir.isValid()) {
        return false;
    }
    QString path = dir.filePath(QStringLiteral("menu.ini"));

    {
        QSettings out(path, QSettings::IniFormat);
        out.setValue(QStringLiteral("dropmenu/minEntryWidth"), 200);
        out.setValue(QStringLiteral("dropmenu/panelColor"), QStringLiteral("#102030"));
        out.setValue(QStringLiteral("dropmenu/useGoBack"), true);
        out.setValue(QStringLiteral("dropmenu/closeMethod"), QStringLiteral("click"));
        out.setValue(QStringLiteral("dropmenu/entryPadding"), QStringLiteral("1,2,3,4"));
        out.setValue(QStringLiteral("dropmenu/goBackMessage"), QStringLiteral("Up"));
        out.setValue(QStringLiteral("dropmenu/scrollbarWidth"), QStringLiteral("not a number"));
        out.sync();
    }

    MenuStyle style = MenuStyle::defaults();
    qreal scrollbarWidth = style.scrollbarWidth;

    QSettings in(path, QSettings::IniFormat);
    style.loadOverrides(in);
    style.validate();

    if (style.minEntryWidth != 200 ||
            style.panelColor != QColor(0x10, 0x20, 0x30) ||
            !style.useGoBack ||
            style.closeMethod != CloseMethod::Click ||
            style.entryPadding != QMarginsF(1, 2, 3, 4) ||
            style.goBackMessage != QLatin1String("Up") ||
            style.scrollbarWidth != scrollbarWidth) {
        return false;
    }

    {
        QSettings out(path, QSettings::IniFormat);
        out.setValue(QStringLiteral("dropmenu/closeMethod"), QStringLiteral("sideways"));
        out.sync();
    }

    QSettings bad(path, QSettings::IniFormat);
    bool threw = false;
    try {
        style.loadOverrides(bad);
    }
    catch (const ConfigurationError&) {
        threw = true;
    }
    return threw && bad.group().isEmpty();
}

int main()
{
    ensureGuiApplication();

    if (!TestNodeInvariants()) {
        return 1;
    }

    if (!TestSelectRunsCallback()) {
        return 2;
    }

    if (!TestBuilderNesting()) {
        return 3;
    }

    if (!TestBuilderFlags()) {
        return 4;
    }

    if (!TestEntryColors()) {
        return 5;
    }

    if (!TestAlignmentLookup()) {
        return 6;
    }

    if (!TestStyleValidation()) {
        return 7;
    }

    if (!TestSettingsOverrides()) {
        return 8;
    }

    return 0;
}
