#pragma once

#include <QGuiApplication>
#include <QtGlobal>

// Fonts and images need a GUI application; tests never open a display
inline QGuiApplication* ensureGuiApplication()
{
    if (QGuiApplication* existing = qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        return existing;
    }

    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    static int argc = 1;
    static char name[] = "dropmenu-test";
    static char* argv[] = { name, nullptr };
    static QGuiApplication app(argc, argv);
    return &app;
}

#include "menu/menustyle.h"

// Round numbers so expected geometry can be worked out by hand
inline DropMenu::MenuStyle testStyle()
{
    DropMenu::MenuStyle style = DropMenu::MenuStyle::defaults();
    style.outerPadding        = QMarginsF(4, 4, 4, 4);
    style.entryPadding        = QMarginsF(10, 3, 10, 3);
    style.titlePadding        = QMarginsF(5, 2, 5, 2);
    style.separatorPadding    = QMarginsF(0, 2, 0, 2);
    style.separatorThickness  = 1;
    style.minEntryHeight      = 14;
    style.minEntryWidth       = 0;
    style.minSeparatorWidth   = 0;
    style.iconTextPadding     = 5;
    style.textArrowPadding    = 8;
    style.textShortcutPadding = 12;
    style.childrenSpacing     = 0;
    style.shadowOffset        = QPointF(2, 3);
    style.scrollbarWidth      = 10;
    style.scrollSensitivity   = 20;
    style.showTitles          = false;
    style.useGoBack           = false;
    return style;
}
