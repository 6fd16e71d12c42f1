#pragma once

#include "menuhost.h"
#include "menunode.h"

#include <QMarginsF>
#include <QPointF>

#include <stdexcept>

class QSettings;

namespace DropMenu {

// Raised for integration bugs: missing assets, out-of-range settings
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

enum class CloseMethod {
    PointerDown,    // close as soon as the pointer goes down outside the menus
    Click,          // wait for a full click
};

/**
 * MenuStyle - layout constants, colors, fonts and sprites for menus.
 *
 * Read-only for the engine. Start from defaults(), tweak fields or load
 * overrides from a settings file, then validate().
 */
struct MenuStyle
{
    // Modal surface
    QColor      modalScrimColor;
    bool        modalScrimVisible;
    CloseMethod closeMethod;

    // Panel
    QColor      panelColor;
    QMarginsF   outerPadding;
    QPointF     shadowOffset;
    QColor      shadowColor;

    // Titles
    bool        showTitles;
    QMarginsF   titlePadding;
    QFont       titleFont;
    QColor      titleFontColor;

    // Entries
    QColor      unselectedColor;
    QColor      selectedColor;
    QColor      highlightTint;
    QColor      pressedTint;
    QColor      disabledTint;
    QFont       entryFont;
    QColor      entryFontColor;
    QFont       shortcutFont;
    QColor      shortcutFontColor;
    QMarginsF   entryPadding;
    qreal       minEntryHeight;
    qreal       minEntryWidth;
    qreal       iconTextPadding;
    qreal       textArrowPadding;
    qreal       textShortcutPadding;
    qreal       childrenSpacing;
    QImage      submenuArrow;
    TextAlignment defaultTextAlignment;

    // Separators
    qreal       separatorThickness;
    QColor      separatorColor;
    QMarginsF   separatorPadding;
    qreal       minSeparatorWidth;

    // Scrolling
    qreal       scrollbarWidth;
    qreal       scrollSensitivity;
    QColor      scrollbarColor;
    QColor      scrollThumbColor;

    // Go back entries injected at the top of submenus
    bool        useGoBack;
    QImage      goBackIcon;
    QString     goBackMessage;

    static MenuStyle defaults();

    // Throws ConfigurationError
    void validate() const;

    // Reads the optional [dropmenu] group. Unknown keys are ignored.
    void loadOverrides(QSettings& settings);

    // Default resolves through defaultTextAlignment unless allowDefault is false
    Qt::Alignment alignmentFor(TextAlignment alignment, bool allowDefault = true) const;

    // Per-state colors for an entry plate: each tint multiplied by the base color
    ControlColors controlColorsFor(const QColor& base) const;

    // Unselected, Selected overrides it, Colored overrides both
    QColor entryColorFor(const MenuNode& node) const;
};

}
