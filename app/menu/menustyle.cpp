#include "menustyle.h"

#include <QSettings>
#include <QStringList>
#include <QVector>

#include <SDL.h>

using namespace DropMenu;

static const char* k_SettingsGroup = "dropmenu";

// Solid right-pointing triangle used as the submenu indicator
static QImage createArrowImage(int width, int height, const QColor& color)
{
    QImage image(width, height, QImage::Format_ARGB32);
    image.fill(Qt::transparent);

    qreal half = (height - 1) / 2.0;
    for (int y = 0; y < height; y++) {
        // Distance from the vertical center narrows the row
        qreal rowWidth = width * (1.0 - qAbs(y - half) / (half + 1));
        for (int x = 0; x < qRound(rowWidth); x++) {
            image.setPixelColor(x, y, color);
        }
    }

    return image;
}

// Paints tint over base (source-over)
static QColor overlay(const QColor& base, const QColor& tint)
{
    qreal ta = tint.alphaF();
    qreal ba = base.alphaF() * (1.0 - ta);
    qreal a = ta + ba;
    if (a <= 0)
        return QColor(0, 0, 0, 0);

    return QColor::fromRgbF((tint.redF() * ta + base.redF() * ba) / a,
                            (tint.greenF() * ta + base.greenF() * ba) / a,
                            (tint.blueF() * ta + base.blueF() * ba) / a,
                            a);
}

MenuStyle MenuStyle::defaults()
{
    MenuStyle style;

    style.modalScrimColor   = QColor(0, 0, 0, 0);
    style.modalScrimVisible = false;
    style.closeMethod       = CloseMethod::PointerDown;

    // Dark context menu look
    style.panelColor   = QColor(44, 44, 44, 242);
    style.outerPadding = QMarginsF(4, 4, 4, 4);
    style.shadowOffset = QPointF(3, 4);
    style.shadowColor  = QColor(0, 0, 0, 60);

    style.showTitles     = false;
    style.titlePadding   = QMarginsF(12, 6, 12, 6);
    style.titleFont      = QFont(QStringLiteral("Sans Serif"), 8);
    style.titleFont.setWeight(QFont::DemiBold);
    style.titleFontColor = QColor(255, 255, 255, 140);

    // Plain plates stay invisible until hovered
    style.unselectedColor   = QColor(255, 255, 255, 0);
    style.selectedColor     = QColor(110, 192, 232, 70);
    style.highlightTint     = QColor(255, 255, 255, 20);
    style.pressedTint       = QColor(255, 255, 255, 40);
    style.disabledTint      = QColor(0, 0, 0, 0);
    style.entryFont         = QFont(QStringLiteral("Sans Serif"), 9);
    style.entryFontColor    = QColor(255, 255, 255, 230);
    style.shortcutFont      = QFont(QStringLiteral("Sans Serif"), 8);
    style.shortcutFontColor = QColor(255, 255, 255, 100);
    style.entryPadding      = QMarginsF(12, 4, 12, 4);
    style.minEntryHeight    = 22;
    style.minEntryWidth     = 160;
    style.iconTextPadding   = 8;
    style.textArrowPadding  = 16;
    style.textShortcutPadding = 24;
    style.childrenSpacing   = 0;
    style.submenuArrow      = createArrowImage(5, 9, QColor(255, 255, 255, 100));
    style.defaultTextAlignment = TextAlignment::Left;

    style.separatorThickness = 1;
    style.separatorColor     = QColor(255, 255, 255, 18);
    style.separatorPadding   = QMarginsF(12, 4, 12, 4);
    style.minSeparatorWidth  = 40;

    style.scrollbarWidth    = 8;
    style.scrollSensitivity = 24;
    style.scrollbarColor    = QColor(255, 255, 255, 10);
    style.scrollThumbColor  = QColor(255, 255, 255, 90);

    style.useGoBack     = false;
    style.goBackMessage = QStringLiteral("Back");

    return style;
}

void MenuStyle::validate() const
{
    switch (closeMethod) {
    case CloseMethod::PointerDown:
    case CloseMethod::Click:
        break;
    default:
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Unsupported menu close method: %d",
                     (int)closeMethod);
        throw ConfigurationError(QStringLiteral("unsupported close method %1").arg((int)closeMethod));
    }

    if (scrollbarWidth <= 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Menu scrollbar width must be positive (%f)",
                     scrollbarWidth);
        throw ConfigurationError(QStringLiteral("scrollbar width must be positive"));
    }
}

// ---------------------------------------------------------------------------
// Settings overrides
// ---------------------------------------------------------------------------

static void readReal(QSettings& settings, const QString& key, qreal& out)
{
    if (!settings.contains(key))
        return;

    bool ok = false;
    qreal value = settings.value(key).toReal(&ok);
    if (ok) {
        out = value;
    }
    else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Ignoring non-numeric menu setting '%s'",
                    qPrintable(key));
    }
}

static void readBool(QSettings& settings, const QString& key, bool& out)
{
    if (settings.contains(key))
        out = settings.value(key).toBool();
}

static void readColor(QSettings& settings, const QString& key, QColor& out)
{
    if (!settings.contains(key))
        return;

    QColor color(settings.value(key).toString());
    if (color.isValid()) {
        out = color;
    }
    else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Ignoring invalid menu color '%s' = '%s'",
                    qPrintable(key), qPrintable(settings.value(key).toString()));
    }
}

// "left, top, right, bottom" or a single value for all four sides
static void readMargins(QSettings& settings, const QString& key, QMarginsF& out)
{
    if (!settings.contains(key))
        return;

    // INI values containing commas come back as string lists
    QStringList parts = settings.value(key).toStringList().join(',').split(',');
    QVector<qreal> values;
    for (const QString& part : parts) {
        bool ok = false;
        qreal v = part.trimmed().toDouble(&ok);
        if (!ok) {
            values.clear();
            break;
        }
        values.append(v);
    }

    if (values.size() == 1) {
        out = QMarginsF(values[0], values[0], values[0], values[0]);
    }
    else if (values.size() == 4) {
        out = QMarginsF(values[0], values[1], values[2], values[3]);
    }
    else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Ignoring malformed menu margins '%s'",
                    qPrintable(key));
    }
}

void MenuStyle::loadOverrides(QSettings& settings)
{
    settings.beginGroup(QString::fromLatin1(k_SettingsGroup));

    readColor(settings, QStringLiteral("modalScrimColor"), modalScrimColor);
    readBool(settings, QStringLiteral("modalScrimVisible"), modalScrimVisible);

    if (settings.contains(QStringLiteral("closeMethod"))) {
        QString method = settings.value(QStringLiteral("closeMethod")).toString().toLower();
        if (method == QLatin1String("pointerdown")) {
            closeMethod = CloseMethod::PointerDown;
        }
        else if (method == QLatin1String("click")) {
            closeMethod = CloseMethod::Click;
        }
        else {
            settings.endGroup();
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Unsupported menu close method '%s'",
                         qPrintable(method));
            throw ConfigurationError(QStringLiteral("unsupported close method '%1'").arg(method));
        }
    }

    readColor(settings, QStringLiteral("panelColor"), panelColor);
    readMargins(settings, QStringLiteral("outerPadding"), outerPadding);
    readColor(settings, QStringLiteral("shadowColor"), shadowColor);

    readBool(settings, QStringLiteral("showTitles"), showTitles);
    readMargins(settings, QStringLiteral("titlePadding"), titlePadding);
    readColor(settings, QStringLiteral("titleFontColor"), titleFontColor);

    readColor(settings, QStringLiteral("unselectedColor"), unselectedColor);
    readColor(settings, QStringLiteral("selectedColor"), selectedColor);
    readColor(settings, QStringLiteral("entryFontColor"), entryFontColor);
    readColor(settings, QStringLiteral("shortcutFontColor"), shortcutFontColor);
    readMargins(settings, QStringLiteral("entryPadding"), entryPadding);
    readReal(settings, QStringLiteral("minEntryHeight"), minEntryHeight);
    readReal(settings, QStringLiteral("minEntryWidth"), minEntryWidth);
    readReal(settings, QStringLiteral("iconTextPadding"), iconTextPadding);
    readReal(settings, QStringLiteral("textArrowPadding"), textArrowPadding);
    readReal(settings, QStringLiteral("textShortcutPadding"), textShortcutPadding);
    readReal(settings, QStringLiteral("childrenSpacing"), childrenSpacing);

    readReal(settings, QStringLiteral("separatorThickness"), separatorThickness);
    readColor(settings, QStringLiteral("separatorColor"), separatorColor);
    readMargins(settings, QStringLiteral("separatorPadding"), separatorPadding);
    readReal(settings, QStringLiteral("minSeparatorWidth"), minSeparatorWidth);

    readReal(settings, QStringLiteral("scrollbarWidth"), scrollbarWidth);
    readReal(settings, QStringLiteral("scrollSensitivity"), scrollSensitivity);

    readBool(settings, QStringLiteral("useGoBack"), useGoBack);
    if (settings.contains(QStringLiteral("goBackMessage")))
        goBackMessage = settings.value(QStringLiteral("goBackMessage")).toString();

    settings.endGroup();
}

// ---------------------------------------------------------------------------
// Lookups
// ---------------------------------------------------------------------------

Qt::Alignment MenuStyle::alignmentFor(TextAlignment alignment, bool allowDefault) const
{
    switch (alignment) {
    case TextAlignment::Left:
        return Qt::AlignLeft | Qt::AlignVCenter;
    case TextAlignment::Middle:
        return Qt::AlignHCenter | Qt::AlignVCenter;
    case TextAlignment::Right:
        return Qt::AlignRight | Qt::AlignVCenter;
    case TextAlignment::Default:
        if (allowDefault)
            return alignmentFor(defaultTextAlignment, false);
        break;
    }

    // Default configured as the default
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "Menu default text alignment is unresolved, using left");
    return Qt::AlignLeft | Qt::AlignVCenter;
}

ControlColors MenuStyle::controlColorsFor(const QColor& base) const
{
    ControlColors colors;
    colors.normal      = base;
    colors.highlighted = overlay(base, highlightTint);
    colors.pressed     = overlay(base, pressedTint);
    colors.disabled    = overlay(base, disabledTint);
    return colors;
}

QColor MenuStyle::entryColorFor(const MenuNode& node) const
{
    QColor color = unselectedColor;
    if (node.hasFlag(MenuNode::Selected))
        color = selectedColor;
    if (node.hasFlag(MenuNode::Colored))
        color = node.color();
    return color;
}
