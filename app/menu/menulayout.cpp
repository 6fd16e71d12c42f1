#include "menulayout.h"
#include "placementengine.h"

#include <SDL.h>

#include <cmath>

using namespace DropMenu;

MenuLayoutBuilder::MenuLayoutBuilder(IMenuHost* host, const MenuStyle& style)
    : m_Host(host),
      m_Style(style)
{
}

// ---------------------------------------------------------------------------
// Columns
// ---------------------------------------------------------------------------

ColumnLayout MenuLayoutBuilder::computeColumns(const std::vector<EntryMetrics>& metrics,
                                               const MenuStyle& style, qreal titleWidth)
{
    ColumnLayout columns;

    qreal maxLabel = 0;
    for (const EntryMetrics& m : metrics) {
        columns.iconWidth     = qMax(columns.iconWidth, m.iconWidth);
        maxLabel              = qMax(maxLabel, m.labelWidth);
        columns.shortcutWidth = qMax(columns.shortcutWidth, std::ceil(m.shortcutWidth));
        columns.arrowWidth    = qMax(columns.arrowWidth, m.arrowWidth);
    }

    // One extra pixel keeps the longest label from wrapping or eliding
    columns.labelWidth = metrics.empty() ? 0 : std::ceil(maxLabel) + 1;

    columns.iconX = style.entryPadding.left();
    columns.labelX = columns.iconX + columns.iconWidth;
    if (columns.iconWidth > 0)
        columns.labelX += style.iconTextPadding;

    columns.shortcutX = columns.labelX + columns.labelWidth;
    if (columns.shortcutWidth > 0)
        columns.shortcutX += style.textShortcutPadding;

    columns.arrowX = columns.shortcutX + columns.shortcutWidth;
    if (columns.arrowWidth > 0)
        columns.arrowX += style.textArrowPadding;

    qreal natural = columns.arrowX + columns.arrowWidth + style.entryPadding.right();
    qreal width = natural;
    width = qMax(width, style.minEntryWidth);
    width = qMax(width, style.minSeparatorWidth +
                        style.separatorPadding.left() + style.separatorPadding.right());
    width = qMax(width, titleWidth);
    columns.entryWidth = width;

    // Trailing columns stay flush with the right edge when the entry got wider
    if (width > natural) {
        columns.arrowX = width - style.entryPadding.right() - columns.arrowWidth;
        columns.shortcutX = columns.arrowX - columns.shortcutWidth;
        if (columns.arrowWidth > 0)
            columns.shortcutX -= style.textArrowPadding;
    }

    return columns;
}

// ---------------------------------------------------------------------------
// Panel construction
// ---------------------------------------------------------------------------

qreal MenuLayoutBuilder::entryHeight(const PanelEntry& entry) const
{
    if (entry.node->type() == MenuNode::Type::Separator) {
        return m_Style.separatorThickness +
               m_Style.separatorPadding.top() + m_Style.separatorPadding.bottom();
    }

    qreal h = m_Style.minEntryHeight;
    if (entry.label != InvalidWidget)
        h = qMax(h, m_Host->widgetGeometry(entry.label).height());
    if (entry.shortcut != InvalidWidget)
        h = qMax(h, m_Host->widgetGeometry(entry.shortcut).height());
    if (entry.icon != InvalidWidget)
        h = qMax(h, m_Host->widgetGeometry(entry.icon).height());
    if (entry.arrow != InvalidWidget)
        h = qMax(h, m_Host->widgetGeometry(entry.arrow).height());

    return h + m_Style.entryPadding.top() + m_Style.entryPadding.bottom();
}

void MenuLayoutBuilder::layoutEntry(PanelEntry& entry, const ColumnLayout& columns,
                                    qreal y, qreal height)
{
    qreal x = m_Style.outerPadding.left();
    entry.rect = QRectF(x, y, columns.entryWidth, height);

    if (entry.node->type() == MenuNode::Type::Separator) {
        m_Host->setWidgetGeometry(entry.plate,
                                  QRectF(x + m_Style.separatorPadding.left(),
                                         y + m_Style.separatorPadding.top(),
                                         columns.entryWidth - m_Style.separatorPadding.left()
                                                            - m_Style.separatorPadding.right(),
                                         m_Style.separatorThickness));
        return;
    }

    m_Host->setWidgetGeometry(entry.plate, entry.rect);

    qreal innerTop = m_Style.entryPadding.top();
    qreal innerH = height - m_Style.entryPadding.top() - m_Style.entryPadding.bottom();

    auto centered = [&](WidgetId widget, qreal left, qreal width) {
        QSizeF size = m_Host->widgetGeometry(widget).size();
        m_Host->setWidgetGeometry(widget, QRectF(left, innerTop + (innerH - size.height()) / 2,
                                                 width, size.height()));
    };

    if (entry.icon != InvalidWidget) {
        centered(entry.icon, columns.iconX, m_Host->widgetGeometry(entry.icon).width());
    }

    if (entry.label != InvalidWidget) {
        // Label spans up to the next column so alignment has room to act
        qreal end = columns.entryWidth - m_Style.entryPadding.right();
        if (columns.shortcutWidth > 0)
            end = columns.shortcutX - m_Style.textShortcutPadding;
        else if (columns.arrowWidth > 0)
            end = columns.arrowX - m_Style.textArrowPadding;
        centered(entry.label, columns.labelX, qMax(columns.labelWidth, end - columns.labelX));
    }

    if (entry.shortcut != InvalidWidget) {
        centered(entry.shortcut, columns.shortcutX, columns.shortcutWidth);
    }

    if (entry.arrow != InvalidWidget) {
        qreal w = m_Host->widgetGeometry(entry.arrow).width();
        centered(entry.arrow, columns.arrowX + columns.arrowWidth - w, w);
    }
}

std::unique_ptr<PanelRecord> MenuLayoutBuilder::build(WidgetId modalSurface, const MenuNode* menu,
                                                      PanelRecord* parent, bool showTitle,
                                                      bool addGoBack)
{
    auto panel = std::make_unique<PanelRecord>();
    panel->ownerNode = menu;
    panel->parent = parent;
    panel->depth = parent ? parent->depth + 1 : 0;

    // Validate assets before creating anything
    for (const auto& child : menu->children()) {
        if (child->type() == MenuNode::Type::Menu && m_Style.submenuArrow.isNull()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Menu '%s' has submenus but no submenu arrow image is configured",
                         qPrintable(menu->label()));
            throw ConfigurationError(QStringLiteral("submenu arrow image is missing"));
        }
    }

    std::vector<const MenuNode*> children;
    if (addGoBack) {
        panel->goBackNode = MenuNode::createGoBack(m_Style.goBackMessage, [] {});
        panel->goBackNode->setIcon(m_Style.goBackIcon);
        children.push_back(panel->goBackNode.get());
    }
    for (const auto& child : menu->children()) {
        children.push_back(child.get());
    }

    // Shadow first so it starts out behind the body
    panel->shadow = m_Host->createRect(modalSurface, WidgetRole::Shadow, m_Style.shadowColor);
    panel->body = m_Host->createRect(modalSurface, WidgetRole::Panel, m_Style.panelColor);

    qreal titleWidth = 0;
    qreal titleHeight = 0;
    if (showTitle && !menu->label().isEmpty()) {
        panel->title = m_Host->createLabel(panel->body, menu->label(), m_Style.titleFont,
                                           m_Style.titleFontColor,
                                           m_Style.alignmentFor(menu->alignment()));
        QSizeF size = m_Host->measureText(menu->label(), m_Style.titleFont);
        titleWidth = std::ceil(size.width()) + m_Style.titlePadding.left() + m_Style.titlePadding.right();
        titleHeight = size.height() + m_Style.titlePadding.top() + m_Style.titlePadding.bottom();
    }

    std::vector<EntryMetrics> metrics;

    for (const MenuNode* child : children) {
        PanelEntry entry;
        entry.node = child;

        switch (child->type()) {
        case MenuNode::Type::Separator:
            entry.plate = m_Host->createRect(panel->body, WidgetRole::Separator, m_Style.separatorColor);
            panel->entries.push_back(entry);
            continue;

        case MenuNode::Type::Action:
        case MenuNode::Type::Menu:
        case MenuNode::Type::GoBack:
            break;

        default:
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Skipping menu entry '%s' of unknown kind %d in '%s'",
                        qPrintable(child->label()), (int)child->type(),
                        qPrintable(menu->label()));
            continue;
        }

        EntryMetrics m;

        QColor base = m_Style.entryColorFor(*child);
        entry.plate = m_Host->createRect(panel->body, WidgetRole::Entry, base);
        m_Host->makeInteractive(entry.plate, m_Style.controlColorsFor(base),
                                !child->hasFlag(MenuNode::Disabled));

        entry.label = m_Host->createLabel(entry.plate, child->label(), m_Style.entryFont,
                                          m_Style.entryFontColor,
                                          m_Style.alignmentFor(child->alignment()));
        QSizeF labelSize = m_Host->measureText(child->label(), m_Style.entryFont);
        m_Host->setWidgetGeometry(entry.label, QRectF(QPointF(0, 0), labelSize));
        m.labelWidth = labelSize.width();

        if (!child->shortcutText().isEmpty()) {
            entry.shortcut = m_Host->createLabel(entry.plate, child->shortcutText(),
                                                 m_Style.shortcutFont, m_Style.shortcutFontColor,
                                                 Qt::AlignRight | Qt::AlignVCenter);
            QSizeF size = m_Host->measureText(child->shortcutText(), m_Style.shortcutFont);
            m_Host->setWidgetGeometry(entry.shortcut, QRectF(QPointF(0, 0), size));
            m.shortcutWidth = size.width();
        }

        if (!child->icon().isNull()) {
            entry.icon = m_Host->createImage(entry.plate, child->icon());
            m.iconWidth = child->icon().width();
        }

        if (child->type() == MenuNode::Type::Menu) {
            entry.arrow = m_Host->createImage(entry.plate, m_Style.submenuArrow);
            m.arrowWidth = m_Style.submenuArrow.width();
        }

        panel->entryWidgetByNode[child] = entry.plate;
        panel->entries.push_back(entry);
        metrics.push_back(m);
    }

    ColumnLayout columns = computeColumns(metrics, m_Style, titleWidth);

    qreal y = m_Style.outerPadding.top();
    if (panel->title != InvalidWidget) {
        m_Host->setWidgetGeometry(panel->title,
                                  QRectF(m_Style.outerPadding.left() + m_Style.titlePadding.left(),
                                         y + m_Style.titlePadding.top(),
                                         columns.entryWidth - m_Style.titlePadding.left()
                                                            - m_Style.titlePadding.right(),
                                         titleHeight - m_Style.titlePadding.top()
                                                     - m_Style.titlePadding.bottom()));
        y += titleHeight;
    }

    for (size_t i = 0; i < panel->entries.size(); i++) {
        if (i > 0)
            y += m_Style.childrenSpacing;

        PanelEntry& entry = panel->entries[i];
        qreal h = entryHeight(entry);
        layoutEntry(entry, columns, y, h);
        y += h;
    }

    panel->naturalSize = QSizeF(m_Style.outerPadding.left() + columns.entryWidth + m_Style.outerPadding.right(),
                                y + m_Style.outerPadding.bottom());
    m_Host->setWidgetGeometry(panel->body, QRectF(QPointF(0, 0), panel->naturalSize));
    m_Host->setWidgetGeometry(panel->shadow, QRectF(QPointF(0, 0), panel->naturalSize));

    return panel;
}

// ---------------------------------------------------------------------------
// Scrolling
// ---------------------------------------------------------------------------

void MenuLayoutBuilder::applyScrollMode(PanelRecord& panel, const QSizeF& finalSize)
{
    std::vector<WidgetId> children = m_Host->widgetChildren(panel.body);

    QRectF viewport(0, 0, panel.naturalSize.width(), finalSize.height());
    panel.scroll = m_Host->createScrollView(panel.body, viewport, panel.naturalSize.height(),
                                            m_Style.scrollbarWidth, m_Style.scrollSensitivity);
    m_Host->setWidgetColor(panel.scroll.scrollbar, m_Style.scrollbarColor);
    m_Host->setWidgetColor(panel.scroll.thumb, m_Style.scrollThumbColor);

    for (WidgetId child : children) {
        m_Host->reparentWidget(child, panel.scroll.content);
    }

    QRectF body = m_Host->widgetGeometry(panel.body);
    body.setSize(finalSize);
    m_Host->setWidgetGeometry(panel.body, body);
    m_Host->setScrollPosition(panel.scroll.viewport, 0);

    panel.hasScrollActive = true;

    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION,
                "Menu '%s' is %.0f px tall, scrolling in %.0f px",
                qPrintable(panel.ownerNode->label()),
                panel.naturalSize.height(), finalSize.height());
}

bool MenuLayoutBuilder::centerOnSelected(PanelRecord& panel)
{
    if (!panel.hasScrollActive || !panel.ownerNode->hasFlag(MenuNode::CenterScrollOnSelected))
        return false;

    const MenuNode* selected = nullptr;
    for (const auto& child : panel.ownerNode->children()) {
        if (child->hasFlag(MenuNode::Selected)) {
            if (selected) {
                // Ambiguous, leave the scroll position alone
                return false;
            }
            selected = child.get();
        }
    }

    const PanelEntry* entry = selected ? panel.entryFor(selected) : nullptr;
    if (!entry)
        return false;

    qreal position = 0;
    qreal viewportH = m_Host->widgetGeometry(panel.scroll.viewport).height();
    if (!PlacementEngine::centeredScrollPosition(panel.naturalSize.height(), viewportH,
                                                 entry->rect.top(), entry->rect.height(),
                                                 position)) {
        return false;
    }

    m_Host->setScrollPosition(panel.scroll.viewport, position);
    return true;
}
