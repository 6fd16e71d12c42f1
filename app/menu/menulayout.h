#pragma once

#include "menustyle.h"
#include "panelrecord.h"

#include <memory>
#include <vector>

namespace DropMenu {

// Natural sizes of one entry's parts, 0 when absent
struct EntryMetrics {
    qreal iconWidth     = 0;
    qreal labelWidth    = 0;
    qreal shortcutWidth = 0;
    qreal arrowWidth    = 0;
};

// Uniform columns shared by every entry of a panel, x relative to the entry plate
struct ColumnLayout {
    qreal iconX         = 0;
    qreal iconWidth     = 0;
    qreal labelX        = 0;
    qreal labelWidth    = 0;
    qreal shortcutX     = 0;
    qreal shortcutWidth = 0;
    qreal arrowX        = 0;
    qreal arrowWidth    = 0;
    qreal entryWidth    = 0;
};

/**
 * MenuLayoutBuilder - realizes one Menu node as a sized panel.
 *
 * Widgets are created under the modal surface, with the panel body at
 * the origin. Positioning on screen is left to the session.
 */
class MenuLayoutBuilder
{
public:
    MenuLayoutBuilder(IMenuHost* host, const MenuStyle& style);

    // Columns are icon | label | shortcut | arrow. Throws nothing.
    static ColumnLayout computeColumns(const std::vector<EntryMetrics>& metrics,
                                       const MenuStyle& style, qreal titleWidth);

    // Throws ConfigurationError when a Menu child exists and no arrow sprite is configured
    std::unique_ptr<PanelRecord> build(WidgetId modalSurface, const MenuNode* menu,
                                       PanelRecord* parent, bool showTitle, bool addGoBack);

    // Moves the entries into a scroll view sized to the final panel rect
    void applyScrollMode(PanelRecord& panel, const QSizeF& finalSize);

    // Scrolls to the single Selected child of a CenterScrollOnSelected menu
    bool centerOnSelected(PanelRecord& panel);

private:
    void layoutEntry(PanelEntry& entry, const ColumnLayout& columns, qreal y, qreal height);
    qreal entryHeight(const PanelEntry& entry) const;

    IMenuHost*       m_Host;
    const MenuStyle& m_Style;
};

}
