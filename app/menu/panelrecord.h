#pragma once

#include "menuhost.h"
#include "menunode.h"

#include <memory>
#include <unordered_map>
#include <vector>

namespace DropMenu {

// Widgets realizing one child of a panel. Rect is in panel content space.
struct PanelEntry {
    const MenuNode* node     = nullptr;
    WidgetId        plate    = InvalidWidget;   // entry plate, or the separator line
    WidgetId        label    = InvalidWidget;
    WidgetId        shortcut = InvalidWidget;
    WidgetId        icon     = InvalidWidget;
    WidgetId        arrow    = InvalidWidget;
    QRectF          rect;
};

/**
 * PanelRecord - one open panel of a session.
 *
 * All widgets are owned by the host under the session's modal surface;
 * the record only keeps their ids. Parent points at the panel that
 * spawned this one and always outlives it on the session stack.
 */
struct PanelRecord
{
    const MenuNode* ownerNode = nullptr;
    PanelRecord*    parent = nullptr;
    int             depth = 0;

    WidgetId        body = InvalidWidget;
    WidgetId        shadow = InvalidWidget;
    WidgetId        title = InvalidWidget;
    ScrollView      scroll;
    bool            hasScrollActive = false;
    QSizeF          naturalSize;

    std::vector<PanelEntry> entries;

    // Interactive entry plates keyed by node identity
    std::unordered_map<const MenuNode*, WidgetId> entryWidgetByNode;

    // Go back entry synthesized for this panel only
    std::unique_ptr<MenuNode> goBackNode;

    WidgetId widgetFor(const MenuNode* node) const;
    const PanelEntry* entryFor(const MenuNode* node) const;

    // Forget widget ids after the host widgets are gone
    void clear();
};

}
