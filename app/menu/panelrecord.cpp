#include "panelrecord.h"

using namespace DropMenu;

WidgetId PanelRecord::widgetFor(const MenuNode* node) const
{
    auto it = entryWidgetByNode.find(node);
    return it != entryWidgetByNode.end() ? it->second : InvalidWidget;
}

const PanelEntry* PanelRecord::entryFor(const MenuNode* node) const
{
    for (const PanelEntry& entry : entries) {
        if (entry.node == node)
            return &entry;
    }
    return nullptr;
}

void PanelRecord::clear()
{
    entryWidgetByNode.clear();
    entries.clear();
    body = InvalidWidget;
    shadow = InvalidWidget;
    title = InvalidWidget;
    scroll = ScrollView();
    hasScrollActive = false;
}
