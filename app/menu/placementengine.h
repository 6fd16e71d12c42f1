#pragma once

#include <QRectF>

#include <vector>

namespace DropMenu {

// Side new submenus cascade towards. Persistent for one session.
enum class GrowDirection {
    Left,
    Right,
};

enum class PlacementDirective {
    // Mode switches: change the grow direction, never tested for fit
    SwitchGrowLeft,
    SwitchGrowRight,
    ToggleGrowDirection,

    // Panel corner to hotspot corner, horizontal axis only
    TopLeftToBottomLeftOfHotspot,
    TopRightToBottomRightOfHotspot,
    TopLeftToTopRightOfHotspot,
    TopRightToTopLeftOfHotspot,
    BottomLeftToBottomRightOfHotspot,
    BottomRightToBottomLeftOfHotspot,

    AlignRightEdgeNearLeftOfHotspot,
    AlignLeftEdgeNearRightOfHotspot,

    FlushLeft,
    FlushRight,

    // Accept whatever position we have
    FitInBounds,
};

using PlacementPlan = std::vector<PlacementDirective>;

struct VerticalPlacement {
    QRectF rect;
    bool   scrollMode = false;
};

/**
 * PlacementEngine - positions one panel relative to a hotspot.
 *
 * Pure geometry in screen space (top-left origin, y down). Directives
 * are tried in order and the first one that leaves the panel fully
 * inside the screen horizontally wins.
 */
class PlacementEngine
{
public:
    // Menus opened from a button or a point
    static PlacementPlan dropdownPlan(GrowDirection direction);

    // Menus cascading from an entry of another panel
    static PlacementPlan submenuPlan(GrowDirection direction);

    static bool isModeSwitch(PlacementDirective directive);

    // Starting top-left before the horizontal pass, y taken from the first positional directive
    static QPointF initialTopLeft(const PlacementPlan& plan, const QRectF& hotspot,
                                  const QSizeF& panelSize);

    // Scroll mode when taller than the screen, otherwise shift up to the bottom edge
    static VerticalPlacement resolveVertical(const QRectF& panel, const QRectF& screen,
                                             qreal scrollbarWidth);

    static QRectF resolveHorizontal(const PlacementPlan& plan, const QRectF& panel,
                                    const QRectF& hotspot, const QRectF& screen,
                                    GrowDirection& direction);

    // Normalized scroll position (0 = top) centering an entry that sits below the
    // viewport. Returns false when the entry is already visible.
    static bool centeredScrollPosition(qreal contentHeight, qreal viewportHeight,
                                       qreal entryTop, qreal entryHeight,
                                       qreal& position);

    static QRectF hotspotFromPoint(const QPointF& point);

    static const char* directiveName(PlacementDirective directive);

private:
    static qreal horizontalShift(PlacementDirective directive, const QRectF& panel,
                                 const QRectF& hotspot, const QRectF& screen);
};

}
