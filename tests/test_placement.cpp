#include "menu/placementengine.h"

#include <cstring>

using namespace DropMenu;

static const QRectF k_Screen(0, 0, 800, 600);

static QRectF place(const PlacementPlan& plan, const QRectF& hotspot, const QSizeF& size,
                    GrowDirection& direction)
{
    QRectF rect(PlacementEngine::initialTopLeft(plan, hotspot, size), size);
    rect = PlacementEngine::resolveVertical(rect, k_Screen, 10).rect;
    return PlacementEngine::resolveHorizontal(plan, rect, hotspot, k_Screen, direction);
}

static bool TestDropdownBelowHotspot()
{
    GrowDirection direction = GrowDirection::Right;
    QRectF hotspot(100, 200, 50, 20);
    QRectF rect = place(PlacementEngine::dropdownPlan(direction), hotspot, QSizeF(120, 80), direction);

    return rect == QRectF(100, 220, 120, 80) && direction == GrowDirection::Right;
}

static bool TestDropdownFlipsAtRightEdge()
{
    GrowDirection direction = GrowDirection::Right;
    QRectF hotspot(750, 100, 40, 20);
    QRectF rect = place(PlacementEngine::dropdownPlan(direction), hotspot, QSizeF(120, 80), direction);

    // Right edges aligned instead
    return rect.right() == 790 && rect.left() == 670 && rect.top() == 120 &&
           direction == GrowDirection::Left;
}

static bool TestSubmenuCascadesRight()
{
    GrowDirection direction = GrowDirection::Right;
    QRectF entry(100, 50, 150, 20);
    QRectF rect = place(PlacementEngine::submenuPlan(direction), entry, QSizeF(100, 60), direction);

    return rect == QRectF(250, 50, 100, 60) && direction == GrowDirection::Right;
}

static bool TestSubmenuFlipsAndKeepsGrowingLeft()
{
    GrowDirection direction = GrowDirection::Right;
    QRectF entry(650, 50, 100, 20);
    QRectF rect = place(PlacementEngine::submenuPlan(direction), entry, QSizeF(120, 60), direction);
    if (rect.right() != 650 || rect.left() != 530 || direction != GrowDirection::Left) {
        return false;
    }

    // The next level follows the new direction even though the right side has room
    QRectF next(530, 80, 120, 20);
    rect = place(PlacementEngine::submenuPlan(direction), next, QSizeF(60, 60), direction);
    return rect.right() == 530 && rect.left() == 470 && direction == GrowDirection::Left;
}

static bool TestFlushWhenNeitherSideFits()
{
    QRectF screen(0, 0, 300, 600);
    QRectF hotspot(140, 10, 20, 20);
    GrowDirection direction = GrowDirection::Right;
    PlacementPlan plan = PlacementEngine::dropdownPlan(direction);

    QRectF rect(PlacementEngine::initialTopLeft(plan, hotspot, QSizeF(200, 50)), QSizeF(200, 50));
    rect = PlacementEngine::resolveHorizontal(plan, rect, hotspot, screen, direction);

    return rect.left() == 100 && rect.right() == 300;
}

static bool TestFitInBoundsClampsLeft()
{
    QRectF screen(0, 0, 300, 600);
    QRectF hotspot(140, 10, 20, 20);
    GrowDirection direction = GrowDirection::Right;
    PlacementPlan plan = PlacementEngine::dropdownPlan(direction);

    QRectF rect(PlacementEngine::initialTopLeft(plan, hotspot, QSizeF(400, 50)), QSizeF(400, 50));
    rect = PlacementEngine::resolveHorizontal(plan, rect, hotspot, screen, direction);

    // Too wide for the screen: the left edge wins
    return rect.left() == 0 && rect.width() == 400;
}

static bool TestOnScreenContainment()
{
    const qreal widths[] = { 1, 80, 250, 399, 400, 401, 799, 800 };
    const GrowDirection directions[] = { GrowDirection::Left, GrowDirection::Right };

    for (qreal x = 0; x <= 780; x += 20) {
        for (qreal y = 0; y <= 580; y += 145) {
            QRectF hotspot(x, y, 20, 20);
            for (qreal width : widths) {
                for (GrowDirection start : directions) {
                    GrowDirection d1 = start;
                    QRectF dropdown = place(PlacementEngine::dropdownPlan(d1), hotspot,
                                            QSizeF(width, 100), d1);
                    GrowDirection d2 = start;
                    QRectF submenu = place(PlacementEngine::submenuPlan(d2), hotspot,
                                           QSizeF(width, 100), d2);

                    if (dropdown.left() < k_Screen.left() || dropdown.right() > k_Screen.right() ||
                            submenu.left() < k_Screen.left() || submenu.right() > k_Screen.right()) {
                        return false;
                    }
                }
            }
        }
    }
    return true;
}

static bool TestScrollModeThreshold()
{
    VerticalPlacement tall = PlacementEngine::resolveVertical(QRectF(10, 100, 120, 700), k_Screen, 10);
    if (!tall.scrollMode || tall.rect != QRectF(10, 0, 130, 600)) {
        return false;
    }

    // Exactly the screen height still fits
    VerticalPlacement exact = PlacementEngine::resolveVertical(QRectF(10, 100, 120, 600), k_Screen, 10);
    return !exact.scrollMode && exact.rect == QRectF(10, 0, 120, 600);
}

static bool TestShiftUpByOverflow()
{
    VerticalPlacement low = PlacementEngine::resolveVertical(QRectF(10, 550, 120, 100), k_Screen, 10);
    if (low.scrollMode || low.rect != QRectF(10, 500, 120, 100)) {
        return false;
    }

    VerticalPlacement fits = PlacementEngine::resolveVertical(QRectF(10, 400, 120, 100), k_Screen, 10);
    return !fits.scrollMode && fits.rect == QRectF(10, 400, 120, 100);
}

static bool TestInitialVerticalAnchor()
{
    QRectF hotspot(100, 200, 50, 20);
    QSizeF size(80, 60);

    return PlacementEngine::initialTopLeft(PlacementEngine::dropdownPlan(GrowDirection::Right), hotspot, size) == QPointF(100, 220) &&
           PlacementEngine::initialTopLeft(PlacementEngine::submenuPlan(GrowDirection::Left), hotspot, size) == QPointF(100, 200) &&
           PlacementEngine::initialTopLeft({ PlacementDirective::SwitchGrowLeft,
                                             PlacementDirective::BottomLeftToBottomRightOfHotspot },
                                           hotspot, size) == QPointF(100, 160);
}

static bool TestModeSwitchesOnly()
{
    GrowDirection direction = GrowDirection::Right;
    QRectF panel(900, 10, 100, 50);
    QRectF rect = PlacementEngine::resolveHorizontal({ PlacementDirective::ToggleGrowDirection,
                                                       PlacementDirective::FitInBounds },
                                                     panel, QRectF(0, 0, 10, 10), k_Screen, direction);
    if (direction != GrowDirection::Left || rect != QRectF(700, 10, 100, 50)) {
        return false;
    }

    // An empty plan drops below the hotspot
    direction = GrowDirection::Right;
    rect = PlacementEngine::resolveHorizontal(PlacementPlan(), QRectF(0, 30, 100, 50),
                                              QRectF(40, 10, 10, 20), k_Screen, direction);
    return rect.left() == 40 && direction == GrowDirection::Right;
}

static bool TestCenteredScrollPosition()
{
    qreal position = -1;
    if (PlacementEngine::centeredScrollPosition(1000, 200, 40, 20, position) || position != -1) {
        return false;
    }

    if (!PlacementEngine::centeredScrollPosition(1000, 200, 500, 20, position)) {
        return false;
    }
    if (qAbs(position - 410.0 / 800.0) > 1e-9) {
        return false;
    }

    // Last entries pin to the bottom
    return PlacementEngine::centeredScrollPosition(1000, 200, 980, 20, position) && position == 1;
}

static bool TestDirectiveNames()
{
    return std::strcmp(PlacementEngine::directiveName(PlacementDirective::FlushLeft), "FlushLeft") == 0 &&
           PlacementEngine::isModeSwitch(PlacementDirective::SwitchGrowRight) &&
           !PlacementEngine::isModeSwitch(PlacementDirective::FitInBounds) &&
           PlacementEngine::hotspotFromPoint(QPointF(5, 6)) == QRectF(5, 6, 0, 0);
}

int main()
{
    if (!TestDropdownBelowHotspot()) {
        return 1;
    }

    if (!TestDropdownFlipsAtRightEdge()) {
        return 2;
    }

    if (!TestSubmenuCascadesRight()) {
        return 3;
    }

    if (!TestSubmenuFlipsAndKeepsGrowingLeft()) {
        return 4;
    }

    if (!TestFlushWhenNeitherSideFits()) {
        return 5;
    }

    if (!TestFitInBoundsClampsLeft()) {
        return 6;
    }

    if (!TestOnScreenContainment()) {
        return 7;
    }

    if (!TestScrollModeThreshold()) {
        return 8;
    }

    if (!TestShiftUpByOverflow()) {
        return 9;
    }

    if (!TestInitialVerticalAnchor()) {
        return 10;
    }

    if (!TestModeSwitchesOnly()) {
        return 11;
    }

    if (!TestCenteredScrollPosition()) {
        return 12;
    }

    if (!TestDirectiveNames()) {
        return 13;
    }

    return 0;
}
