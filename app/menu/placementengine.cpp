#include "placementengine.h"

#include <SDL.h>

using namespace DropMenu;

typedef PlacementDirective PD;

PlacementPlan PlacementEngine::dropdownPlan(GrowDirection direction)
{
    if (direction == GrowDirection::Right) {
        return { PD::TopLeftToBottomLeftOfHotspot,
                 PD::SwitchGrowLeft,
                 PD::TopRightToBottomRightOfHotspot,
                 PD::FlushRight,
                 PD::FlushLeft,
                 PD::FitInBounds };
    }

    return { PD::TopRightToBottomRightOfHotspot,
             PD::SwitchGrowRight,
             PD::TopLeftToBottomLeftOfHotspot,
             PD::FlushLeft,
             PD::FlushRight,
             PD::FitInBounds };
}

PlacementPlan PlacementEngine::submenuPlan(GrowDirection direction)
{
    if (direction == GrowDirection::Right) {
        return { PD::TopLeftToTopRightOfHotspot,
                 PD::SwitchGrowLeft,
                 PD::TopRightToTopLeftOfHotspot,
                 PD::FlushRight,
                 PD::FitInBounds };
    }

    return { PD::TopRightToTopLeftOfHotspot,
             PD::SwitchGrowRight,
             PD::TopLeftToTopRightOfHotspot,
             PD::FlushLeft,
             PD::FitInBounds };
}

bool PlacementEngine::isModeSwitch(PlacementDirective directive)
{
    return directive == PD::SwitchGrowLeft ||
           directive == PD::SwitchGrowRight ||
           directive == PD::ToggleGrowDirection;
}

QPointF PlacementEngine::initialTopLeft(const PlacementPlan& plan, const QRectF& hotspot,
                                        const QSizeF& panelSize)
{
    qreal y = hotspot.bottom();

    for (PlacementDirective directive : plan) {
        if (isModeSwitch(directive)) {
            continue;
        }

        switch (directive) {
        case PD::TopLeftToTopRightOfHotspot:
        case PD::TopRightToTopLeftOfHotspot:
        case PD::AlignRightEdgeNearLeftOfHotspot:
        case PD::AlignLeftEdgeNearRightOfHotspot:
            y = hotspot.top();
            break;
        case PD::BottomLeftToBottomRightOfHotspot:
        case PD::BottomRightToBottomLeftOfHotspot:
            y = hotspot.bottom() - panelSize.height();
            break;
        default:
            y = hotspot.bottom();
            break;
        }
        break;
    }

    return QPointF(hotspot.left(), y);
}

VerticalPlacement PlacementEngine::resolveVertical(const QRectF& panel, const QRectF& screen,
                                                   qreal scrollbarWidth)
{
    VerticalPlacement result;
    result.rect = panel;

    if (panel.height() > screen.height()) {
        result.scrollMode = true;
        result.rect.setTop(screen.top());
        result.rect.setHeight(screen.height());
        result.rect.setWidth(panel.width() + scrollbarWidth);
        return result;
    }

    if (result.rect.bottom() > screen.bottom()) {
        result.rect.translate(0, screen.bottom() - result.rect.bottom());
    }
    if (result.rect.top() < screen.top()) {
        result.rect.moveTop(screen.top());
    }

    return result;
}

qreal PlacementEngine::horizontalShift(PlacementDirective directive, const QRectF& panel,
                                       const QRectF& hotspot, const QRectF& screen)
{
    switch (directive) {
    case PD::TopLeftToBottomLeftOfHotspot:
        return hotspot.left() - panel.left();
    case PD::TopRightToBottomRightOfHotspot:
        return hotspot.right() - panel.right();
    case PD::TopLeftToTopRightOfHotspot:
    case PD::BottomLeftToBottomRightOfHotspot:
    case PD::AlignLeftEdgeNearRightOfHotspot:
        return hotspot.right() - panel.left();
    case PD::TopRightToTopLeftOfHotspot:
    case PD::BottomRightToBottomLeftOfHotspot:
    case PD::AlignRightEdgeNearLeftOfHotspot:
        return hotspot.left() - panel.right();
    case PD::FlushLeft:
        return screen.left() - panel.left();
    case PD::FlushRight:
        return screen.right() - panel.right();
    default:
        return 0;
    }
}

QRectF PlacementEngine::resolveHorizontal(const PlacementPlan& plan, const QRectF& panel,
                                          const QRectF& hotspot, const QRectF& screen,
                                          GrowDirection& direction)
{
    PlacementPlan directives = plan;
    if (directives.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Empty menu placement plan, dropping below the hotspot");
        directives.push_back(PD::TopLeftToBottomLeftOfHotspot);
    }

    QRectF rect = panel;

    for (PlacementDirective directive : directives) {
        if (directive == PD::SwitchGrowLeft) {
            direction = GrowDirection::Left;
            continue;
        }
        else if (directive == PD::SwitchGrowRight) {
            direction = GrowDirection::Right;
            continue;
        }
        else if (directive == PD::ToggleGrowDirection) {
            direction = direction == GrowDirection::Left ? GrowDirection::Right : GrowDirection::Left;
            continue;
        }
        else if (directive == PD::FitInBounds) {
            break;
        }

        rect.translate(horizontalShift(directive, rect, hotspot, screen), 0);
        if (rect.left() >= screen.left() && rect.right() <= screen.right()) {
            break;
        }
    }

    // Keep the panel on screen whichever directive won
    if (rect.right() > screen.right()) {
        rect.moveRight(screen.right());
    }
    if (rect.left() < screen.left()) {
        rect.moveLeft(screen.left());
    }

    return rect;
}

bool PlacementEngine::centeredScrollPosition(qreal contentHeight, qreal viewportHeight,
                                             qreal entryTop, qreal entryHeight,
                                             qreal& position)
{
    qreal range = contentHeight - viewportHeight;
    if (range <= 0 || entryTop + entryHeight <= viewportHeight) {
        return false;
    }

    qreal offset = entryTop + entryHeight / 2 - viewportHeight / 2;
    position = qBound<qreal>(0, offset / range, 1);
    return true;
}

QRectF PlacementEngine::hotspotFromPoint(const QPointF& point)
{
    return QRectF(point, QSizeF(0, 0));
}

const char* PlacementEngine::directiveName(PlacementDirective directive)
{
    switch (directive) {
    case PD::SwitchGrowLeft:                   return "SwitchGrowLeft";
    case PD::SwitchGrowRight:                  return "SwitchGrowRight";
    case PD::ToggleGrowDirection:              return "ToggleGrowDirection";
    case PD::TopLeftToBottomLeftOfHotspot:     return "TopLeftToBottomLeftOfHotspot";
    case PD::TopRightToBottomRightOfHotspot:   return "TopRightToBottomRightOfHotspot";
    case PD::TopLeftToTopRightOfHotspot:       return "TopLeftToTopRightOfHotspot";
    case PD::TopRightToTopLeftOfHotspot:       return "TopRightToTopLeftOfHotspot";
    case PD::BottomLeftToBottomRightOfHotspot: return "BottomLeftToBottomRightOfHotspot";
    case PD::BottomRightToBottomLeftOfHotspot: return "BottomRightToBottomLeftOfHotspot";
    case PD::AlignRightEdgeNearLeftOfHotspot:  return "AlignRightEdgeNearLeftOfHotspot";
    case PD::AlignLeftEdgeNearRightOfHotspot:  return "AlignLeftEdgeNearRightOfHotspot";
    case PD::FlushLeft:                        return "FlushLeft";
    case PD::FlushRight:                       return "FlushRight";
    case PD::FitInBounds:                      return "FitInBounds";
    }
    return "Unknown";
}
