#pragma once

#include <QColor>
#include <QFont>
#include <QImage>
#include <QRectF>
#include <QString>

#include <vector>

namespace DropMenu {

using WidgetId = quint32;
constexpr WidgetId InvalidWidget = 0;

enum class WidgetRole {
    ModalSurface,
    Panel,
    Shadow,
    Entry,
    Label,
    Image,
    Separator,
    Viewport,
    Content,
    Scrollbar,
    ScrollThumb,
};

enum class ControlState {
    Normal,
    Highlighted,
    Pressed,
    Disabled,
};

struct ControlColors {
    QColor normal;
    QColor highlighted;
    QColor pressed;
    QColor disabled;
};

struct ScrollView {
    WidgetId viewport  = InvalidWidget;
    WidgetId content   = InvalidWidget;
    WidgetId scrollbar = InvalidWidget;
    WidgetId thumb     = InvalidWidget;
};

// Pointer notifications delivered by the host, keyed by the widget under the pointer
class IMenuInputListener
{
public:
    virtual ~IMenuInputListener() = default;

    virtual void pointerEntered(WidgetId widget) = 0;
    virtual void pointerPressed(WidgetId widget) = 0;
    virtual void clicked(WidgetId widget) = 0;
    virtual void scrollChanged(WidgetId viewport) = 0;
};

/**
 * IMenuHost - retained-mode UI primitives the menu engine draws with.
 *
 * Widget geometry is expressed in the parent's coordinate space with a
 * top-left origin and y growing downwards. Root widgets (modal surfaces)
 * live in screen space. Destroying a widget destroys its children.
 */
class IMenuHost
{
public:
    virtual ~IMenuHost() = default;

    // Screen area available to menus
    virtual QRectF surfaceRect() const = 0;

    // Natural single-line extents of the text, available without a layout pass
    virtual QSizeF measureText(const QString& text, const QFont& font) const = 0;

    virtual WidgetId createModalSurface(const QColor& color, bool visible) = 0;
    virtual WidgetId createRect(WidgetId parent, WidgetRole role, const QColor& color) = 0;
    virtual WidgetId createLabel(WidgetId parent, const QString& text, const QFont& font,
                                 const QColor& color, Qt::Alignment alignment) = 0;
    virtual WidgetId createImage(WidgetId parent, const QImage& image) = 0;
    virtual ScrollView createScrollView(WidgetId parent, const QRectF& viewportRect,
                                        qreal contentHeight, qreal scrollbarWidth,
                                        qreal sensitivity) = 0;
    virtual void destroyWidget(WidgetId widget) = 0;
    virtual bool isWidgetAlive(WidgetId widget) const = 0;
    virtual void setWidgetColor(WidgetId widget, const QColor& color) = 0;

    virtual void makeInteractive(WidgetId widget, const ControlColors& colors, bool enabled) = 0;
    virtual bool isInteractable(WidgetId widget) const = 0;
    virtual void setControlState(WidgetId widget, ControlState state) = 0;
    virtual ControlState controlState(WidgetId widget) const = 0;

    virtual void setWidgetGeometry(WidgetId widget, const QRectF& rect) = 0;
    virtual QRectF widgetGeometry(WidgetId widget) const = 0;
    virtual QRectF widgetScreenRect(WidgetId widget) const = 0;
    virtual void moveWidgetToScreen(WidgetId widget, const QPointF& screenTopLeft) = 0;
    virtual void reparentWidget(WidgetId widget, WidgetId newParent) = 0;
    virtual std::vector<WidgetId> widgetChildren(WidgetId widget) const = 0;

    // Draw order among siblings: index 0 is drawn first (furthest back)
    virtual void raiseWidget(WidgetId widget) = 0;
    virtual void stackWidgetUnder(WidgetId widget, WidgetId sibling) = 0;
    virtual int widgetSiblingIndex(WidgetId widget) const = 0;

    // Normalized vertical scroll position, 0 = top of content
    virtual void setScrollPosition(WidgetId viewport, qreal normalized) = 0;
    virtual qreal scrollPosition(WidgetId viewport) const = 0;

    virtual void addInputListener(IMenuInputListener* listener) = 0;
    virtual void removeInputListener(IMenuInputListener* listener) = 0;
};

}
