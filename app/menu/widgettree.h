#pragma once

#include "menuhost.h"

#include <unordered_map>
#include <vector>

namespace DropMenu {

/**
 * WidgetTree - retained widget bookkeeping shared by every IMenuHost
 * implementation.
 *
 * Keeps ids, parent/child ownership, sibling draw order, control states
 * and scroll offsets. Scrolling is applied by moving the content widget,
 * so screen rects of scrolled entries are always current. Subclasses
 * provide the surface and text metrics, and feed input through the
 * notify*() helpers.
 */
class WidgetTree : public IMenuHost
{
public:
    struct Widget {
        WidgetId      id = InvalidWidget;
        WidgetId      parent = InvalidWidget;
        WidgetRole    role = WidgetRole::Panel;
        QRectF        geometry;
        QColor        color;
        bool          visible = true;

        // Labels and images
        QString       text;
        QFont         font;
        Qt::Alignment alignment = Qt::AlignLeft | Qt::AlignVCenter;
        QImage        image;

        // Interactive controls
        bool          interactive = false;
        bool          enabled = true;
        ControlColors colors;
        ControlState  state = ControlState::Normal;

        // Viewports
        ScrollView    scroll;
        qreal         scrollPosition = 0;
        qreal         contentHeight = 0;
        qreal         scrollSensitivity = 0;

        std::vector<WidgetId> children;   // back to front
    };

    WidgetTree();
    ~WidgetTree() override;

    WidgetId createModalSurface(const QColor& color, bool visible) override;
    WidgetId createRect(WidgetId parent, WidgetRole role, const QColor& color) override;
    WidgetId createLabel(WidgetId parent, const QString& text, const QFont& font,
                         const QColor& color, Qt::Alignment alignment) override;
    WidgetId createImage(WidgetId parent, const QImage& image) override;
    ScrollView createScrollView(WidgetId parent, const QRectF& viewportRect,
                                qreal contentHeight, qreal scrollbarWidth,
                                qreal sensitivity) override;
    void destroyWidget(WidgetId widget) override;
    bool isWidgetAlive(WidgetId widget) const override;
    void setWidgetColor(WidgetId widget, const QColor& color) override;

    void makeInteractive(WidgetId widget, const ControlColors& colors, bool enabled) override;
    bool isInteractable(WidgetId widget) const override;
    void setControlState(WidgetId widget, ControlState state) override;
    ControlState controlState(WidgetId widget) const override;

    void setWidgetGeometry(WidgetId widget, const QRectF& rect) override;
    QRectF widgetGeometry(WidgetId widget) const override;
    QRectF widgetScreenRect(WidgetId widget) const override;
    void moveWidgetToScreen(WidgetId widget, const QPointF& screenTopLeft) override;
    void reparentWidget(WidgetId widget, WidgetId newParent) override;
    std::vector<WidgetId> widgetChildren(WidgetId widget) const override;

    void raiseWidget(WidgetId widget) override;
    void stackWidgetUnder(WidgetId widget, WidgetId sibling) override;
    int widgetSiblingIndex(WidgetId widget) const override;

    void setScrollPosition(WidgetId viewport, qreal normalized) override;
    qreal scrollPosition(WidgetId viewport) const override;

    void addInputListener(IMenuInputListener* listener) override;
    void removeInputListener(IMenuInputListener* listener) override;

    const Widget* findWidget(WidgetId widget) const;
    const std::vector<WidgetId>& rootWidgets() const { return m_Roots; }
    int widgetCount() const { return (int)m_Widgets.size(); }
    int inputListenerCount() const { return (int)m_Listeners.size(); }

    // Topmost hit-testable widget under a screen position, or InvalidWidget
    WidgetId hitTest(const QPointF& screenPos) const;

    // Nearest viewport containing the widget, or InvalidWidget
    WidgetId enclosingViewport(WidgetId widget) const;

protected:
    void notifyPointerEntered(WidgetId widget);
    void notifyPointerPressed(WidgetId widget);
    void notifyClicked(WidgetId widget);
    void notifyScrollChanged(WidgetId viewport);

    // User scroll by a number of content pixels; notifies listeners when the position moved
    void scrollBy(WidgetId viewport, qreal pixels);

    // Called after any change that affects what is drawn
    virtual void widgetsChanged() {}

private:
    Widget* widgetPtr(WidgetId widget);
    WidgetId allocate(WidgetId parent, WidgetRole role);
    std::vector<WidgetId>& siblingsOf(const Widget& widget);
    void detach(Widget& widget);
    void eraseRecursive(WidgetId widget);
    void updateScrollLayout(Widget& viewport);
    WidgetId hitTestWidget(const Widget& widget, const QPointF& pos, const QPointF& origin) const;
    bool hasListener(IMenuInputListener* listener) const;

    std::unordered_map<WidgetId, Widget> m_Widgets;
    std::vector<WidgetId>                m_Roots;
    WidgetId                             m_NextId;
    std::vector<IMenuInputListener*>     m_Listeners;
};

}
