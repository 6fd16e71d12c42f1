#pragma once

#include "menu/widgettree.h"

#include <QRasterWindow>
#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>

#include <functional>

/**
 * MenuCanvas - Qt window hosting menu widgets.
 *
 * Paints the retained widget tree (dark rounded panels with a soft
 * shadow, entry highlights, labels, sprites, separators, scrollbars)
 * and forwards mouse and wheel input to the menu sessions listening
 * on it. Right clicks that land outside any menu are reported through
 * contextRequested().
 */
class MenuCanvas : public QRasterWindow, public DropMenu::WidgetTree {
    Q_OBJECT
public:
    explicit MenuCanvas(QWindow* parent = nullptr);
    ~MenuCanvas() override;

    QRectF surfaceRect() const override;
    QSizeF measureText(const QString& text, const QFont& font) const override;

    void setBackgroundColor(const QColor& color);

signals:
    void contextRequested(const QPointF& pos);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

    void widgetsChanged() override;

private:
    void paintWidget(QPainter& p, const Widget& widget, const QPointF& origin);
    QColor colorForState(const Widget& widget) const;
    void updateHover(const QPointF& pos);
    void deliver(const std::function<void()>& event);

    QColor m_BackgroundColor;
    DropMenu::WidgetId m_HoverWidget;
    DropMenu::WidgetId m_PressWidget;
    Qt::MouseButton    m_PressButton;

    // Layout constants
    qreal m_BorderRadius;
    qreal m_EntryRadius;
    int   m_ShadowMargin;
};
