#pragma once

// ============================================================================
// CanvasWidget - Interactive view of the poster page
// ============================================================================
// Draws the page centred and fitted into the widget through ViewportScaler.
// The scene itself is always in logical page pixels; only the painter
// transform depends on the widget size.
//
// Mouse handling:
// - Press on an object selects it, press on empty canvas clears selection
// - Drag moves the selected object
// ============================================================================

#include "../core/ViewportScaler.h"

#include <QWidget>
#include <QPointF>
#include <QColor>

class EditorSession;

class CanvasWidget : public QWidget {
    Q_OBJECT

public:
    explicit CanvasWidget(EditorSession* session, QWidget* parent = nullptr);

    ViewportScaler* scaler() { return &m_scaler; }

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void showEvent(QShowEvent* event) override;

private:
    void updateContainerSize();
    void drawSelectionOutline(QPainter& painter);

    EditorSession* m_session = nullptr;
    ViewportScaler m_scaler;

    // Drag state (page coordinates)
    bool m_dragging = false;
    QPointF m_lastDragPos;

    static constexpr int CONTAINER_PADDING = 16;
    static constexpr int SELECTION_PEN_WIDTH = 2;
    inline static const QColor CONTAINER_COLOR = QColor(0x0f, 0x17, 0x2a);
    inline static const QColor SELECTION_COLOR = QColor(0x3b, 0x82, 0xf6);
};
