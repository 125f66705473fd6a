#include "CanvasWidget.h"
#include "../core/EditorSession.h"
#include "../core/SceneExporter.h"

#include <QPainter>
#include <QMouseEvent>
#include <QResizeEvent>
#include <QShowEvent>

// ============================================================================
// CanvasWidget
// ============================================================================

CanvasWidget::CanvasWidget(EditorSession* session, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
{
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setMouseTracking(false);
    setFocusPolicy(Qt::ClickFocus);

    m_scaler.setPageSize(m_session->pageSize());

    connect(m_session, &EditorSession::pageSizeChanged, &m_scaler, &ViewportScaler::setPageSize);
    connect(m_session, &EditorSession::sceneChanged, this, QOverload<>::of(&QWidget::update));
    connect(m_session->selection(), &SelectionController::selectionChanged,
            this, [this](const QString&) { update(); });
    connect(&m_scaler, &ViewportScaler::scaleFactorChanged,
            this, [this](qreal) { update(); });
}

QSize CanvasWidget::sizeHint() const
{
    return QSize(640, 800);
}

QSize CanvasWidget::minimumSizeHint() const
{
    return QSize(200, 200);
}

void CanvasWidget::updateContainerSize()
{
    QRect area = contentsRect().adjusted(CONTAINER_PADDING, CONTAINER_PADDING,
                                         -CONTAINER_PADDING, -CONTAINER_PADDING);
    // A hidden or collapsed widget reports no usable size; the scaler keeps
    // the previous factor until it is measurable again
    m_scaler.setContainerSize(area.size());
}

void CanvasWidget::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), CONTAINER_COLOR);

    if (m_scaler.isPending()) {
        return;
    }

    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);

    // Scaler rect is relative to the padded container area
    const QRectF pageRect = m_scaler.pageRect().translated(CONTAINER_PADDING, CONTAINER_PADDING);
    const qreal scale = m_scaler.scaleFactor();

    painter.save();
    painter.translate(pageRect.topLeft());
    painter.scale(scale, scale);
    SceneExporter::paintPage(painter, m_session->scene(), m_session->pageSize());
    painter.restore();

    drawSelectionOutline(painter);
}

void CanvasWidget::drawSelectionOutline(QPainter& painter)
{
    const SceneObject* obj = m_session->selection()->selectedObject();
    if (!obj) {
        return;
    }

    const QRectF bounds = obj->boundingRect();
    const QPointF topLeft = m_scaler.mapFromPage(bounds.topLeft()) + QPointF(CONTAINER_PADDING, CONTAINER_PADDING);
    const QPointF bottomRight = m_scaler.mapFromPage(bounds.bottomRight()) + QPointF(CONTAINER_PADDING, CONTAINER_PADDING);

    // Outline is drawn in widget space so its width does not scale
    QPen pen(SELECTION_COLOR, SELECTION_PEN_WIDTH, Qt::DashLine);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(QRectF(topLeft, bottomRight));
}

void CanvasWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || m_scaler.isPending()) {
        QWidget::mousePressEvent(event);
        return;
    }

    const QPointF widgetPos = event->position() - QPointF(CONTAINER_PADDING, CONTAINER_PADDING);
    const QPointF pagePos = m_scaler.mapToPage(widgetPos);

    const SceneObject* hit = m_session->scene().objectAtPoint(pagePos);

    if (hit) {
        m_session->selectObject(hit->id);
        m_dragging = true;
        m_lastDragPos = pagePos;
    } else {
        m_session->clearSelection();
        m_dragging = false;
    }

    event->accept();
}

void CanvasWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_dragging) {
        QWidget::mouseMoveEvent(event);
        return;
    }

    const QPointF widgetPos = event->position() - QPointF(CONTAINER_PADDING, CONTAINER_PADDING);
    const QPointF pagePos = m_scaler.mapToPage(widgetPos);
    const QPointF delta = pagePos - m_lastDragPos;
    if (!delta.isNull()) {
        m_session->moveObject(m_session->selection()->selectedId(), delta);
        m_lastDragPos = pagePos;
    }
    event->accept();
}

void CanvasWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_dragging = false;
    }
    QWidget::mouseReleaseEvent(event);
}

void CanvasWidget::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    updateContainerSize();
}

void CanvasWidget::showEvent(QShowEvent* event)
{
    QWidget::showEvent(event);
    updateContainerSize();
}
