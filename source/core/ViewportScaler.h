#pragma once

// ============================================================================
// ViewportScaler - Fits the logical page into the on-screen container
// ============================================================================
// Keeps the logical-to-screen scale factor in sync with page size changes
// and container resizes. Scene coordinates are never touched; only the
// render transform derived from scaleFactor() changes.
// ============================================================================

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <optional>

/**
 * @brief Computes and tracks the page-fit scale factor.
 *
 * The page is drawn centred in the container at scaleFactor().
 * While the container has no measurable size, recomputation is deferred
 * and the previous factor is kept.
 */
class ViewportScaler : public QObject {
    Q_OBJECT

public:
    explicit ViewportScaler(QObject* parent = nullptr);

    /**
     * @brief Scale that fits @p pageSize inside @p containerSize.
     * @return min(cw/pw, ch/ph), or nullopt if either size is not measurable.
     */
    static std::optional<qreal> fitScale(const QSizeF& pageSize, const QSizeF& containerSize);

    qreal scaleFactor() const { return m_scaleFactor; }
    QSizeF pageSize() const { return m_pageSize; }

    /**
     * @brief True until the first successful recomputation.
     */
    bool isPending() const { return m_pending; }

    void setPageSize(const QSizeF& pageSize);
    void setContainerSize(const QSizeF& containerSize);

    /**
     * @brief Recompute the scale from the current sizes.
     * @return True if a scale could be computed (container measurable).
     */
    bool recompute();

    /**
     * @brief Page rectangle in container coordinates (centred).
     */
    QRectF pageRect() const;

    /**
     * @brief Map a container point to logical page coordinates.
     */
    QPointF mapToPage(const QPointF& containerPoint) const;

    /**
     * @brief Map a logical page point to container coordinates.
     */
    QPointF mapFromPage(const QPointF& pagePoint) const;

signals:
    /**
     * @brief Emitted when the scale factor changes.
     */
    void scaleFactorChanged(qreal scaleFactor);

private:
    QSizeF m_pageSize;
    QSizeF m_containerSize;
    qreal m_scaleFactor = 1.0;
    bool m_pending = true;
};
