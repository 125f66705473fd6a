#include "ViewportScaler.h"

#include <cmath>

ViewportScaler::ViewportScaler(QObject* parent)
    : QObject(parent)
{
}

std::optional<qreal> ViewportScaler::fitScale(const QSizeF& pageSize, const QSizeF& containerSize)
{
    // Guard against zero-size pages and containers that are not laid out yet
    if (pageSize.width() <= 0 || pageSize.height() <= 0 ||
        containerSize.width() <= 0 || containerSize.height() <= 0) {
        return std::nullopt;
    }

    qreal scaleX = containerSize.width() / pageSize.width();
    qreal scaleY = containerSize.height() / pageSize.height();
    qreal scale = qMin(scaleX, scaleY);

    if (!std::isfinite(scale) || scale <= 0) {
        return std::nullopt;
    }
    return scale;
}

void ViewportScaler::setPageSize(const QSizeF& pageSize)
{
    m_pageSize = pageSize;
    recompute();
}

void ViewportScaler::setContainerSize(const QSizeF& containerSize)
{
    m_containerSize = containerSize;
    recompute();
}

bool ViewportScaler::recompute()
{
    std::optional<qreal> scale = fitScale(m_pageSize, m_containerSize);
    if (!scale) {
        // Not measurable yet: keep the old factor, retry on the next resize
        return false;
    }

    m_pending = false;
    if (!qFuzzyCompare(*scale, m_scaleFactor)) {
        m_scaleFactor = *scale;
        emit scaleFactorChanged(m_scaleFactor);
    }
    return true;
}

QRectF ViewportScaler::pageRect() const
{
    QSizeF scaled = m_pageSize * m_scaleFactor;
    QPointF topLeft((m_containerSize.width() - scaled.width()) / 2.0,
                    (m_containerSize.height() - scaled.height()) / 2.0);
    return QRectF(topLeft, scaled);
}

QPointF ViewportScaler::mapToPage(const QPointF& containerPoint) const
{
    return (containerPoint - pageRect().topLeft()) / m_scaleFactor;
}

QPointF ViewportScaler::mapFromPage(const QPointF& pagePoint) const
{
    return pagePoint * m_scaleFactor + pageRect().topLeft();
}
