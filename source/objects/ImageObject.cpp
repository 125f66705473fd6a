// ============================================================================
// ImageObject - Implementation
// ============================================================================

#include "ImageObject.h"

QSizeF ImageObject::size() const
{
    if (m_image.isNull()) {
        return QSizeF();
    }
    return QSizeF(m_image.width() * scale, m_image.height() * scale);
}

void ImageObject::renderContent(QPainter& painter) const
{
    if (m_image.isNull()) {
        return;
    }

    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(QRectF(QPointF(0, 0), size()), m_image);
}
