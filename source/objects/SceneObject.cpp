// ============================================================================
// SceneObject - Implementation
// ============================================================================

#include "SceneObject.h"

void SceneObject::render(QPainter& painter) const
{
    if (!visible) {
        return;
    }

    QRectF rect = boundingRect();
    if (rect.isEmpty()) {
        return;
    }

    painter.save();

    // Mirror around the object center, then move to the local origin
    QPointF c = rect.center();
    painter.translate(c);
    painter.scale(flipX ? -1.0 : 1.0, flipY ? -1.0 : 1.0);
    painter.translate(-rect.width() / 2.0, -rect.height() / 2.0);

    renderContent(painter);

    painter.restore();
}

bool SceneObject::containsPoint(const QPointF& pt) const
{
    return boundingRect().contains(pt);
}

QRectF SceneObject::boundingRect() const
{
    QSizeF s = size();
    if (origin == Origin::Center) {
        return QRectF(position - QPointF(s.width() / 2.0, s.height() / 2.0), s);
    }
    return QRectF(position, s);
}
