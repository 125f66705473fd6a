#pragma once

// ============================================================================
// ImageObject - A raster image placed on the poster page
// ============================================================================
// Used both for the imported background image and for images the user
// uploads. The bitmap is held as a QImage so it can be produced by the
// decoder thread and handed to the GUI thread without conversion.
// ============================================================================

#include "SceneObject.h"
#include <QImage>

/**
 * @brief An image object with a uniform scale factor.
 */
class ImageObject : public SceneObject {
public:
    // ===== Image-specific Properties =====
    qreal scale = 1.0;              ///< Uniform scale applied to the bitmap

    /**
     * @brief Constructor with a decoded bitmap.
     * @param image The bitmap to display.
     */
    explicit ImageObject(const QImage& image) : m_image(image) {}

    // ===== SceneObject Interface =====

    Kind kind() const override { return Kind::Image; }

    QString type() const override { return QStringLiteral("image"); }

    /**
     * @brief Displayed size: bitmap size times scale.
     */
    QSizeF size() const override;

protected:
    void renderContent(QPainter& painter) const override;

private:
    QImage m_image;
};
