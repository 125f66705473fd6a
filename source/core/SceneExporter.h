#pragma once

// ============================================================================
// SceneExporter - Renders the poster scene to raster images and PDF
// ============================================================================
// Output is always at the page's logical resolution, independent of the
// on-screen zoom. Selection decorations are never drawn, and neither the
// scene nor the selection is touched.
// ============================================================================

#include "Scene.h"

#include <QByteArray>
#include <QColor>
#include <QImage>
#include <QSizeF>
#include <QString>

namespace SceneExporter {

/// Default export file name offered by the GUI.
inline QString defaultFileName() { return QStringLiteral("poster.png"); }

/// Canvas colour behind all objects.
inline QColor pageBackground() { return QColor(0x11, 0x18, 0x27); }

/**
 * @brief Paint the page background and all objects.
 * @param painter Painter in logical page coordinates.
 */
void paintPage(QPainter& painter, const Scene& scene, const QSizeF& pageSize);

/**
 * @brief Render the scene at logical resolution.
 * @return ARGB32 image of pageSize (rounded up), or a null image for an empty page size.
 */
QImage renderToImage(const Scene& scene, const QSizeF& pageSize);

/**
 * @brief Render and encode as PNG.
 * @return PNG bytes, empty on failure.
 */
QByteArray exportPng(const Scene& scene, const QSizeF& pageSize);

/**
 * @brief Render and save to a raster file; the format follows the suffix
 *        (png, jpg/jpeg, bmp, webp where supported). No suffix saves PNG.
 * @param errorMessage Receives a description on failure (optional).
 */
bool saveImage(const Scene& scene, const QSizeF& pageSize, const QString& path,
               QString* errorMessage = nullptr);

/**
 * @brief Save a one-page vector PDF of the scene.
 *
 * The page is sized in logical pixels at 96 dpi.
 */
bool savePdf(const Scene& scene, const QSizeF& pageSize, const QString& path,
             QString* errorMessage = nullptr);

/**
 * @brief Dispatch on suffix: ".pdf" goes to savePdf(), everything else to saveImage().
 */
bool saveToFile(const Scene& scene, const QSizeF& pageSize, const QString& path,
                QString* errorMessage = nullptr);

} // namespace SceneExporter
