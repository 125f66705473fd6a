#pragma once

// ============================================================================
// LayoutImporter - Seeds a Scene from a campaign content bundle
// ============================================================================
// Captions are placed from percentage layout hints (or fixed defaults),
// converted to logical page pixels: pixel = percent / 100 * dimension.
// The base image is cover-scaled, centred and kept at the back.
//
// Importing always rebuilds the scene from scratch; edits made on the
// canvas since the previous import are discarded.
// ============================================================================

#include "CampaignContent.h"
#include "Scene.h"

#include <QImage>
#include <QSizeF>
#include <memory>

namespace LayoutImporter {

/**
 * @brief Default percentage position of a caption when no hint is given.
 *
 * Headline (10, 15), tagline (10, 25), call-to-action (10, 35).
 */
QPointF defaultHint(CaptionField field);

/**
 * @brief Percentage position used for a field: its hint or the default.
 */
QPointF resolveHint(const CampaignContent& content, CaptionField field);

/**
 * @brief Convert a percentage position to logical page pixels.
 */
QPointF percentToPage(const QPointF& percent, const QSizeF& pageSize);

/**
 * @brief Field-specific text style of an imported caption.
 */
TextStyle captionStyle(CaptionField field);

/**
 * @brief Scale that makes @p imageSize cover @p pageSize without distortion.
 *
 * Wider-than-page images are constrained by height, taller ones by width.
 * Returns 1.0 for empty sizes.
 */
qreal coverScale(const QSizeF& imageSize, const QSizeF& pageSize);

/**
 * @brief Build the centred, cover-scaled background object.
 * @return nullptr if the image is null.
 */
std::unique_ptr<ImageObject> createBackground(const QImage& image, const QSizeF& pageSize);

/**
 * @brief Build the text box of one caption.
 */
std::unique_ptr<TextBoxObject> createCaption(const CampaignContent& content,
                                             CaptionField field, const QSizeF& pageSize);

/**
 * @brief Add the three caption text boxes to the scene (front of z-order).
 */
void placeCaptions(Scene& scene, const CampaignContent& content, const QSizeF& pageSize);

/**
 * @brief Insert a decoded background image at the back of the scene.
 * @return The inserted object, or nullptr for a null image.
 */
ImageObject* placeBackground(Scene& scene, const QImage& image, const QSizeF& pageSize);

/**
 * @brief Rebuild the scene from content in one step.
 * @param scene Scene to rebuild (cleared first, new generation).
 * @param content Parsed content bundle.
 * @param pageSize Logical page size.
 * @param baseImage Already decoded background image, or a null image.
 */
void importContent(Scene& scene, const CampaignContent& content,
                   const QSizeF& pageSize, const QImage& baseImage = QImage());

} // namespace LayoutImporter
