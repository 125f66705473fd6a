#pragma once

// ============================================================================
// CampaignContent - Content bundle delivered by the generation backend
// ============================================================================
// JSON shape:
//   {
//     "layout_json": { "headline": {"x": 10, "y": 15}, ... },   (optional)
//     "captions":    { "headline": "...", "tagline": "...", "cta": "..." },
//     "images_b64":  [ "<base64 or data URL>", ... ]
//   }
// Only images_b64[0] is used, as the background image.
// ============================================================================

#include <QMap>
#include <QJsonObject>
#include <QPointF>
#include <QString>
#include <QStringList>

/**
 * @brief The three caption fields placed on the poster.
 */
enum class CaptionField {
    Headline,
    Tagline,
    CallToAction
};

/**
 * @brief Parsed content bundle.
 */
struct CampaignContent {
    QString headline;
    QString tagline;
    QString cta;

    /**
     * @brief Layout hints: percentage (0-100) positions keyed by field.
     *
     * Only well-formed entries are stored; a field without an entry uses
     * its default position.
     */
    QMap<CaptionField, QPointF> layoutHints;

    /**
     * @brief True if the bundle carried a layout_json object at all.
     */
    bool hasLayoutJson = false;

    QStringList imagesB64;

    /**
     * @brief Caption text of a field.
     */
    QString caption(CaptionField field) const;

    /**
     * @brief First image payload, or an empty string.
     */
    QString backgroundImageB64() const {
        return imagesB64.isEmpty() ? QString() : imagesB64.first();
    }

    /**
     * @brief Parse from a JSON object. Missing members stay empty.
     */
    static CampaignContent fromJson(const QJsonObject& obj);

    /**
     * @brief Read and parse a content file.
     * @param path Path to a JSON file.
     * @param out Receives the parsed content.
     * @param errorMessage Receives a description on failure (optional).
     * @return True on success.
     */
    static bool loadFromFile(const QString& path, CampaignContent* out,
                             QString* errorMessage = nullptr);

    /**
     * @brief JSON key of a field inside layout_json.
     */
    static QString layoutKey(CaptionField field);
};
