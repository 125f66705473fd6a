#pragma once

// ============================================================================
// PageGeometry - Paper sizes and orientation for the poster page
// ============================================================================
// Maps a (paper size, orientation) pair to logical page pixel dimensions.
// The table is closed: the UI can only offer entries from allPaperSizes().
// ============================================================================

#include <QSizeF>
#include <QString>
#include <QVector>

namespace PageGeometry {

/**
 * @brief Supported paper sizes.
 */
enum class PaperSize {
    Letter,
    A4,
    A5,
    A6,
    Postcard
};

/**
 * @brief Page orientation. Landscape swaps width and height.
 */
enum class Orientation {
    Portrait,
    Landscape
};

/**
 * @brief The pair that fully determines the page dimensions.
 */
struct PageSpec {
    PaperSize paperSize = PaperSize::A4;
    Orientation orientation = Orientation::Portrait;

    bool operator==(const PageSpec& other) const {
        return paperSize == other.paperSize && orientation == other.orientation;
    }
    bool operator!=(const PageSpec& other) const { return !(*this == other); }
};

/**
 * @brief Base (portrait) size of a paper size in logical pixels.
 */
QSizeF baseSize(PaperSize size);

/**
 * @brief Resolve logical page dimensions.
 * @param size Paper size.
 * @param orientation Portrait keeps the base pair, landscape swaps it.
 * @return Page size in logical pixels.
 */
QSizeF resolve(PaperSize size, Orientation orientation);

inline QSizeF resolve(const PageSpec& spec) {
    return resolve(spec.paperSize, spec.orientation);
}

/**
 * @brief Resolve by paper size key (e.g. "A4").
 *
 * An unknown key is a programming error and aborts through qFatal().
 * Callers that handle user text must validate with paperSizeFromKey() first.
 */
QSizeF resolve(const QString& paperSizeKey, Orientation orientation);

/**
 * @brief Look up a paper size by its key.
 * @param key Key as shown in the UI ("Letter", "A4", ...).
 * @param ok Set to false when the key is unknown.
 */
PaperSize paperSizeFromKey(const QString& key, bool* ok = nullptr);
QString paperSizeKey(PaperSize size);

Orientation orientationFromKey(const QString& key, bool* ok = nullptr);
QString orientationKey(Orientation orientation);

/**
 * @brief All paper sizes in display order.
 */
QVector<PaperSize> allPaperSizes();

} // namespace PageGeometry
