#pragma once

// ============================================================================
// TextStyle - Editable style attributes of a text box
// ============================================================================
// The same struct is used for the attributes stored on a TextBoxObject and
// for the style form that mirrors the selected text box, so copying one into
// the other is a plain assignment.
// ============================================================================

#include <QColor>
#include <QFont>
#include <QString>
#include <QVariant>

/**
 * @brief Names of the individually editable style attributes.
 */
enum class StyleField {
    FontFamily,
    FontSize,
    FontWeight,
    FontStyle,
    Underline,
    Alignment,
    FillColor,
    StrokeColor,
    StrokeWidth,
    BackgroundColor,
    BackgroundOpacity,
    ShadowColor,
    ShadowBlur
};

struct TextStyle {
    enum class Weight { Normal, Bold };
    enum class Slant { Normal, Italic };
    enum class Align { Left, Center, Right };

    // UI ranges; setField() clamps numeric values into them
    static constexpr int MIN_FONT_SIZE = 8;
    static constexpr int MAX_FONT_SIZE = 80;
    static constexpr qreal MAX_STROKE_WIDTH = 5.0;
    static constexpr int MAX_SHADOW_BLUR = 20;

    QString fontFamily = QStringLiteral("Helvetica");
    int fontSize = 24;
    Weight weight = Weight::Normal;
    Slant slant = Slant::Normal;
    bool underline = false;
    Align alignment = Align::Left;
    QColor fillColor = QColor(0xff, 0xff, 0xff);
    QColor strokeColor = QColor(0, 0, 0);
    qreal strokeWidth = 0.0;
    QColor backgroundColor = QColor(0, 0, 0);
    qreal backgroundOpacity = 0.0;   ///< 0 = transparent background
    QColor shadowColor = QColor(0, 0, 0);
    int shadowBlur = 0;              ///< 0 = no shadow

    bool hasShadow() const { return shadowBlur > 0; }

    /**
     * @brief Background colour with backgroundOpacity applied as alpha.
     */
    QColor effectiveBackground() const;

    /**
     * @brief QFont built from family, size, weight, slant and underline.
     */
    QFont font() const;

    /**
     * @brief Read one attribute as a QVariant.
     *
     * Enumerations are returned as their lowercase keys ("bold", "center").
     */
    QVariant field(StyleField f) const;

    /**
     * @brief Set exactly one attribute.
     * @param f The attribute to change.
     * @param value New value. Enumerations accept their key or int value,
     *              colours accept QColor or a colour name such as "#00bfff".
     * @return False if the value has the wrong type; nothing is changed then.
     */
    bool setField(StyleField f, const QVariant& value);

    bool operator==(const TextStyle& other) const;
    bool operator!=(const TextStyle& other) const { return !(*this == other); }

    // ===== Key helpers =====
    static QString fieldName(StyleField f);
    static QString weightKey(Weight w);
    static QString slantKey(Slant s);
    static QString alignKey(Align a);
};
