#pragma once

// ============================================================================
// TextStyleTests - Unit tests for TextStyle attribute editing
// ============================================================================
// Simple tests for the style form value type:
// - Defaults match the style form defaults
// - setField() accepts keys, ints, colour names and clamps numbers
// - Rejected values leave the style unchanged
// - Rendering a styled text box draws something
//
// Run with: posterstudio --test-style
// ============================================================================

#include "TextStyle.h"
#include "TextBoxObject.h"
#include <QDebug>
#include <QImage>
#include <QPainter>
#include <cmath>
#include <limits>

namespace TextStyleTests {

inline bool check(bool condition, const char* what)
{
    if (!condition) {
        qWarning() << "  FAIL:" << what;
    }
    return condition;
}

inline bool testDefaults()
{
    qDebug() << "=== Test: TextStyle Defaults ===";

    TextStyle style;
    bool ok = true;
    ok &= check(style.fontFamily == QLatin1String("Helvetica"), "font family");
    ok &= check(style.fontSize == 24, "font size");
    ok &= check(style.weight == TextStyle::Weight::Normal, "weight");
    ok &= check(style.slant == TextStyle::Slant::Normal, "slant");
    ok &= check(!style.underline, "underline");
    ok &= check(style.alignment == TextStyle::Align::Left, "alignment");
    ok &= check(style.fillColor == QColor("#ffffff"), "fill");
    ok &= check(style.strokeColor == QColor("#000000"), "stroke colour");
    ok &= check(style.strokeWidth == 0.0, "stroke width");
    ok &= check(style.backgroundColor == QColor("#000000"), "background");
    ok &= check(style.backgroundOpacity == 0.0, "background opacity");
    ok &= check(!style.hasShadow(), "shadow");
    ok &= check(style.effectiveBackground().alpha() == 0, "transparent background");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool testSetFieldConversions()
{
    qDebug() << "=== Test: TextStyle setField Conversions ===";

    TextStyle style;
    bool ok = true;

    ok &= check(style.setField(StyleField::FontWeight, QStringLiteral("bold")), "weight key");
    ok &= check(style.weight == TextStyle::Weight::Bold, "weight applied");
    ok &= check(style.field(StyleField::FontWeight).toString() == QLatin1String("bold"), "weight read back");

    ok &= check(style.setField(StyleField::FontStyle, 1), "slant int");
    ok &= check(style.slant == TextStyle::Slant::Italic, "slant applied");

    ok &= check(style.setField(StyleField::Alignment, QStringLiteral("Center")), "align key");
    ok &= check(style.alignment == TextStyle::Align::Center, "align applied");

    ok &= check(style.setField(StyleField::StrokeColor, QStringLiteral("#00bfff")), "colour name");
    ok &= check(style.strokeColor == QColor(0x00, 0xbf, 0xff), "colour applied");

    ok &= check(style.setField(StyleField::Underline, true), "underline");
    ok &= check(style.underline, "underline applied");

    // Background alpha is carried by backgroundOpacity only
    ok &= check(style.setField(StyleField::BackgroundColor, QColor(10, 20, 30, 40)), "background colour");
    ok &= check(style.backgroundColor.alpha() == 255, "background rgb only");
    ok &= check(style.setField(StyleField::BackgroundOpacity, 0.5), "background opacity");
    ok &= check(style.effectiveBackground().alpha() == 128 || style.effectiveBackground().alpha() == 127,
                "effective background alpha");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool testClamping()
{
    qDebug() << "=== Test: TextStyle Clamping ===";

    TextStyle style;
    bool ok = true;

    style.setField(StyleField::FontSize, 2);
    ok &= check(style.fontSize == TextStyle::MIN_FONT_SIZE, "font size min");
    style.setField(StyleField::FontSize, 1000);
    ok &= check(style.fontSize == TextStyle::MAX_FONT_SIZE, "font size max");
    style.setField(StyleField::StrokeWidth, 9.5);
    ok &= check(style.strokeWidth == TextStyle::MAX_STROKE_WIDTH, "stroke width max");
    style.setField(StyleField::ShadowBlur, -4);
    ok &= check(style.shadowBlur == 0, "shadow blur min");
    style.setField(StyleField::BackgroundOpacity, 3.0);
    ok &= check(style.backgroundOpacity == 1.0, "opacity max");

    // Far outside the int range still clamps to the nearest bound
    ok &= check(style.setField(StyleField::FontSize, 1e12), "huge font size accepted");
    ok &= check(style.fontSize == TextStyle::MAX_FONT_SIZE, "huge font size clamps to max");
    ok &= check(style.setField(StyleField::FontSize, -1e12), "negative font size accepted");
    ok &= check(style.fontSize == TextStyle::MIN_FONT_SIZE, "negative font size clamps to min");
    ok &= check(style.setField(StyleField::ShadowBlur, 1e12), "huge blur accepted");
    ok &= check(style.shadowBlur == TextStyle::MAX_SHADOW_BLUR, "huge blur clamps to max");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool testRejectedValues()
{
    qDebug() << "=== Test: TextStyle Rejected Values ===";

    TextStyle style;
    const TextStyle original = style;
    bool ok = true;

    ok &= check(!style.setField(StyleField::FontWeight, QStringLiteral("heavy")), "unknown weight");
    ok &= check(!style.setField(StyleField::Alignment, 7), "alignment out of range");
    ok &= check(!style.setField(StyleField::FillColor, QStringLiteral("nope")), "bad colour");
    ok &= check(!style.setField(StyleField::FontSize, QStringLiteral("large")), "non-numeric size");
    ok &= check(!style.setField(StyleField::FontFamily, QStringLiteral("  ")), "empty family");
    ok &= check(!style.setField(StyleField::ShadowBlur, QVariant()), "invalid variant");
    ok &= check(!style.setField(StyleField::FontSize, std::nan("")), "NaN font size");
    ok &= check(!style.setField(StyleField::ShadowBlur, std::numeric_limits<double>::infinity()),
                "infinite blur");
    ok &= check(!style.setField(StyleField::StrokeWidth, std::nan("")), "NaN stroke width");
    ok &= check(style == original, "style unchanged");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

/**
 * @brief Render a styled text box and verify that ink and background appear.
 */
inline bool testRenderStyledBox()
{
    qDebug() << "=== Test: Styled TextBox Rendering ===";

    TextStyle style;
    style.fillColor = Qt::white;
    style.backgroundColor = Qt::red;
    style.backgroundOpacity = 1.0;
    style.strokeWidth = 1.0;
    style.shadowBlur = 6;

    TextBoxObject box(QStringLiteral("Sale"), 200.0, style);
    box.position = QPointF(10, 10);

    QImage image(240, 120, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    QPainter painter(&image);
    box.render(painter);
    painter.end();

    bool ok = true;
    // Background fills the box area
    ok &= check(image.pixelColor(200, 15).red() > 200, "background drawn");
    ok &= check(image.pixelColor(5, 5).alpha() == 0, "nothing outside the box");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

/**
 * @brief Run all TextStyle tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    bool allPass = true;
    allPass &= testDefaults();
    allPass &= testSetFieldConversions();
    allPass &= testClamping();
    allPass &= testRejectedValues();
    allPass &= testRenderStyledBox();

    qDebug() << "";
    qDebug() << (allPass ? "All TextStyle tests PASSED" : "Some TextStyle tests FAILED");
    return allPass;
}

} // namespace TextStyleTests
