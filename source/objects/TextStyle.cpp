#include "TextStyle.h"

#include <QtGlobal>
#include <cmath>
#include <initializer_list>
#include <utility>

namespace {

bool toColor(const QVariant& value, QColor* out)
{
    QColor color;
    if (value.userType() == QMetaType::QColor) {
        color = value.value<QColor>();
    } else if (value.userType() == QMetaType::QString) {
        color = QColor(value.toString());
    }
    if (!color.isValid()) {
        return false;
    }
    *out = color;
    return true;
}

bool toNumber(const QVariant& value, qreal* out)
{
    bool ok = false;
    qreal number = value.toDouble(&ok);
    if (!ok || !std::isfinite(number)) {
        return false;
    }
    *out = number;
    return true;
}

bool toBool(const QVariant& value, bool* out)
{
    if (value.userType() == QMetaType::Bool) {
        *out = value.toBool();
        return true;
    }
    if (value.userType() == QMetaType::QString) {
        const QString s = value.toString();
        if (s == QLatin1String("true")) { *out = true; return true; }
        if (s == QLatin1String("false")) { *out = false; return true; }
        return false;
    }
    bool ok = false;
    int n = value.toInt(&ok);
    if (!ok) {
        return false;
    }
    *out = n != 0;
    return true;
}

// Accepts either the lowercase key or the underlying integer value
template <typename Enum>
bool toEnum(const QVariant& value, std::initializer_list<std::pair<const char*, Enum>> keys, Enum* out)
{
    if (value.userType() == QMetaType::QString) {
        const QString s = value.toString().toLower();
        for (const auto& entry : keys) {
            if (s == QLatin1String(entry.first)) {
                *out = entry.second;
                return true;
            }
        }
        return false;
    }
    bool ok = false;
    int n = value.toInt(&ok);
    if (!ok || n < 0 || n >= static_cast<int>(keys.size())) {
        return false;
    }
    *out = static_cast<Enum>(n);
    return true;
}

} // namespace

QColor TextStyle::effectiveBackground() const
{
    QColor c = backgroundColor;
    c.setAlphaF(qBound(0.0, backgroundOpacity, 1.0));
    return c;
}

QFont TextStyle::font() const
{
    QFont f(fontFamily);
    f.setPixelSize(fontSize);
    f.setBold(weight == Weight::Bold);
    f.setItalic(slant == Slant::Italic);
    f.setUnderline(underline);
    return f;
}

QVariant TextStyle::field(StyleField f) const
{
    switch (f) {
        case StyleField::FontFamily:        return fontFamily;
        case StyleField::FontSize:          return fontSize;
        case StyleField::FontWeight:        return weightKey(weight);
        case StyleField::FontStyle:         return slantKey(slant);
        case StyleField::Underline:         return underline;
        case StyleField::Alignment:         return alignKey(alignment);
        case StyleField::FillColor:         return fillColor;
        case StyleField::StrokeColor:       return strokeColor;
        case StyleField::StrokeWidth:       return strokeWidth;
        case StyleField::BackgroundColor:   return backgroundColor;
        case StyleField::BackgroundOpacity: return backgroundOpacity;
        case StyleField::ShadowColor:       return shadowColor;
        case StyleField::ShadowBlur:        return shadowBlur;
    }
    return QVariant();
}

bool TextStyle::setField(StyleField f, const QVariant& value)
{
    if (!value.isValid()) {
        return false;
    }

    qreal number = 0;
    switch (f) {
        case StyleField::FontFamily: {
            QString family = value.toString().trimmed();
            if (family.isEmpty()) {
                return false;
            }
            fontFamily = family;
            return true;
        }
        case StyleField::FontSize:
            if (!toNumber(value, &number)) {
                return false;
            }
            // Clamp before rounding: the int conversion is only defined in range
            fontSize = qRound(qBound(qreal(MIN_FONT_SIZE), number, qreal(MAX_FONT_SIZE)));
            return true;
        case StyleField::FontWeight:
            return toEnum(value, {{"normal", Weight::Normal}, {"bold", Weight::Bold}}, &weight);
        case StyleField::FontStyle:
            return toEnum(value, {{"normal", Slant::Normal}, {"italic", Slant::Italic}}, &slant);
        case StyleField::Underline:
            return toBool(value, &underline);
        case StyleField::Alignment:
            return toEnum(value, {{"left", Align::Left}, {"center", Align::Center},
                                  {"right", Align::Right}}, &alignment);
        case StyleField::FillColor:
            return toColor(value, &fillColor);
        case StyleField::StrokeColor:
            return toColor(value, &strokeColor);
        case StyleField::StrokeWidth:
            if (!toNumber(value, &number)) {
                return false;
            }
            strokeWidth = qBound(0.0, number, MAX_STROKE_WIDTH);
            return true;
        case StyleField::BackgroundColor: {
            // Opacity is an independent channel: keep only the RGB part
            QColor c;
            if (!toColor(value, &c)) {
                return false;
            }
            backgroundColor = QColor(c.red(), c.green(), c.blue());
            return true;
        }
        case StyleField::BackgroundOpacity:
            if (!toNumber(value, &number)) {
                return false;
            }
            backgroundOpacity = qBound(0.0, number, 1.0);
            return true;
        case StyleField::ShadowColor:
            return toColor(value, &shadowColor);
        case StyleField::ShadowBlur:
            if (!toNumber(value, &number)) {
                return false;
            }
            shadowBlur = qRound(qBound(0.0, number, qreal(MAX_SHADOW_BLUR)));
            return true;
    }
    return false;
}

bool TextStyle::operator==(const TextStyle& other) const
{
    return fontFamily == other.fontFamily
        && fontSize == other.fontSize
        && weight == other.weight
        && slant == other.slant
        && underline == other.underline
        && alignment == other.alignment
        && fillColor == other.fillColor
        && strokeColor == other.strokeColor
        && qFuzzyCompare(strokeWidth + 1.0, other.strokeWidth + 1.0)
        && backgroundColor == other.backgroundColor
        && qFuzzyCompare(backgroundOpacity + 1.0, other.backgroundOpacity + 1.0)
        && shadowColor == other.shadowColor
        && shadowBlur == other.shadowBlur;
}

QString TextStyle::fieldName(StyleField f)
{
    switch (f) {
        case StyleField::FontFamily:        return QStringLiteral("fontFamily");
        case StyleField::FontSize:          return QStringLiteral("fontSize");
        case StyleField::FontWeight:        return QStringLiteral("fontWeight");
        case StyleField::FontStyle:         return QStringLiteral("fontStyle");
        case StyleField::Underline:         return QStringLiteral("underline");
        case StyleField::Alignment:         return QStringLiteral("textAlign");
        case StyleField::FillColor:         return QStringLiteral("fill");
        case StyleField::StrokeColor:       return QStringLiteral("stroke");
        case StyleField::StrokeWidth:       return QStringLiteral("strokeWidth");
        case StyleField::BackgroundColor:   return QStringLiteral("backgroundColor");
        case StyleField::BackgroundOpacity: return QStringLiteral("backgroundOpacity");
        case StyleField::ShadowColor:       return QStringLiteral("shadowColor");
        case StyleField::ShadowBlur:        return QStringLiteral("shadowBlur");
    }
    return QString();
}

QString TextStyle::weightKey(Weight w)
{
    return w == Weight::Bold ? QStringLiteral("bold") : QStringLiteral("normal");
}

QString TextStyle::slantKey(Slant s)
{
    return s == Slant::Italic ? QStringLiteral("italic") : QStringLiteral("normal");
}

QString TextStyle::alignKey(Align a)
{
    switch (a) {
        case Align::Left:   return QStringLiteral("left");
        case Align::Center: return QStringLiteral("center");
        case Align::Right:  return QStringLiteral("right");
    }
    return QString();
}
