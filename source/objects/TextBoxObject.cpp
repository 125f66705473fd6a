// ============================================================================
// TextBoxObject - Implementation
// ============================================================================

#include "TextBoxObject.h"

#include <QFontMetricsF>
#include <QTextLayout>
#include <QTextOption>

QVector<TextBoxObject::Line> TextBoxObject::layoutLines() const
{
    QVector<Line> lines;

    QFont font = style.font();
    font.setUnderline(false);  // Drawn separately, see renderContent()

    QString content = text;
    content.replace(QLatin1Char('\n'), QChar::LineSeparator);

    QTextLayout layout(content, font);
    QTextOption option;
    option.setWrapMode(QTextOption::WrapAtWordBoundaryOrAnywhere);
    layout.setTextOption(option);

    layout.beginLayout();
    qreal y = 0;
    while (true) {
        QTextLine line = layout.createLine();
        if (!line.isValid()) {
            break;
        }
        line.setLineWidth(width);
        line.setPosition(QPointF(0, y));

        Line out;
        out.text = content.mid(line.textStart(), line.textLength());
        out.text.remove(QChar::LineSeparator);
        out.width = line.naturalTextWidth();

        qreal x = 0;
        switch (style.alignment) {
            case TextStyle::Align::Left:   x = 0; break;
            case TextStyle::Align::Center: x = (width - out.width) / 2.0; break;
            case TextStyle::Align::Right:  x = width - out.width; break;
        }
        out.baseline = QPointF(x, y + line.ascent());
        lines.append(out);

        y += line.height();
    }
    layout.endLayout();

    return lines;
}

QSizeF TextBoxObject::size() const
{
    QFont font = style.font();
    QFontMetricsF metrics(font);

    QVector<Line> lines = layoutLines();
    if (lines.isEmpty()) {
        return QSizeF(width, metrics.height());
    }

    qreal height = lines.size() * metrics.lineSpacing();
    return QSizeF(width, qMax(height, metrics.height()));
}

QPainterPath TextBoxObject::textPath(const QVector<Line>& lines) const
{
    QFont font = style.font();
    font.setUnderline(false);

    QPainterPath path;
    for (const Line& line : lines) {
        path.addText(line.baseline, font, line.text);
    }
    return path;
}

void TextBoxObject::renderContent(QPainter& painter) const
{
    const QSizeF boxSize = size();
    const QVector<Line> lines = layoutLines();
    const QPainterPath path = textPath(lines);

    painter.setRenderHint(QPainter::Antialiasing, true);

    // Background
    QColor background = style.effectiveBackground();
    if (background.alpha() > 0) {
        painter.fillRect(QRectF(QPointF(0, 0), boxSize), background);
    }

    // Shadow: widening translucent strokes approximate the blur radius
    if (style.hasShadow()) {
        QColor glow = style.shadowColor;
        glow.setAlphaF(0.12);
        int step = qMax(1, style.shadowBlur / 6);
        for (int radius = style.shadowBlur; radius >= 1; radius -= step) {
            painter.strokePath(path, QPen(glow, radius, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
        }
    }

    painter.fillPath(path, style.fillColor);

    if (style.strokeWidth > 0) {
        painter.strokePath(path, QPen(style.strokeColor, style.strokeWidth,
                                      Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    }

    if (style.underline) {
        QFontMetricsF metrics(style.font());
        QPen pen(style.fillColor, qMax<qreal>(1.0, metrics.lineWidth()));
        painter.setPen(pen);
        for (const Line& line : lines) {
            qreal y = line.baseline.y() + metrics.underlinePos();
            painter.drawLine(QPointF(line.baseline.x(), y),
                             QPointF(line.baseline.x() + line.width, y));
        }
    }
}
