#pragma once

// ============================================================================
// TextBoxObject - A styled, word-wrapped text box on the poster page
// ============================================================================
// The box has a fixed wrap width; its height follows from the laid-out text.
// Rendering draws, back to front: background fill, shadow, text fill,
// text stroke, underline.
// ============================================================================

#include "SceneObject.h"
#include "TextStyle.h"

#include <QPainterPath>
#include <QVector>

class TextBoxObject : public SceneObject {
public:
    QString text;          ///< Text content ('\n' starts a new line)
    qreal width = 300.0;   ///< Wrap width in logical page pixels
    TextStyle style;       ///< All editable style attributes

    TextBoxObject(const QString& content, qreal boxWidth, const TextStyle& textStyle)
        : text(content), width(boxWidth), style(textStyle) {}

    // ===== SceneObject Interface =====

    Kind kind() const override { return Kind::TextBox; }

    QString type() const override { return QStringLiteral("textbox"); }

    /**
     * @brief Wrap width by laid-out text height.
     */
    QSizeF size() const override;

    /**
     * @brief One laid-out line of text, in local box coordinates.
     */
    struct Line {
        QString text;
        QPointF baseline;   ///< Left end of the baseline after alignment
        qreal width = 0;    ///< Natural width of the line
    };

    /**
     * @brief Lay out the text with the current font, width and alignment.
     */
    QVector<Line> layoutLines() const;

protected:
    void renderContent(QPainter& painter) const override;

private:
    QPainterPath textPath(const QVector<Line>& lines) const;
};
