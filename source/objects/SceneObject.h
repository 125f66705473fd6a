#pragma once

// ============================================================================
// SceneObject - Abstract base class for all drawable poster objects
// ============================================================================
// The poster scene holds exactly two kinds of objects:
// - Images (ImageObject)
// - Styled text boxes (TextBoxObject)
//
// Stacking order is not stored here: it is the object's index in the Scene
// (index 0 = back-most).
// ============================================================================

#include <QString>
#include <QPointF>
#include <QSizeF>
#include <QRectF>
#include <QUuid>
#include <QPainter>

/**
 * @brief Abstract base class for objects placed on the poster page.
 *
 * Provides position, origin and flip state common to all objects.
 * Subclasses implement type-specific sizing and rendering.
 */
class SceneObject {
public:
    /**
     * @brief Which point of the object @ref position refers to.
     */
    enum class Origin {
        TopLeft,    ///< position is the top-left corner
        Center      ///< position is the center of the object
    };

    /**
     * @brief Object kind, used instead of dynamic_cast at call sites.
     */
    enum class Kind {
        Image,
        TextBox
    };

    // ===== Common Properties =====
    QString id;                       ///< UUID for tracking
    QPointF position;                 ///< Anchor position in logical page pixels
    Origin origin = Origin::TopLeft;  ///< Meaning of position
    bool flipX = false;               ///< Mirrored horizontally
    bool flipY = false;               ///< Mirrored vertically
    bool visible = true;              ///< Whether object is rendered

    SceneObject() {
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    virtual ~SceneObject() = default;

    // ===== Pure Virtual Methods =====

    virtual Kind kind() const = 0;

    /**
     * @brief Type string ("image" or "textbox") for logging.
     */
    virtual QString type() const = 0;

    /**
     * @brief Unflipped content size in logical page pixels.
     */
    virtual QSizeF size() const = 0;

    /**
     * @brief Render this object.
     * @param painter Painter whose coordinate system is logical page pixels.
     *
     * Flip and origin are applied by render(); subclasses only draw their
     * content into the local rectangle (0, 0, size()).
     */
    void render(QPainter& painter) const;

    // ===== Virtual Methods =====

    /**
     * @brief Check if a point is inside this object (hit testing).
     * @param pt Point in page coordinates.
     */
    virtual bool containsPoint(const QPointF& pt) const;

    // ===== Common Helpers =====

    /**
     * @brief Bounding rectangle in page coordinates.
     *
     * Flipping mirrors the content inside this rectangle and does not move it.
     */
    QRectF boundingRect() const;

    QPointF center() const { return boundingRect().center(); }

    void moveBy(const QPointF& delta) { position += delta; }

    bool isImage() const { return kind() == Kind::Image; }
    bool isTextBox() const { return kind() == Kind::TextBox; }

protected:
    /**
     * @brief Draw the content into the local rectangle (0, 0, size()).
     */
    virtual void renderContent(QPainter& painter) const = 0;
};
