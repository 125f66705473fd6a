#pragma once

// ============================================================================
// EditorSession - Owns the live poster scene and all edits made to it
// ============================================================================
// EditorSession is the single entry point for mutating the Scene:
// - Content import (full rebuild on content/page changes)
// - Editing operations (add, delete, reorder, flip, restyle, move)
// - Selection events, forwarded to SelectionController
// - Async image decodes, applied only to the generation that requested them
//
// Every operation is one synchronous scene update followed by sceneChanged().
// Operations on ids that are not in the scene are silent no-ops that
// return false.
// ============================================================================

#include "Scene.h"
#include "PageGeometry.h"
#include "CampaignContent.h"
#include "ImageDecoder.h"
#include "SelectionController.h"

#include <QObject>
#include <QImage>
#include <QSizeF>
#include <QVariant>

class EditorSession : public QObject {
    Q_OBJECT

public:
    // Placement of objects created from the controls
    static constexpr qreal NEW_TEXT_X = 100.0;
    static constexpr qreal NEW_TEXT_Y = 100.0;
    static constexpr qreal NEW_TEXT_WIDTH = 300.0;
    static constexpr qreal NEW_IMAGE_X = 50.0;
    static constexpr qreal NEW_IMAGE_Y = 50.0;
    static constexpr qreal NEW_IMAGE_SCALE = 0.5;

    explicit EditorSession(QObject* parent = nullptr);
    ~EditorSession() override;

    // ===== Accessors =====

    const Scene& scene() const { return m_scene; }
    SelectionController* selection() const { return m_selection; }
    ImageDecoder* decoder() const { return m_decoder; }

    PageGeometry::PageSpec pageSpec() const { return m_pageSpec; }
    QSizeF pageSize() const { return m_pageSize; }

    bool hasContent() const { return m_hasContent; }
    const CampaignContent& content() const { return m_content; }

    // ===== Page =====

    /**
     * @brief Change paper size and/or orientation.
     *
     * Re-resolves the page size and, if content is loaded, rebuilds the
     * scene from it. Unsaved canvas edits are discarded by the rebuild.
     */
    void setPageSpec(const PageGeometry::PageSpec& spec);
    void setPaperSize(PageGeometry::PaperSize size);
    void setOrientation(PageGeometry::Orientation orientation);

    // ===== Content =====

    /**
     * @brief Replace the content and rebuild the scene from it.
     *
     * Captions appear immediately; the background image is added when its
     * asynchronous decode completes.
     */
    void loadContent(const CampaignContent& content);

    /**
     * @brief Rebuild the scene from the current content.
     */
    void rebuild();

    // ===== Editing Operations =====

    /**
     * @brief Add a "New text" box styled from the style form.
     * @return The new text box, which is also the new selection.
     */
    TextBoxObject* addText();

    /**
     * @brief Add an image at the front of the z-order and select it.
     * @return The new object, or nullptr for a null image.
     */
    ImageObject* addImage(const QImage& image);

    /**
     * @brief Decode an image file asynchronously, then addImage() it.
     *
     * The result is dropped if the scene was rebuilt in the meantime.
     */
    void addImageFromFile(const QString& path);

    /**
     * @brief Delete an object. No-op unless it exists and is selected.
     */
    bool deleteObject(const QString& id);

    /**
     * @brief Delete the current selection, if any.
     */
    bool deleteSelected();

    bool bringToFront(const QString& id);
    bool sendToBack(const QString& id);

    /**
     * @brief Toggle the horizontal flip flag.
     */
    bool flipHorizontal(const QString& id);

    /**
     * @brief Toggle the vertical flip flag.
     */
    bool flipVertical(const QString& id);

    /**
     * @brief Set one style attribute of a text box.
     * @return False for images, unknown ids or values of the wrong type.
     */
    bool setStyle(const QString& id, StyleField field, const QVariant& value);

    /**
     * @brief Replace the text content of a text box.
     */
    bool setText(const QString& id, const QString& text);

    /**
     * @brief Translate an object by a delta in page pixels.
     */
    bool moveObject(const QString& id, const QPointF& delta);

    // ===== Selection =====

    /**
     * @brief Canvas selection event; an empty id clears the selection.
     */
    void selectObject(const QString& id);
    void clearSelection();

    /**
     * @brief Push a style form edit to the selected text box.
     */
    bool editSelectedStyle(StyleField field, const QVariant& value);

    /**
     * @brief Font family used for new text boxes while nothing is selected.
     */
    void setDefaultFontFamily(const QString& family);

signals:
    /**
     * @brief Emitted after every scene mutation.
     */
    void sceneChanged();

    /**
     * @brief Emitted when the logical page size changes.
     */
    void pageSizeChanged(const QSizeF& pageSize);

    /**
     * @brief Emitted when a new content bundle has been loaded.
     */
    void contentLoaded();

private slots:
    void onImageDecoded(quint64 generation, ImageDecoder::Purpose purpose, const QImage& image);

private:
    SceneObject* findObject(const QString& id);
    TextBoxObject* findTextBox(const QString& id);
    SceneObject* insertAndSelect(std::unique_ptr<SceneObject> obj);
    void afterMutation(const QString& id);

    Scene m_scene;
    SelectionController* m_selection = nullptr;
    ImageDecoder* m_decoder = nullptr;

    PageGeometry::PageSpec m_pageSpec;
    QSizeF m_pageSize;

    CampaignContent m_content;
    bool m_hasContent = false;
};
