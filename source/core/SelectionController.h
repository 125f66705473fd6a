#pragma once

// ============================================================================
// SelectionController - Single-selection state machine and style form cache
// ============================================================================
// States:
//   NoSelection  --select(id)-->  Selected(id)
//   Selected     --select(id')->  Selected(id')
//   Selected     --select("")-->  NoSelection   (click on empty canvas)
//   Selected     --objectRemoved(id)--> NoSelection
//
// The selection is a weak reference: only the object id is stored and it is
// resolved through the Scene on every use.
//
// The style form mirrors the selected text box. It is engaged only while a
// TextBox is selected; selecting an image or nothing discards it.
// ============================================================================

#include "Scene.h"
#include "../objects/TextStyle.h"

#include <QObject>
#include <QString>
#include <optional>

class SelectionController : public QObject {
    Q_OBJECT

public:
    enum class State {
        NoSelection,
        Selected
    };

    /**
     * @param scene The scene selections refer to (not owned, must outlive this).
     */
    explicit SelectionController(const Scene* scene, QObject* parent = nullptr);

    State state() const { return m_state; }
    bool hasSelection() const { return m_state == State::Selected; }

    /**
     * @brief Id of the selected object, empty in NoSelection.
     */
    QString selectedId() const { return m_selectedId; }

    /**
     * @brief The selected object, or nullptr.
     */
    const SceneObject* selectedObject() const;

    /**
     * @brief True if the selected object is a text box.
     */
    bool hasTextSelection() const;

    /**
     * @brief Cached style of the selected text box.
     *
     * nullopt while no text box is selected.
     */
    const std::optional<TextStyle>& styleForm() const { return m_styleForm; }

    /**
     * @brief Style used for new text boxes.
     *
     * Follows the form while a text box is selected and keeps the last
     * synchronized values afterwards.
     */
    const TextStyle& templateStyle() const { return m_templateStyle; }
    void setTemplateStyle(const TextStyle& style) { m_templateStyle = style; }

    /**
     * @brief Handle a selection event from the canvas.
     * @param id Selected object id; an empty id (or one that is not in the
     *           scene) means the user clicked empty canvas.
     */
    void select(const QString& id);

    /**
     * @brief Enter NoSelection and discard the style form.
     */
    void clear();

    /**
     * @brief Notify that an object left the scene.
     *
     * Clears the selection if it referred to @p id.
     */
    void objectRemoved(const QString& id);

    /**
     * @brief Re-copy the selected text box's style into the form.
     *
     * Called after every mutation of the selected object so form and object
     * never diverge.
     */
    void syncFromSelection();

signals:
    /**
     * @brief Emitted on every state transition.
     * @param id The newly selected id, or empty for NoSelection.
     */
    void selectionChanged(const QString& id);

    /**
     * @brief Emitted when the style form is engaged, changed or discarded.
     */
    void styleFormChanged();

private:
    const Scene* m_scene = nullptr;
    State m_state = State::NoSelection;
    QString m_selectedId;
    std::optional<TextStyle> m_styleForm;
    TextStyle m_templateStyle;
};
