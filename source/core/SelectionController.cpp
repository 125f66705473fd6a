#include "SelectionController.h"

SelectionController::SelectionController(const Scene* scene, QObject* parent)
    : QObject(parent)
    , m_scene(scene)
{
}

const SceneObject* SelectionController::selectedObject() const
{
    if (m_state != State::Selected || !m_scene) {
        return nullptr;
    }
    return m_scene->objectById(m_selectedId);
}

bool SelectionController::hasTextSelection() const
{
    const SceneObject* obj = selectedObject();
    return obj && obj->isTextBox();
}

void SelectionController::select(const QString& id)
{
    if (id.isEmpty() || !m_scene || !m_scene->contains(id)) {
        clear();
        return;
    }

    bool changed = (m_state != State::Selected || m_selectedId != id);
    m_state = State::Selected;
    m_selectedId = id;

    syncFromSelection();

    if (changed) {
        emit selectionChanged(m_selectedId);
    }
}

void SelectionController::clear()
{
    bool hadSelection = (m_state == State::Selected);
    bool hadForm = m_styleForm.has_value();

    m_state = State::NoSelection;
    m_selectedId.clear();
    m_styleForm.reset();

    if (hadForm) {
        emit styleFormChanged();
    }
    if (hadSelection) {
        emit selectionChanged(QString());
    }
}

void SelectionController::objectRemoved(const QString& id)
{
    if (m_state == State::Selected && m_selectedId == id) {
        clear();
    }
}

void SelectionController::syncFromSelection()
{
    const SceneObject* obj = selectedObject();
    if (!obj) {
        // The referenced object is gone; the weak reference is dead
        clear();
        return;
    }

    if (obj->isTextBox()) {
        const TextStyle& style = static_cast<const TextBoxObject*>(obj)->style;
        m_styleForm = style;
        m_templateStyle = style;
        emit styleFormChanged();
    } else if (m_styleForm.has_value()) {
        // Image selected: no style editing
        m_styleForm.reset();
        emit styleFormChanged();
    }
}
