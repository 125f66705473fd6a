#pragma once

// ============================================================================
// Scene - The ordered set of drawable objects on the poster page
// ============================================================================
// Scene is a pure data class - no selection and no input handling.
// EditorSession owns the one live Scene and performs edits through it.
//
// Order is z-order: index 0 is drawn first (back-most), the last object is
// drawn on top.
// ============================================================================

#include "../objects/SceneObject.h"
#include "../objects/ImageObject.h"
#include "../objects/TextBoxObject.h"

#include <QPainter>
#include <QPointF>
#include <vector>
#include <memory>

class Scene {
public:
    Scene() = default;
    ~Scene() = default;

    // Scene is non-copyable due to unique_ptr members
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    Scene(Scene&&) = default;
    Scene& operator=(Scene&&) = default;

    // ===== Object Management =====

    /**
     * @brief Append an object at the front of the z-order.
     * @param obj The object to add (ownership transferred).
     * @return Raw pointer to the stored object.
     */
    SceneObject* addObject(std::unique_ptr<SceneObject> obj);

    /**
     * @brief Insert an object at the back of the z-order.
     */
    SceneObject* addObjectAtBack(std::unique_ptr<SceneObject> obj);

    /**
     * @brief Remove an object by ID.
     * @return True if removed, false if not found.
     */
    bool removeObject(const QString& id);

    /**
     * @brief Move an object to the end of the sequence (drawn on top).
     * @return False if the object is not in the scene.
     */
    bool bringToFront(const QString& id);

    /**
     * @brief Move an object to the start of the sequence (drawn first).
     * @return False if the object is not in the scene.
     */
    bool sendToBack(const QString& id);

    SceneObject* objectById(const QString& id);
    const SceneObject* objectById(const QString& id) const;

    /**
     * @brief Position of an object in the z-order, or -1 if absent.
     */
    int indexOf(const QString& id) const;

    bool contains(const QString& id) const { return indexOf(id) >= 0; }

    /**
     * @brief Find the topmost object at a point.
     * @param pt Point in page coordinates.
     * @return Topmost object containing the point, or nullptr.
     */
    SceneObject* objectAtPoint(const QPointF& pt);
    const SceneObject* objectAtPoint(const QPointF& pt) const;

    SceneObject* objectAt(int index);
    const SceneObject* objectAt(int index) const;

    int objectCount() const { return static_cast<int>(m_objects.size()); }
    bool isEmpty() const { return m_objects.empty(); }

    int imageCount() const;
    int textBoxCount() const;

    // ===== Lifecycle =====

    /**
     * @brief Remove every object and start a new generation.
     *
     * Asynchronous work started against an older generation must not be
     * applied to this scene any more.
     */
    void clear();

    /**
     * @brief Current rebuild generation, bumped by clear().
     */
    quint64 generation() const { return m_generation; }

    // ===== Rendering =====

    /**
     * @brief Render all objects back to front.
     * @param painter Painter in logical page coordinates.
     */
    void render(QPainter& painter) const;

private:
    std::vector<std::unique_ptr<SceneObject>> m_objects;
    quint64 m_generation = 0;
};
