// ============================================================================
// Scene - Implementation
// ============================================================================

#include "Scene.h"

#include <algorithm>

SceneObject* Scene::addObject(std::unique_ptr<SceneObject> obj)
{
    if (!obj) {
        return nullptr;
    }
    SceneObject* ptr = obj.get();
    m_objects.push_back(std::move(obj));
    return ptr;
}

SceneObject* Scene::addObjectAtBack(std::unique_ptr<SceneObject> obj)
{
    if (!obj) {
        return nullptr;
    }
    SceneObject* ptr = obj.get();
    m_objects.insert(m_objects.begin(), std::move(obj));
    return ptr;
}

bool Scene::removeObject(const QString& id)
{
    int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    m_objects.erase(m_objects.begin() + index);
    return true;
}

bool Scene::bringToFront(const QString& id)
{
    int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    auto it = m_objects.begin() + index;
    std::rotate(it, it + 1, m_objects.end());
    return true;
}

bool Scene::sendToBack(const QString& id)
{
    int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    auto it = m_objects.begin() + index;
    std::rotate(m_objects.begin(), it, it + 1);
    return true;
}

SceneObject* Scene::objectById(const QString& id)
{
    int index = indexOf(id);
    return index >= 0 ? m_objects[index].get() : nullptr;
}

const SceneObject* Scene::objectById(const QString& id) const
{
    int index = indexOf(id);
    return index >= 0 ? m_objects[index].get() : nullptr;
}

int Scene::indexOf(const QString& id) const
{
    if (id.isEmpty()) {
        return -1;
    }
    for (size_t i = 0; i < m_objects.size(); ++i) {
        if (m_objects[i]->id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

SceneObject* Scene::objectAtPoint(const QPointF& pt)
{
    // Check in reverse order (topmost first)
    for (auto it = m_objects.rbegin(); it != m_objects.rend(); ++it) {
        if ((*it)->visible && (*it)->containsPoint(pt)) {
            return it->get();
        }
    }
    return nullptr;
}

const SceneObject* Scene::objectAtPoint(const QPointF& pt) const
{
    return const_cast<Scene*>(this)->objectAtPoint(pt);
}

SceneObject* Scene::objectAt(int index)
{
    if (index < 0 || index >= objectCount()) {
        return nullptr;
    }
    return m_objects[index].get();
}

const SceneObject* Scene::objectAt(int index) const
{
    if (index < 0 || index >= objectCount()) {
        return nullptr;
    }
    return m_objects[index].get();
}

int Scene::imageCount() const
{
    return static_cast<int>(std::count_if(m_objects.begin(), m_objects.end(),
        [](const std::unique_ptr<SceneObject>& obj) { return obj->isImage(); }));
}

int Scene::textBoxCount() const
{
    return static_cast<int>(std::count_if(m_objects.begin(), m_objects.end(),
        [](const std::unique_ptr<SceneObject>& obj) { return obj->isTextBox(); }));
}

void Scene::clear()
{
    m_objects.clear();
    ++m_generation;
}

void Scene::render(QPainter& painter) const
{
    for (const auto& obj : m_objects) {
        obj->render(painter);
    }
}
