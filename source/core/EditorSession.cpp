#include "EditorSession.h"
#include "LayoutImporter.h"

#include <QDebug>

EditorSession::EditorSession(QObject* parent)
    : QObject(parent)
    , m_selection(new SelectionController(&m_scene, this))
    , m_decoder(new ImageDecoder(this))
{
    m_pageSize = PageGeometry::resolve(m_pageSpec);

    connect(m_decoder, &ImageDecoder::decoded, this, &EditorSession::onImageDecoded);
}

EditorSession::~EditorSession()
{
    // Running decodes must not deliver into a destroyed session
    m_decoder->cancelAll();
}

// ===== Page =====

void EditorSession::setPageSpec(const PageGeometry::PageSpec& spec)
{
    if (spec == m_pageSpec) {
        return;
    }

    m_pageSpec = spec;
    m_pageSize = PageGeometry::resolve(spec);

    qDebug() << "EditorSession::setPageSpec:"
             << PageGeometry::paperSizeKey(spec.paperSize)
             << PageGeometry::orientationKey(spec.orientation) << m_pageSize;

    emit pageSizeChanged(m_pageSize);

    if (m_hasContent) {
        rebuild();
    }
}

void EditorSession::setPaperSize(PageGeometry::PaperSize size)
{
    PageGeometry::PageSpec spec = m_pageSpec;
    spec.paperSize = size;
    setPageSpec(spec);
}

void EditorSession::setOrientation(PageGeometry::Orientation orientation)
{
    PageGeometry::PageSpec spec = m_pageSpec;
    spec.orientation = orientation;
    setPageSpec(spec);
}

// ===== Content =====

void EditorSession::loadContent(const CampaignContent& content)
{
    m_content = content;
    m_hasContent = true;
    rebuild();
    emit contentLoaded();
}

void EditorSession::rebuild()
{
    m_selection->clear();

    // Captions now; the background arrives through onImageDecoded()
    LayoutImporter::importContent(m_scene, m_content, m_pageSize);

    QString background = m_content.backgroundImageB64();
    if (!background.isEmpty()) {
        m_decoder->requestBase64(background, m_scene.generation(),
                                 ImageDecoder::Purpose::Background);
    }

    emit sceneChanged();
}

void EditorSession::onImageDecoded(quint64 generation, ImageDecoder::Purpose purpose,
                                   const QImage& image)
{
    if (generation != m_scene.generation()) {
        qDebug() << "EditorSession: dropping stale decode for generation" << generation
                 << "current =" << m_scene.generation();
        return;
    }

    if (purpose == ImageDecoder::Purpose::Background) {
        if (LayoutImporter::placeBackground(m_scene, image, m_pageSize)) {
            emit sceneChanged();
        }
    } else {
        addImage(image);
    }
}

// ===== Editing Operations =====

SceneObject* EditorSession::findObject(const QString& id)
{
    return m_scene.objectById(id);
}

TextBoxObject* EditorSession::findTextBox(const QString& id)
{
    SceneObject* obj = m_scene.objectById(id);
    if (!obj || !obj->isTextBox()) {
        return nullptr;
    }
    return static_cast<TextBoxObject*>(obj);
}

SceneObject* EditorSession::insertAndSelect(std::unique_ptr<SceneObject> obj)
{
    SceneObject* ptr = m_scene.addObject(std::move(obj));
    qDebug() << "EditorSession: added" << ptr->type() << ptr->id;
    emit sceneChanged();
    m_selection->select(ptr->id);
    return ptr;
}

void EditorSession::afterMutation(const QString& id)
{
    if (m_selection->selectedId() == id) {
        m_selection->syncFromSelection();
    }
    emit sceneChanged();
}

TextBoxObject* EditorSession::addText()
{
    const std::optional<TextStyle>& form = m_selection->styleForm();
    TextStyle style = form ? *form : m_selection->templateStyle();

    auto box = std::make_unique<TextBoxObject>(tr("New text"), NEW_TEXT_WIDTH, style);
    box->position = QPointF(NEW_TEXT_X, NEW_TEXT_Y);

    return static_cast<TextBoxObject*>(insertAndSelect(std::move(box)));
}

ImageObject* EditorSession::addImage(const QImage& image)
{
    if (image.isNull()) {
        return nullptr;
    }

    auto obj = std::make_unique<ImageObject>(image);
    obj->position = QPointF(NEW_IMAGE_X, NEW_IMAGE_Y);
    obj->scale = NEW_IMAGE_SCALE;

    return static_cast<ImageObject*>(insertAndSelect(std::move(obj)));
}

void EditorSession::addImageFromFile(const QString& path)
{
    if (path.isEmpty()) {
        return;
    }
    m_decoder->requestFile(path, m_scene.generation(), ImageDecoder::Purpose::Insert);
}

bool EditorSession::deleteObject(const QString& id)
{
    if (id.isEmpty() || m_selection->selectedId() != id || !m_scene.contains(id)) {
        return false;
    }

    qDebug() << "EditorSession: deleting" << m_scene.objectById(id)->type() << id;
    m_scene.removeObject(id);
    m_selection->objectRemoved(id);
    emit sceneChanged();
    return true;
}

bool EditorSession::deleteSelected()
{
    return deleteObject(m_selection->selectedId());
}

bool EditorSession::bringToFront(const QString& id)
{
    if (!m_scene.bringToFront(id)) {
        return false;
    }
    emit sceneChanged();
    return true;
}

bool EditorSession::sendToBack(const QString& id)
{
    if (!m_scene.sendToBack(id)) {
        return false;
    }
    emit sceneChanged();
    return true;
}

bool EditorSession::flipHorizontal(const QString& id)
{
    SceneObject* obj = findObject(id);
    if (!obj) {
        return false;
    }
    obj->flipX = !obj->flipX;
    emit sceneChanged();
    return true;
}

bool EditorSession::flipVertical(const QString& id)
{
    SceneObject* obj = findObject(id);
    if (!obj) {
        return false;
    }
    obj->flipY = !obj->flipY;
    emit sceneChanged();
    return true;
}

bool EditorSession::setStyle(const QString& id, StyleField field, const QVariant& value)
{
    TextBoxObject* box = findTextBox(id);
    if (!box) {
        return false;
    }
    if (!box->style.setField(field, value)) {
        qWarning() << "EditorSession::setStyle: rejected value" << value
                   << "for" << TextStyle::fieldName(field);
        return false;
    }
    afterMutation(id);
    return true;
}

bool EditorSession::setText(const QString& id, const QString& text)
{
    TextBoxObject* box = findTextBox(id);
    if (!box) {
        return false;
    }
    box->text = text;
    afterMutation(id);
    return true;
}

bool EditorSession::moveObject(const QString& id, const QPointF& delta)
{
    SceneObject* obj = findObject(id);
    if (!obj) {
        return false;
    }
    obj->moveBy(delta);
    emit sceneChanged();
    return true;
}

// ===== Selection =====

void EditorSession::selectObject(const QString& id)
{
    m_selection->select(id);
}

void EditorSession::clearSelection()
{
    m_selection->clear();
}

bool EditorSession::editSelectedStyle(StyleField field, const QVariant& value)
{
    if (!m_selection->hasTextSelection()) {
        return false;
    }
    return setStyle(m_selection->selectedId(), field, value);
}

void EditorSession::setDefaultFontFamily(const QString& family)
{
    TextStyle style = m_selection->templateStyle();
    if (style.setField(StyleField::FontFamily, family)) {
        m_selection->setTemplateStyle(style);
    }
}
