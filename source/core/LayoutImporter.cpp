#include "LayoutImporter.h"

#include <QDebug>

namespace LayoutImporter {

// Imported captions wrap at this fraction of the page width
static constexpr qreal CAPTION_WIDTH_FRACTION = 0.8;

QPointF defaultHint(CaptionField field)
{
    switch (field) {
        case CaptionField::Headline:     return QPointF(10, 15);
        case CaptionField::Tagline:      return QPointF(10, 25);
        case CaptionField::CallToAction: return QPointF(10, 35);
    }
    return QPointF(10, 15);
}

QPointF resolveHint(const CampaignContent& content, CaptionField field)
{
    return content.layoutHints.value(field, defaultHint(field));
}

QPointF percentToPage(const QPointF& percent, const QSizeF& pageSize)
{
    return QPointF(percent.x() / 100.0 * pageSize.width(),
                   percent.y() / 100.0 * pageSize.height());
}

TextStyle captionStyle(CaptionField field)
{
    TextStyle style;
    style.fontSize = 24;
    style.fillColor = QColor(0xff, 0xff, 0xff);
    style.backgroundOpacity = 0.0;

    switch (field) {
        case CaptionField::Headline:
            style.weight = TextStyle::Weight::Bold;
            style.fontSize = 36;
            break;
        case CaptionField::Tagline:
            style.slant = TextStyle::Slant::Italic;
            style.fontSize = 24;
            break;
        case CaptionField::CallToAction:
            style.fillColor = QColor(0x00, 0xbf, 0xff);
            style.fontSize = 20;
            break;
    }
    return style;
}

qreal coverScale(const QSizeF& imageSize, const QSizeF& pageSize)
{
    if (imageSize.isEmpty() || pageSize.isEmpty()) {
        return 1.0;
    }

    qreal imageAspect = imageSize.width() / imageSize.height();
    qreal pageAspect = pageSize.width() / pageSize.height();

    // Wider than the page: match heights and crop the sides, else match widths
    return imageAspect > pageAspect ? pageSize.height() / imageSize.height()
                                    : pageSize.width() / imageSize.width();
}

std::unique_ptr<ImageObject> createBackground(const QImage& image, const QSizeF& pageSize)
{
    if (image.isNull()) {
        return nullptr;
    }

    auto background = std::make_unique<ImageObject>(image);
    background->origin = SceneObject::Origin::Center;
    background->scale = coverScale(QSizeF(image.size()), pageSize);
    background->position = QPointF(pageSize.width() / 2.0, pageSize.height() / 2.0);
    return background;
}

std::unique_ptr<TextBoxObject> createCaption(const CampaignContent& content,
                                             CaptionField field, const QSizeF& pageSize)
{
    auto box = std::make_unique<TextBoxObject>(content.caption(field),
                                               pageSize.width() * CAPTION_WIDTH_FRACTION,
                                               captionStyle(field));
    box->origin = SceneObject::Origin::TopLeft;
    box->position = percentToPage(resolveHint(content, field), pageSize);
    return box;
}

void placeCaptions(Scene& scene, const CampaignContent& content, const QSizeF& pageSize)
{
    if (!content.hasLayoutJson) {
        qDebug() << "LayoutImporter::placeCaptions: no layout_json, using default positions";
    }
    for (CaptionField field : {CaptionField::Headline, CaptionField::Tagline,
                               CaptionField::CallToAction}) {
        scene.addObject(createCaption(content, field, pageSize));
    }
}

ImageObject* placeBackground(Scene& scene, const QImage& image, const QSizeF& pageSize)
{
    std::unique_ptr<ImageObject> background = createBackground(image, pageSize);
    if (!background) {
        return nullptr;
    }
    return static_cast<ImageObject*>(scene.addObjectAtBack(std::move(background)));
}

void importContent(Scene& scene, const CampaignContent& content,
                   const QSizeF& pageSize, const QImage& baseImage)
{
    scene.clear();

    placeBackground(scene, baseImage, pageSize);
    placeCaptions(scene, content, pageSize);

    qDebug() << "LayoutImporter::importContent: page =" << pageSize
             << "objects =" << scene.objectCount()
             << "generation =" << scene.generation();
}

} // namespace LayoutImporter
