#include "CampaignContent.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

namespace {

// Reads {"x": .., "y": ..}; both members must be numbers
bool readHint(const QJsonValue& value, QPointF* out)
{
    if (!value.isObject()) {
        return false;
    }
    QJsonObject obj = value.toObject();
    QJsonValue x = obj.value(QStringLiteral("x"));
    QJsonValue y = obj.value(QStringLiteral("y"));
    if (!x.isDouble() || !y.isDouble()) {
        return false;
    }
    *out = QPointF(x.toDouble(), y.toDouble());
    return true;
}

} // namespace

QString CampaignContent::caption(CaptionField field) const
{
    switch (field) {
        case CaptionField::Headline:     return headline;
        case CaptionField::Tagline:      return tagline;
        case CaptionField::CallToAction: return cta;
    }
    return QString();
}

QString CampaignContent::layoutKey(CaptionField field)
{
    switch (field) {
        case CaptionField::Headline:     return QStringLiteral("headline");
        case CaptionField::Tagline:      return QStringLiteral("tagline");
        case CaptionField::CallToAction: return QStringLiteral("cta_text");
    }
    return QString();
}

CampaignContent CampaignContent::fromJson(const QJsonObject& obj)
{
    CampaignContent content;

    QJsonObject captions = obj.value(QStringLiteral("captions")).toObject();
    content.headline = captions.value(QStringLiteral("headline")).toString();
    content.tagline = captions.value(QStringLiteral("tagline")).toString();
    content.cta = captions.value(QStringLiteral("cta")).toString();

    QJsonValue layoutValue = obj.value(QStringLiteral("layout_json"));
    if (layoutValue.isObject()) {
        content.hasLayoutJson = true;
        QJsonObject layout = layoutValue.toObject();

        for (CaptionField field : {CaptionField::Headline, CaptionField::Tagline,
                                   CaptionField::CallToAction}) {
            QPointF hint;
            if (readHint(layout.value(layoutKey(field)), &hint)) {
                content.layoutHints.insert(field, hint);
            }
        }

        // Some backend versions key the call-to-action hint as "cta"
        if (!content.layoutHints.contains(CaptionField::CallToAction)) {
            QPointF hint;
            if (readHint(layout.value(QStringLiteral("cta")), &hint)) {
                content.layoutHints.insert(CaptionField::CallToAction, hint);
            }
        }
    }

    const QJsonArray images = obj.value(QStringLiteral("images_b64")).toArray();
    for (const QJsonValue& image : images) {
        if (image.isString()) {
            content.imagesB64.append(image.toString());
        }
    }

    return content;
}

bool CampaignContent::loadFromFile(const QString& path, CampaignContent* out,
                                   QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Cannot open %1: %2").arg(path, file.errorString());
        }
        qWarning() << "CampaignContent::loadFromFile: cannot open" << path << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        QString reason = parseError.error != QJsonParseError::NoError
            ? parseError.errorString()
            : QObject::tr("top-level value is not an object");
        if (errorMessage) {
            *errorMessage = QObject::tr("Invalid content file %1: %2").arg(path, reason);
        }
        qWarning() << "CampaignContent::loadFromFile: invalid JSON in" << path << reason;
        return false;
    }

    *out = fromJson(doc.object());
    qDebug() << "CampaignContent::loadFromFile: loaded" << path
             << "images =" << out->imagesB64.size()
             << "hints =" << out->layoutHints.size();
    return true;
}
