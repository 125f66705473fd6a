#ifndef LAYOUTIMPORTERTESTS_H
#define LAYOUTIMPORTERTESTS_H

#include <QObject>
#include <QTest>
#include <QBuffer>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QFile>
#include "LayoutImporter.h"
#include "CampaignContent.h"
#include "ImageDecoder.h"
#include "PageGeometry.h"

/**
 * Unit tests for content parsing, caption placement and background cover.
 * Run with: posterstudio --test-importer
 */
class LayoutImporterTests : public QObject {
    Q_OBJECT

private:
    static QJsonObject hint(qreal x, qreal y) {
        QJsonObject obj;
        obj.insert("x", x);
        obj.insert("y", y);
        return obj;
    }

    static CampaignContent sampleContent() {
        CampaignContent content;
        content.headline = QStringLiteral("Spring Sale");
        content.tagline = QStringLiteral("Everything must go");
        content.cta = QStringLiteral("Shop now");
        return content;
    }

    static QString encodeImage(const QImage& image, const char* format) {
        QByteArray bytes;
        QBuffer buffer(&bytes);
        buffer.open(QIODevice::WriteOnly);
        image.save(&buffer, format);
        return QString::fromLatin1(bytes.toBase64());
    }

    static QList<const TextBoxObject*> textBoxes(const Scene& scene) {
        QList<const TextBoxObject*> boxes;
        for (int i = 0; i < scene.objectCount(); ++i) {
            const SceneObject* obj = scene.objectAt(i);
            if (obj->isTextBox()) {
                boxes.append(static_cast<const TextBoxObject*>(obj));
            }
        }
        return boxes;
    }

    static bool closeTo(const QPointF& a, const QPointF& b) {
        return qAbs(a.x() - b.x()) < 1e-6 && qAbs(a.y() - b.y()) < 1e-6;
    }

private slots:
    // ===== CampaignContent =====

    void testParseFullContent() {
        QJsonObject captions;
        captions.insert("headline", "H");
        captions.insert("tagline", "T");
        captions.insert("cta", "C");

        QJsonObject layout;
        layout.insert("headline", hint(20, 30));
        layout.insert("cta_text", hint(50, 90));

        QJsonObject root;
        root.insert("captions", captions);
        root.insert("layout_json", layout);
        root.insert("images_b64", QJsonArray({"AAAA", "BBBB"}));

        CampaignContent content = CampaignContent::fromJson(root);
        QCOMPARE(content.headline, QString("H"));
        QCOMPARE(content.caption(CaptionField::CallToAction), QString("C"));
        QVERIFY(content.hasLayoutJson);
        QCOMPARE(content.layoutHints.value(CaptionField::Headline), QPointF(20, 30));
        QCOMPARE(content.layoutHints.value(CaptionField::CallToAction), QPointF(50, 90));
        QVERIFY(!content.layoutHints.contains(CaptionField::Tagline));
        QCOMPARE(content.backgroundImageB64(), QString("AAAA"));
    }

    void testParseMinimalContent() {
        CampaignContent content = CampaignContent::fromJson(QJsonObject());
        QVERIFY(content.headline.isEmpty());
        QVERIFY(!content.hasLayoutJson);
        QVERIFY(content.layoutHints.isEmpty());
        QVERIFY(content.backgroundImageB64().isEmpty());
    }

    void testCtaAliasAndInvalidHints() {
        QJsonObject badHint;
        badHint.insert("x", "ten");
        badHint.insert("y", 20);

        QJsonObject layout;
        layout.insert("cta", hint(5, 95));
        layout.insert("tagline", badHint);

        QJsonObject root;
        root.insert("layout_json", layout);

        CampaignContent content = CampaignContent::fromJson(root);
        QCOMPARE(content.layoutHints.value(CaptionField::CallToAction), QPointF(5, 95));
        QVERIFY(!content.layoutHints.contains(CaptionField::Tagline));
    }

    void testLoadFromMissingFile() {
        CampaignContent content;
        QString error;
        QVERIFY(!CampaignContent::loadFromFile(QStringLiteral("/nonexistent/content.json"),
                                               &content, &error));
        QVERIFY(!error.isEmpty());
    }

    void testLoadFromInvalidJson() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.filePath("broken.json");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ \"captions\": ");
        file.close();

        CampaignContent content;
        QString error;
        QVERIFY(!CampaignContent::loadFromFile(path, &content, &error));
        QVERIFY(!error.isEmpty());
    }

    // ===== Placement =====

    // A4 portrait, no layout hints, no image: three captions at the defaults
    void testDefaultImportOnA4() {
        Scene scene;
        const QSizeF page = PageGeometry::resolve(PageGeometry::PageSpec());
        LayoutImporter::importContent(scene, sampleContent(), page);

        QCOMPARE(scene.objectCount(), 3);
        QCOMPARE(scene.imageCount(), 0);

        QList<const TextBoxObject*> boxes = textBoxes(scene);
        QCOMPARE(boxes.size(), 3);
        QVERIFY(closeTo(boxes[0]->position, QPointF(79.4, 168.45)));
        QVERIFY(closeTo(boxes[1]->position, QPointF(79.4, 280.75)));
        QVERIFY(closeTo(boxes[2]->position, QPointF(79.4, 393.05)));

        for (const TextBoxObject* box : boxes) {
            QCOMPARE(box->width, page.width() * 0.8);
            QVERIFY(box->origin == SceneObject::Origin::TopLeft);
        }

        QCOMPARE(boxes[0]->text, QString("Spring Sale"));
        QVERIFY(boxes[0]->style.weight == TextStyle::Weight::Bold);
        QCOMPARE(boxes[0]->style.fontSize, 36);
        QVERIFY(boxes[1]->style.slant == TextStyle::Slant::Italic);
        QCOMPARE(boxes[1]->style.fontSize, 24);
        QCOMPARE(boxes[2]->style.fillColor, QColor(0x00, 0xbf, 0xff));
        QCOMPARE(boxes[2]->style.fontSize, 20);
    }

    // A hint placed on a page maps back to the same percentages
    void testHintRoundTrip() {
        const QList<QPointF> hints = { QPointF(0, 0), QPointF(10, 15), QPointF(37.5, 62.25),
                                       QPointF(100, 100) };
        for (PageGeometry::PaperSize size : PageGeometry::allPaperSizes()) {
            QSizeF page = PageGeometry::resolve(size, PageGeometry::Orientation::Landscape);
            for (const QPointF& percent : hints) {
                QPointF pos = LayoutImporter::percentToPage(percent, page);
                QPointF back(pos.x() / page.width() * 100.0, pos.y() / page.height() * 100.0);
                QVERIFY(closeTo(back, percent));
            }
        }
    }

    void testPartialHintsFallBackPerField() {
        CampaignContent content = sampleContent();
        content.hasLayoutJson = true;
        content.layoutHints.insert(CaptionField::Tagline, QPointF(50, 50));

        QCOMPARE(LayoutImporter::resolveHint(content, CaptionField::Tagline), QPointF(50, 50));
        QCOMPARE(LayoutImporter::resolveHint(content, CaptionField::Headline), QPointF(10, 15));
        QCOMPARE(LayoutImporter::resolveHint(content, CaptionField::CallToAction), QPointF(10, 35));
    }

    // ===== Cover scale =====

    void testWideImageMatchesHeight() {
        // 2000x500 on A4 portrait: wider than the page, so the height decides
        qreal scale = LayoutImporter::coverScale(QSizeF(2000, 500), QSizeF(794, 1123));
        QCOMPARE(scale, 1123.0 / 500.0);
        QVERIFY(2000 * scale >= 794);
        QVERIFY(500 * scale >= 1123 - 1e-9);
    }

    void testTallImageMatchesWidth() {
        qreal scale = LayoutImporter::coverScale(QSizeF(300, 2000), QSizeF(794, 1123));
        QCOMPARE(scale, 794.0 / 300.0);
        QVERIFY(2000 * scale >= 1123);
    }

    void testBackgroundCoversAndCentres() {
        QImage image(400, 100, QImage::Format_RGB32);
        image.fill(Qt::green);
        const QSizeF page(400, 600);

        std::unique_ptr<ImageObject> bg = LayoutImporter::createBackground(image, page);
        QVERIFY(bg != nullptr);
        QVERIFY(bg->origin == SceneObject::Origin::Center);
        QCOMPARE(bg->center(), QPointF(200, 300));

        QRectF bounds = bg->boundingRect();
        QVERIFY(bounds.contains(QRectF(QPointF(0, 0), page)));

        QVERIFY(LayoutImporter::createBackground(QImage(), page) == nullptr);
    }

    void testImportWithBaseImage() {
        QImage image(100, 100, QImage::Format_RGB32);
        image.fill(Qt::blue);

        Scene scene;
        LayoutImporter::importContent(scene, sampleContent(), QSizeF(400, 600), image);

        QCOMPARE(scene.objectCount(), 4);
        QVERIFY(scene.objectAt(0)->isImage());
        for (int i = 1; i < scene.objectCount(); ++i) {
            QVERIFY(scene.objectAt(i)->isTextBox());
        }
    }

    void testImportReplacesPreviousScene() {
        Scene scene;
        LayoutImporter::importContent(scene, sampleContent(), QSizeF(400, 600));
        QString firstId = scene.objectAt(0)->id;
        quint64 firstGeneration = scene.generation();

        LayoutImporter::importContent(scene, sampleContent(), QSizeF(600, 400));
        QCOMPARE(scene.objectCount(), 3);
        QVERIFY(!scene.contains(firstId));
        QVERIFY(scene.generation() > firstGeneration);
    }

    // ===== Base64 decoding =====

    void testDecodePngAndJpeg() {
        QImage image(16, 8, QImage::Format_RGB32);
        image.fill(Qt::white);

        QImage png = ImageDecoder::decodeBase64(encodeImage(image, "PNG"));
        QCOMPARE(png.size(), QSize(16, 8));

        QImage jpeg = ImageDecoder::decodeBase64(encodeImage(image, "JPEG"));
        QCOMPARE(jpeg.size(), QSize(16, 8));

        QString dataUrl = QStringLiteral("data:image/png;base64,") + encodeImage(image, "PNG");
        QCOMPARE(ImageDecoder::decodeBase64(dataUrl).size(), QSize(16, 8));
    }

    void testDecodeGarbage() {
        QVERIFY(ImageDecoder::decodeBase64(QStringLiteral("not an image")).isNull());
        QVERIFY(ImageDecoder::decodeBase64(QString()).isNull());
    }
};

#endif // LAYOUTIMPORTERTESTS_H
