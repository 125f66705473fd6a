#ifndef SCENETESTS_H
#define SCENETESTS_H

#include <QObject>
#include <QTest>
#include <QImage>
#include "Scene.h"

/**
 * Unit tests for the scene model: z-order, lookup, hit testing, flips.
 * Run with: posterstudio --test-scene
 */
class SceneTests : public QObject {
    Q_OBJECT

private:
    static std::unique_ptr<TextBoxObject> makeText(const QString& text, const QPointF& pos) {
        auto box = std::make_unique<TextBoxObject>(text, 200.0, TextStyle());
        box->position = pos;
        return box;
    }

    static std::unique_ptr<ImageObject> makeImage(const QSize& size, const QPointF& pos) {
        QImage image(size, QImage::Format_ARGB32);
        image.fill(Qt::red);
        auto obj = std::make_unique<ImageObject>(image);
        obj->position = pos;
        return obj;
    }

    static QStringList order(const Scene& scene) {
        QStringList ids;
        for (int i = 0; i < scene.objectCount(); ++i) {
            ids << scene.objectAt(i)->id;
        }
        return ids;
    }

private slots:
    void testIdsAreUnique() {
        Scene scene;
        QString a = scene.addObject(makeText("a", QPointF()))->id;
        QString b = scene.addObject(makeText("b", QPointF()))->id;
        QVERIFY(!a.isEmpty());
        QVERIFY(a != b);
    }

    void testAddAndRemove() {
        Scene scene;
        QVERIFY(scene.isEmpty());

        SceneObject* text = scene.addObject(makeText("hello", QPointF(10, 10)));
        SceneObject* image = scene.addObject(makeImage(QSize(20, 20), QPointF(0, 0)));
        QCOMPARE(scene.objectCount(), 2);
        QCOMPARE(scene.textBoxCount(), 1);
        QCOMPARE(scene.imageCount(), 1);
        QCOMPARE(text->type(), QString("textbox"));
        QCOMPARE(image->type(), QString("image"));

        // New objects go to the front
        QCOMPARE(scene.indexOf(image->id), 1);

        QString textId = text->id;
        QVERIFY(scene.removeObject(textId));
        QVERIFY(!scene.contains(textId));
        QVERIFY(!scene.removeObject(textId));
        QCOMPARE(scene.objectCount(), 1);
    }

    void testAddAtBack() {
        Scene scene;
        scene.addObject(makeText("caption", QPointF()));
        SceneObject* bg = scene.addObjectAtBack(makeImage(QSize(10, 10), QPointF()));
        QCOMPARE(scene.indexOf(bg->id), 0);
    }

    void testReorderPreservesOthers() {
        Scene scene;
        QString a = scene.addObject(makeText("a", QPointF()))->id;
        QString b = scene.addObject(makeText("b", QPointF()))->id;
        QString c = scene.addObject(makeText("c", QPointF()))->id;

        QVERIFY(scene.bringToFront(a));
        QCOMPARE(order(scene), QStringList({b, c, a}));

        QVERIFY(scene.sendToBack(c));
        QCOMPARE(order(scene), QStringList({c, b, a}));

        // Already at the back: order unchanged
        QVERIFY(scene.sendToBack(c));
        QCOMPARE(order(scene), QStringList({c, b, a}));

        QVERIFY(!scene.bringToFront(QStringLiteral("missing")));
        QCOMPARE(order(scene), QStringList({c, b, a}));
    }

    void testHitTestPrefersTopmost() {
        Scene scene;
        SceneObject* back = scene.addObject(makeImage(QSize(100, 100), QPointF(0, 0)));
        SceneObject* front = scene.addObject(makeImage(QSize(50, 50), QPointF(25, 25)));

        QCOMPARE(scene.objectAtPoint(QPointF(30, 30)), front);
        QCOMPARE(scene.objectAtPoint(QPointF(5, 5)), back);
        QVERIFY(scene.objectAtPoint(QPointF(500, 500)) == nullptr);

        front->visible = false;
        QCOMPARE(scene.objectAtPoint(QPointF(30, 30)), back);
    }

    void testCenterOrigin() {
        auto image = makeImage(QSize(200, 100), QPointF(300, 400));
        image->origin = SceneObject::Origin::Center;
        image->scale = 0.5;
        QCOMPARE(image->size(), QSizeF(100, 50));
        QCOMPARE(image->boundingRect(), QRectF(250, 375, 100, 50));
        QCOMPARE(image->center(), QPointF(300, 400));
    }

    // Flipping twice restores the original flags; the box never moves
    void testFlipDoesNotMoveObject() {
        auto box = makeText("flip", QPointF(40, 60));
        QRectF before = box->boundingRect();

        box->flipX = !box->flipX;
        QCOMPARE(box->boundingRect(), before);
        box->flipX = !box->flipX;
        QVERIFY(!box->flipX);

        box->flipY = !box->flipY;
        box->flipY = !box->flipY;
        QVERIFY(!box->flipY);
        QCOMPARE(box->boundingRect(), before);
    }

    void testFlipMirrorsRenderedPixels() {
        // Left half red, right half blue
        QImage source(20, 10, QImage::Format_ARGB32);
        source.fill(Qt::blue);
        for (int y = 0; y < 10; ++y) {
            for (int x = 0; x < 10; ++x) {
                source.setPixelColor(x, y, Qt::red);
            }
        }

        ImageObject obj(source);
        obj.flipX = true;

        QImage target(20, 10, QImage::Format_ARGB32);
        target.fill(Qt::transparent);
        QPainter painter(&target);
        obj.render(painter);
        painter.end();

        QCOMPARE(target.pixelColor(2, 5), QColor(Qt::blue));
        QCOMPARE(target.pixelColor(17, 5), QColor(Qt::red));
    }

    void testClearBumpsGeneration() {
        Scene scene;
        scene.addObject(makeText("x", QPointF()));
        quint64 before = scene.generation();
        scene.clear();
        QVERIFY(scene.isEmpty());
        QVERIFY(scene.generation() > before);
    }

    void testTextBoxWrapsToWidth() {
        TextBoxObject box(QStringLiteral("one two three four five six seven eight nine ten"),
                          80.0, TextStyle());
        QVERIFY(box.layoutLines().size() > 1);
        QCOMPARE(box.size().width(), 80.0);

        TextBoxObject single(QStringLiteral("hi"), 300.0, TextStyle());
        QVERIFY(single.layoutLines().size() == 1);
        QVERIFY(box.size().height() > single.size().height());
    }
};

#endif // SCENETESTS_H
