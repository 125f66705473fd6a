#ifndef PAGEGEOMETRYTESTS_H
#define PAGEGEOMETRYTESTS_H

#include <QObject>
#include <QTest>
#include "PageGeometry.h"

/**
 * Unit tests for paper size resolution.
 * Run with: posterstudio --test-geometry
 */
class PageGeometryTests : public QObject {
    Q_OBJECT

private slots:
    void testBaseSizes() {
        QCOMPARE(PageGeometry::baseSize(PageGeometry::PaperSize::Letter), QSizeF(816, 1056));
        QCOMPARE(PageGeometry::baseSize(PageGeometry::PaperSize::A4), QSizeF(794, 1123));
        QCOMPARE(PageGeometry::baseSize(PageGeometry::PaperSize::A5), QSizeF(559, 794));
        QCOMPARE(PageGeometry::baseSize(PageGeometry::PaperSize::A6), QSizeF(397, 559));
        QCOMPARE(PageGeometry::baseSize(PageGeometry::PaperSize::Postcard), QSizeF(400, 600));
    }

    void testPortraitIsBaseSize() {
        for (PageGeometry::PaperSize size : PageGeometry::allPaperSizes()) {
            QCOMPARE(PageGeometry::resolve(size, PageGeometry::Orientation::Portrait),
                     PageGeometry::baseSize(size));
        }
    }

    // Landscape is the portrait size with width and height swapped
    void testLandscapeSwapsDimensions() {
        for (PageGeometry::PaperSize size : PageGeometry::allPaperSizes()) {
            QSizeF portrait = PageGeometry::resolve(size, PageGeometry::Orientation::Portrait);
            QSizeF landscape = PageGeometry::resolve(size, PageGeometry::Orientation::Landscape);
            QCOMPARE(landscape.width(), portrait.height());
            QCOMPARE(landscape.height(), portrait.width());
        }
        QCOMPARE(PageGeometry::resolve(QStringLiteral("A4"), PageGeometry::Orientation::Landscape),
                 QSizeF(1123, 794));
    }

    void testDefaultSpecIsA4Portrait() {
        PageGeometry::PageSpec spec;
        QCOMPARE(PageGeometry::resolve(spec), QSizeF(794, 1123));
    }

    void testKeyRoundTrip() {
        for (PageGeometry::PaperSize size : PageGeometry::allPaperSizes()) {
            bool ok = false;
            QString key = PageGeometry::paperSizeKey(size);
            QCOMPARE(PageGeometry::paperSizeFromKey(key, &ok), size);
            QVERIFY(ok);
        }
    }

    void testUnknownKeysAreRejected() {
        bool ok = true;
        PageGeometry::paperSizeFromKey(QStringLiteral("Tabloid"), &ok);
        QVERIFY(!ok);

        ok = true;
        PageGeometry::orientationFromKey(QStringLiteral("diagonal"), &ok);
        QVERIFY(!ok);
    }

    void testOrientationKeys() {
        bool ok = false;
        QCOMPARE(PageGeometry::orientationFromKey(QStringLiteral("Landscape"), &ok),
                 PageGeometry::Orientation::Landscape);
        QVERIFY(ok);
        QCOMPARE(PageGeometry::orientationKey(PageGeometry::Orientation::Portrait),
                 QString("portrait"));
    }
};

#endif // PAGEGEOMETRYTESTS_H
