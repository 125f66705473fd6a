#ifndef VIEWPORTSCALERTESTS_H
#define VIEWPORTSCALERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "ViewportScaler.h"
#include "PageGeometry.h"

/**
 * Unit tests for the page-fit scale factor.
 * Run with: posterstudio --test-viewport
 */
class ViewportScalerTests : public QObject {
    Q_OBJECT

private slots:
    void testFitScaleUsesTighterAxis() {
        // 794 x 1123 into 397 x 2000: width is the constraint
        std::optional<qreal> scale = ViewportScaler::fitScale(QSizeF(794, 1123), QSizeF(397, 2000));
        QVERIFY(scale.has_value());
        QCOMPARE(*scale, 0.5);

        // Height is the constraint
        scale = ViewportScaler::fitScale(QSizeF(400, 600), QSizeF(1000, 300));
        QVERIFY(scale.has_value());
        QCOMPARE(*scale, 0.5);
    }

    // The scaled page never exceeds the container on either axis
    void testScaledPageFitsContainer() {
        const QList<QSizeF> containers = {
            QSizeF(300, 300), QSizeF(1920, 1080), QSizeF(123.5, 987.25), QSizeF(5000, 40)
        };
        for (PageGeometry::PaperSize size : PageGeometry::allPaperSizes()) {
            for (auto orientation : {PageGeometry::Orientation::Portrait,
                                     PageGeometry::Orientation::Landscape}) {
                QSizeF page = PageGeometry::resolve(size, orientation);
                for (const QSizeF& container : containers) {
                    std::optional<qreal> scale = ViewportScaler::fitScale(page, container);
                    QVERIFY(scale.has_value());
                    QVERIFY(page.width() * *scale <= container.width() + 1e-9);
                    QVERIFY(page.height() * *scale <= container.height() + 1e-9);
                }
            }
        }
    }

    void testUnmeasurableContainer() {
        QVERIFY(!ViewportScaler::fitScale(QSizeF(794, 1123), QSizeF(0, 500)).has_value());
        QVERIFY(!ViewportScaler::fitScale(QSizeF(794, 1123), QSizeF(500, -1)).has_value());
        QVERIFY(!ViewportScaler::fitScale(QSizeF(0, 0), QSizeF(500, 500)).has_value());
    }

    // A zero-size container defers: the previous factor is kept
    void testPendingKeepsPreviousFactor() {
        ViewportScaler scaler;
        QVERIFY(scaler.isPending());
        QCOMPARE(scaler.scaleFactor(), 1.0);

        scaler.setPageSize(QSizeF(400, 600));
        scaler.setContainerSize(QSizeF(0, 0));
        QVERIFY(scaler.isPending());
        QCOMPARE(scaler.scaleFactor(), 1.0);

        scaler.setContainerSize(QSizeF(200, 600));
        QVERIFY(!scaler.isPending());
        QCOMPARE(scaler.scaleFactor(), 0.5);

        scaler.setContainerSize(QSizeF(0, 100));
        QCOMPARE(scaler.scaleFactor(), 0.5);
    }

    void testScaleChangedSignal() {
        ViewportScaler scaler;
        QSignalSpy spy(&scaler, &ViewportScaler::scaleFactorChanged);

        scaler.setPageSize(QSizeF(400, 600));
        scaler.setContainerSize(QSizeF(800, 1200));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.last().at(0).toReal(), 2.0);

        // Same factor: no signal
        scaler.setContainerSize(QSizeF(900, 1200));
        QCOMPARE(spy.count(), 1);

        // Page change recomputes
        scaler.setPageSize(QSizeF(600, 400));
        QCOMPARE(spy.count(), 2);
        QCOMPARE(scaler.scaleFactor(), 1.5);
    }

    void testPageRectIsCentred() {
        ViewportScaler scaler;
        scaler.setPageSize(QSizeF(400, 600));
        scaler.setContainerSize(QSizeF(1000, 600));

        QRectF rect = scaler.pageRect();
        QCOMPARE(rect, QRectF(300, 0, 400, 600));
    }

    void testMappingRoundTrip() {
        ViewportScaler scaler;
        scaler.setPageSize(QSizeF(794, 1123));
        scaler.setContainerSize(QSizeF(640, 480));

        QPointF pagePoint(100, 250);
        QPointF back = scaler.mapToPage(scaler.mapFromPage(pagePoint));
        QVERIFY(qAbs(back.x() - pagePoint.x()) < 1e-9);
        QVERIFY(qAbs(back.y() - pagePoint.y()) < 1e-9);
    }
};

#endif // VIEWPORTSCALERTESTS_H
