#include "SceneExporter.h"

#include <QBuffer>
#include <QFileInfo>
#include <QImageWriter>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QDebug>
#include <QtMath>

namespace SceneExporter {

// Logical page pixels are CSS pixels: 96 per inch
static constexpr int LOGICAL_DPI = 96;

void paintPage(QPainter& painter, const Scene& scene, const QSizeF& pageSize)
{
    painter.fillRect(QRectF(QPointF(0, 0), pageSize), pageBackground());

    // Objects may extend past the page (cover-scaled background)
    painter.save();
    painter.setClipRect(QRectF(QPointF(0, 0), pageSize));
    scene.render(painter);
    painter.restore();
}

QImage renderToImage(const Scene& scene, const QSizeF& pageSize)
{
    if (pageSize.isEmpty()) {
        return QImage();
    }

    QSize pixels(qCeil(pageSize.width()), qCeil(pageSize.height()));
    QImage image(pixels, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    paintPage(painter, scene, pageSize);
    painter.end();

    return image;
}

QByteArray exportPng(const Scene& scene, const QSizeF& pageSize)
{
    QImage image = renderToImage(scene, pageSize);
    if (image.isNull()) {
        return QByteArray();
    }

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "PNG")) {
        qWarning() << "SceneExporter::exportPng: PNG encoding failed";
        return QByteArray();
    }
    buffer.close();
    return bytes;
}

bool saveImage(const Scene& scene, const QSizeF& pageSize, const QString& path,
               QString* errorMessage)
{
    QImage image = renderToImage(scene, pageSize);
    if (image.isNull()) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Page size is empty");
        }
        return false;
    }

    QByteArray format = QFileInfo(path).suffix().toLower().toLatin1();
    if (format.isEmpty()) {
        format = "png";
    }
    if (format == "jpg" || format == "jpeg") {
        // JPEG has no alpha channel
        image = image.convertToFormat(QImage::Format_RGB32);
    }

    QImageWriter writer(path, format);
    if (!writer.write(image)) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Cannot write %1: %2").arg(path, writer.errorString());
        }
        qWarning() << "SceneExporter::saveImage: failed to write" << path << writer.errorString();
        return false;
    }

    qDebug() << "SceneExporter::saveImage: wrote" << path << image.size();
    return true;
}

bool savePdf(const Scene& scene, const QSizeF& pageSize, const QString& path,
             QString* errorMessage)
{
    if (pageSize.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Page size is empty");
        }
        return false;
    }

    // Create QPdfWriter
    QPdfWriter pdfWriter(path);
    pdfWriter.setResolution(LOGICAL_DPI);
    pdfWriter.setCreator(QStringLiteral("PosterStudio"));

    // Page size in points (72 per inch)
    QSizeF pagePoints = pageSize * 72.0 / LOGICAL_DPI;
    QPageSize size(pagePoints, QPageSize::Point, QString(), QPageSize::ExactMatch);
    pdfWriter.setPageLayout(QPageLayout(size, QPageLayout::Portrait, QMarginsF()));

    QPainter painter;
    if (!painter.begin(&pdfWriter)) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Cannot write %1").arg(path);
        }
        qWarning() << "SceneExporter::savePdf: cannot open painter for" << path;
        return false;
    }

    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    paintPage(painter, scene, pageSize);
    painter.end();

    qDebug() << "SceneExporter::savePdf: wrote" << path;
    return true;
}

bool saveToFile(const Scene& scene, const QSizeF& pageSize, const QString& path,
                QString* errorMessage)
{
    if (QFileInfo(path).suffix().compare(QLatin1String("pdf"), Qt::CaseInsensitive) == 0) {
        return savePdf(scene, pageSize, path, errorMessage);
    }
    return saveImage(scene, pageSize, path, errorMessage);
}

} // namespace SceneExporter
