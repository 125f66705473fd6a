#include "ImageDecoder.h"

#include <QImageReader>
#include <QBuffer>
#include <QtConcurrent>
#include <QDebug>

ImageDecoder::ImageDecoder(QObject* parent)
    : QObject(parent)
{
}

ImageDecoder::~ImageDecoder()
{
    m_shuttingDown = true;
    cancelAll();
}

QByteArray ImageDecoder::stripDataUrl(const QString& payload)
{
    QString text = payload.trimmed();
    if (text.startsWith(QLatin1String("data:"))) {
        int comma = text.indexOf(QLatin1Char(','));
        text = comma >= 0 ? text.mid(comma + 1) : QString();
    }
    return text.toLatin1();
}

QImage ImageDecoder::decodeBase64(const QString& payload)
{
    QByteArray encoded = stripDataUrl(payload);
    if (encoded.isEmpty()) {
        return QImage();
    }

    auto result = QByteArray::fromBase64Encoding(encoded);
    if (!result) {
        return QImage();
    }

    // The format is sniffed from the data (PNG payloads start with "iVBOR")
    QImage image;
    if (!image.loadFromData(*result)) {
        return QImage();
    }
    return image;
}

void ImageDecoder::requestBase64(const QString& payload, quint64 generation, Purpose purpose)
{
    QFuture<Result> future = QtConcurrent::run([payload, generation, purpose]() {
        Result result;
        result.generation = generation;
        result.purpose = purpose;
        result.source = QStringLiteral("base64 payload (%1 chars)").arg(payload.size());
        result.image = decodeBase64(payload);
        return result;
    });
    startWatcher(future);
}

void ImageDecoder::requestFile(const QString& path, quint64 generation, Purpose purpose)
{
    QFuture<Result> future = QtConcurrent::run([path, generation, purpose]() {
        Result result;
        result.generation = generation;
        result.purpose = purpose;
        result.source = path;

        QImageReader reader(path);
        reader.setAutoTransform(true);
        result.image = reader.read();
        return result;
    });
    startWatcher(future);
}

void ImageDecoder::startWatcher(const QFuture<Result>& future)
{
    auto* watcher = new QFutureWatcher<Result>(this);
    connect(watcher, &QFutureWatcher<Result>::finished,
            this, &ImageDecoder::onDecodeFinished);
    m_activeWatchers.append(watcher);
    watcher->setFuture(future);
}

void ImageDecoder::cancelAll()
{
    for (QFutureWatcher<Result>* watcher : m_activeWatchers) {
        watcher->disconnect(this);
        watcher->waitForFinished();
        delete watcher;
    }
    m_activeWatchers.clear();
}

void ImageDecoder::onDecodeFinished()
{
    if (m_shuttingDown) {
        return;
    }

    // QFutureWatcher is a template without Q_OBJECT, so use static_cast
    auto* watcher = static_cast<QFutureWatcher<Result>*>(sender());
    if (!watcher) {
        return;
    }

    Result result = watcher->result();
    m_activeWatchers.removeOne(watcher);
    watcher->deleteLater();

    if (result.image.isNull()) {
        qWarning() << "ImageDecoder: failed to decode" << result.source;
        emit decodeFailed(result.generation, result.purpose, result.source);
        return;
    }

    qDebug() << "ImageDecoder: decoded" << result.source << "size =" << result.image.size()
             << "generation =" << result.generation;
    emit decoded(result.generation, result.purpose, result.image);
}
