#pragma once

// ============================================================================
// ImageDecoder - Async image decoding for the editor session
// ============================================================================
// Decodes base64 payloads and image files on the QtConcurrent thread pool.
// Results are delivered on the GUI thread through decoded()/decodeFailed(),
// tagged with the scene generation and a caller-chosen purpose so the
// session can drop results that arrive for a scene it has since rebuilt.
//
// Thread Safety:
// Worker threads only see the encoded bytes or the file path; they never
// touch the Scene. QImage is safe to hand across threads.
// ============================================================================

#include <QObject>
#include <QImage>
#include <QByteArray>
#include <QFutureWatcher>
#include <QList>
#include <QString>

class ImageDecoder : public QObject {
    Q_OBJECT

public:
    /**
     * @brief What the decoded image is for.
     */
    enum class Purpose {
        Background,   ///< Imported base image (cover-scaled, sent to back)
        Insert        ///< User-uploaded image (added at the front)
    };
    Q_ENUM(Purpose)

    explicit ImageDecoder(QObject* parent = nullptr);
    ~ImageDecoder() override;

    /**
     * @brief Decode a base64 payload (raw or data URL) in the background.
     * @param payload Base64 text as delivered in images_b64.
     * @param generation Scene generation the result belongs to.
     * @param purpose Passed back unchanged with the result.
     */
    void requestBase64(const QString& payload, quint64 generation, Purpose purpose);

    /**
     * @brief Decode an image file in the background.
     */
    void requestFile(const QString& path, quint64 generation, Purpose purpose);

    /**
     * @brief Number of decodes still running.
     */
    int pendingCount() const { return m_activeWatchers.size(); }

    /**
     * @brief Wait for all running decodes (results are dropped).
     */
    void cancelAll();

    // ===== Synchronous helpers (also used by the headless renderer) =====

    /**
     * @brief Strip an optional "data:image/...;base64," prefix and whitespace.
     */
    static QByteArray stripDataUrl(const QString& payload);

    /**
     * @brief Decode a base64 payload into an image.
     * @return Null image if the payload is not valid base64 image data.
     */
    static QImage decodeBase64(const QString& payload);

signals:
    /**
     * @brief Emitted on the GUI thread when a decode succeeds.
     */
    void decoded(quint64 generation, ImageDecoder::Purpose purpose, const QImage& image);

    /**
     * @brief Emitted on the GUI thread when a decode fails.
     */
    void decodeFailed(quint64 generation, ImageDecoder::Purpose purpose, const QString& source);

private slots:
    void onDecodeFinished();

private:
    struct Result {
        QImage image;
        quint64 generation = 0;
        Purpose purpose = Purpose::Background;
        QString source;       ///< Short description for logging
    };

    void startWatcher(const QFuture<Result>& future);

    QList<QFutureWatcher<Result>*> m_activeWatchers;
    bool m_shuttingDown = false;
};
