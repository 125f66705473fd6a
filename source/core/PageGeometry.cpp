#include "PageGeometry.h"

#include <QtGlobal>

namespace PageGeometry {

QSizeF baseSize(PaperSize size)
{
    switch (size) {
        case PaperSize::Letter:   return QSizeF(816, 1056);
        case PaperSize::A4:       return QSizeF(794, 1123);
        case PaperSize::A5:       return QSizeF(559, 794);
        case PaperSize::A6:       return QSizeF(397, 559);
        case PaperSize::Postcard: return QSizeF(400, 600);
    }
    qFatal("PageGeometry::baseSize: invalid paper size %d", static_cast<int>(size));
    return QSizeF();
}

QSizeF resolve(PaperSize size, Orientation orientation)
{
    QSizeF page = baseSize(size);
    if (orientation == Orientation::Landscape) {
        page.transpose();
    }
    return page;
}

QSizeF resolve(const QString& paperSizeKey, Orientation orientation)
{
    bool ok = false;
    PaperSize size = paperSizeFromKey(paperSizeKey, &ok);
    if (!ok) {
        qFatal("PageGeometry::resolve: unknown paper size key \"%s\"",
               qPrintable(paperSizeKey));
    }
    return resolve(size, orientation);
}

PaperSize paperSizeFromKey(const QString& key, bool* ok)
{
    if (ok) {
        *ok = true;
    }
    for (PaperSize size : allPaperSizes()) {
        if (paperSizeKey(size) == key) {
            return size;
        }
    }
    if (ok) {
        *ok = false;
    }
    return PaperSize::A4;
}

QString paperSizeKey(PaperSize size)
{
    switch (size) {
        case PaperSize::Letter:   return QStringLiteral("Letter");
        case PaperSize::A4:       return QStringLiteral("A4");
        case PaperSize::A5:       return QStringLiteral("A5");
        case PaperSize::A6:       return QStringLiteral("A6");
        case PaperSize::Postcard: return QStringLiteral("Postcard");
    }
    return QString();
}

Orientation orientationFromKey(const QString& key, bool* ok)
{
    if (ok) {
        *ok = true;
    }
    if (key.compare(QLatin1String("portrait"), Qt::CaseInsensitive) == 0) {
        return Orientation::Portrait;
    }
    if (key.compare(QLatin1String("landscape"), Qt::CaseInsensitive) == 0) {
        return Orientation::Landscape;
    }
    if (ok) {
        *ok = false;
    }
    return Orientation::Portrait;
}

QString orientationKey(Orientation orientation)
{
    return orientation == Orientation::Landscape ? QStringLiteral("landscape")
                                                 : QStringLiteral("portrait");
}

QVector<PaperSize> allPaperSizes()
{
    return {PaperSize::Letter, PaperSize::A4, PaperSize::A5,
            PaperSize::A6, PaperSize::Postcard};
}

} // namespace PageGeometry
