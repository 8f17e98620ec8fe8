#include "ThumbnailComposer.h"
#include "Logging.h"
#include <QDir>
#include <QFileInfo>
#include <QFontMetrics>
#include <QPainter>

ThumbnailComposer::ThumbnailComposer(TextComposer* textComposer)
    : m_textComposer(textComposer) {}

QString ThumbnailComposer::findBaseImage(const QString& backgroundsDir) {
    QDir dir(backgroundsDir);
    const QStringList pngs = dir.entryList({"*.png"}, QDir::Files, QDir::Name);
    return pngs.isEmpty() ? QString() : dir.filePath(pngs.first());
}

bool ThumbnailComposer::compose(const QString& backgroundsDir, const QString& title,
                                const ThumbnailStyle& style, QImage& thumbnail) {
    m_error.clear();

    const QString basePath = findBaseImage(backgroundsDir);
    if (basePath.isEmpty()) {
        m_error = QString("No png files found in %1").arg(backgroundsDir);
        return false;
    }

    QImage base(basePath);
    if (base.isNull()) {
        m_error = QString("Cannot read %1").arg(basePath);
        return false;
    }

    TextStyle text;
    text.fontFamily = style.fontFamily;
    text.pixelSize = style.fontSize;
    text.bold = true;
    text.color = style.color;
    text.padding = style.fontSize / 5;

    // Title fills the left 60% of the image, vertically centered
    const QFont font = m_textComposer->resolveFont(text);
    const int avgCharWidth = qMax(1, QFontMetrics(font).averageCharWidth());
    text.wrapWidth = qMax(1, (base.width() * 6 / 10) / avgCharWidth);

    const QStringList lines = TextComposer::wrapText(title, text.wrapWidth);
    const int blockHeight = m_textComposer->textHeight(lines, font)
                            + text.padding * qMax(0, static_cast<int>(lines.size()) - 1);
    const QPoint origin(base.width() / 20, qMax(0, (base.height() - blockHeight) / 2));

    thumbnail = m_textComposer->drawText(base, title, text, origin);
    return !thumbnail.isNull();
}

bool ThumbnailComposer::composeToFile(const QString& backgroundsDir, const QString& title,
                                      const ThumbnailStyle& style, const QString& outputPath) {
    QImage thumbnail;
    if (!compose(backgroundsDir, title, style, thumbnail))
        return false;

    QDir().mkpath(QFileInfo(outputPath).absolutePath());
    if (!thumbnail.save(outputPath, "PNG")) {
        m_error = QString("Cannot write thumbnail: %1").arg(outputPath);
        return false;
    }
    qCInfo(lcCompose) << "Thumbnail written to" << outputPath;
    return true;
}
