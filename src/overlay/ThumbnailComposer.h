#pragma once

#include <QImage>
#include <QString>
#include "TextComposer.h"

struct ThumbnailStyle {
    QString fontFamily = "arial";
    int fontSize = 96;
    QColor color = Qt::white;
};

// Still preview: the first PNG of the backgrounds folder with the title
// drawn over its left part.
class ThumbnailComposer {
public:
    explicit ThumbnailComposer(TextComposer* textComposer);

    bool compose(const QString& backgroundsDir, const QString& title,
                 const ThumbnailStyle& style, QImage& thumbnail);
    bool composeToFile(const QString& backgroundsDir, const QString& title,
                       const ThumbnailStyle& style, const QString& outputPath);

    QString errorString() const { return m_error; }

    static QString findBaseImage(const QString& backgroundsDir);

private:
    TextComposer* m_textComposer;
    QString m_error;
};
