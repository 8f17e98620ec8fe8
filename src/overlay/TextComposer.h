#pragma once

#include <QColor>
#include <QFont>
#include <QImage>
#include <QPoint>
#include <QString>
#include <QStringList>

class QPainter;

struct TextStyle {
    QString fontPath;           // TrueType file, loaded into the application font database
    QString fontFamily;         // used when fontPath is empty or fails to load
    int pixelSize = 47;
    bool bold = false;
    QColor color = Qt::black;
    int padding = 5;            // vertical gap between lines
    int wrapWidth = 35;         // characters per line
};

// Burns wrapped text into images. Shared by the title card and the
// thumbnail. Needs a QGuiApplication for font access.
class TextComposer {
public:
    // Title card: the template is stretched through its middle row so the
    // wrapped title fits, then the title and channel name are drawn on it.
    QImage composeTitleCard(const QImage& templateImage, const QString& title,
                            const TextStyle& style, const QString& channelName);

    QImage drawText(const QImage& base, const QString& text, const TextStyle& style,
                    const QPoint& origin);

    QFont resolveFont(const TextStyle& style);
    int textHeight(const QStringList& lines, const QFont& font) const;
    int paintLines(QPainter& painter, const QStringList& lines, const QFont& font,
                   const QColor& color, QPoint origin, int padding) const;

    QString errorString() const { return m_error; }

    // Greedy word wrap on character count; words longer than a line are split
    static QStringList wrapText(const QString& text, int width);

private:
    QString m_error;
};
