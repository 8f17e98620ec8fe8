#include "TextComposer.h"
#include "Logging.h"
#include <QFontDatabase>
#include <QFontMetrics>
#include <QHash>
#include <QPainter>

namespace {

constexpr int TitleTextLeft = 120;
constexpr int TitleHeightTrim = 50;
constexpr int ChannelNamePixelSize = 30;
const QPoint ChannelNameOrigin(205, 825);

} // namespace

QStringList TextComposer::wrapText(const QString& text, int width) {
    QStringList lines;
    if (width <= 0) width = 1;

    const QStringList words = text.simplified().split(' ', Qt::SkipEmptyParts);
    QString current;
    for (QString word : words) {
        while (word.size() > width) {
            if (!current.isEmpty()) {
                const int room = width - static_cast<int>(current.size()) - 1;
                if (room > 0) {
                    current += ' ' + word.left(room);
                    word = word.mid(room);
                }
                lines << current;
                current.clear();
                continue;
            }
            lines << word.left(width);
            word = word.mid(width);
        }
        if (word.isEmpty()) continue;

        if (current.isEmpty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= width) {
            current += ' ' + word;
        } else {
            lines << current;
            current = word;
        }
    }
    if (!current.isEmpty()) lines << current;
    return lines;
}

QFont TextComposer::resolveFont(const TextStyle& style) {
    static QHash<QString, QString> loadedFamilies;

    QFont font;
    if (!style.fontPath.isEmpty()) {
        auto it = loadedFamilies.constFind(style.fontPath);
        if (it == loadedFamilies.constEnd()) {
            const int id = QFontDatabase::addApplicationFont(style.fontPath);
            const QStringList families = QFontDatabase::applicationFontFamilies(id);
            it = loadedFamilies.insert(style.fontPath, families.isEmpty() ? QString() : families.first());
        }
        if (!it.value().isEmpty()) {
            font = QFont(it.value());
        } else {
            qCWarning(lcCompose) << "Cannot load font" << style.fontPath << "- using default";
        }
    }
    if (style.fontPath.isEmpty() && !style.fontFamily.isEmpty()) {
        font = QFont(style.fontFamily);
    }

    font.setPixelSize(qMax(1, style.pixelSize));
    font.setBold(style.bold);
    return font;
}

int TextComposer::textHeight(const QStringList& lines, const QFont& font) const {
    QFontMetrics fm(font);
    int total = 0;
    for (const auto& line : lines) {
        total += fm.boundingRect(line).height();
    }
    return total;
}

int TextComposer::paintLines(QPainter& painter, const QStringList& lines, const QFont& font,
                             const QColor& color, QPoint origin, int padding) const {
    painter.setFont(font);
    painter.setPen(color);

    QFontMetrics fm(font);
    int y = origin.y();
    for (const auto& line : lines) {
        const QRect bounds = fm.boundingRect(line);
        painter.drawText(QPoint(origin.x(), y + fm.ascent()), line);
        y += bounds.height() + padding;
    }
    return y;
}

QImage TextComposer::drawText(const QImage& base, const QString& text, const TextStyle& style,
                              const QPoint& origin) {
    QImage out = base.convertToFormat(QImage::Format_ARGB32);
    const QFont font = resolveFont(style);

    QPainter painter(&out);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    paintLines(painter, wrapText(text, style.wrapWidth), font, style.color, origin, style.padding);
    painter.end();
    return out;
}

QImage TextComposer::composeTitleCard(const QImage& templateImage, const QString& title,
                                      const TextStyle& style, const QString& channelName) {
    m_error.clear();
    if (templateImage.isNull() || templateImage.height() < 3) {
        m_error = "Title template is empty";
        return QImage();
    }

    qCInfo(lcCompose).noquote() << "Creating title card for:" << title;

    const QFont font = resolveFont(style);
    const QStringList lines = wrapText(title, style.wrapWidth);
    const int width = templateImage.width();
    const int height = templateImage.height();

    const int newHeight = qMax(1, height + textHeight(lines, font)
                                  + style.padding * (static_cast<int>(lines.size()) - 1)
                                  - TitleHeightTrim);
    const int topHeight = height / 2;
    const int bottomHeight = height - topHeight - 1;
    const int middleHeight = qMax(1, newHeight - topHeight - bottomHeight);

    const QImage src = templateImage.convertToFormat(QImage::Format_ARGB32);
    const QImage top = src.copy(0, 0, width, topHeight);
    const QImage middle = src.copy(0, topHeight, width, 1)
                              .scaled(width, middleHeight, Qt::IgnoreAspectRatio, Qt::FastTransformation);
    const QImage bottom = src.copy(0, topHeight + 1, width, bottomHeight);

    QImage card(width, newHeight, QImage::Format_ARGB32);
    card.fill(Qt::transparent);

    QPainter painter(&card);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.drawImage(0, 0, top);
    painter.drawImage(0, topHeight, middle);
    painter.drawImage(0, topHeight + middleHeight, bottom);

    paintLines(painter, lines, font, style.color, QPoint(TitleTextLeft, topHeight + style.padding),
               style.padding);

    if (!channelName.isEmpty()) {
        TextStyle channelStyle = style;
        channelStyle.pixelSize = ChannelNamePixelSize;
        channelStyle.bold = true;
        paintLines(painter, {channelName}, resolveFont(channelStyle), style.color,
                   ChannelNameOrigin, 0);
    }
    painter.end();
    return card;
}
