#include "ImageUtil.h"
#include <QColor>
#include <QDir>
#include <QFileInfo>
#include <QStringList>

namespace ImageUtil {

QImage createTransparentPlaceholder(int width, int height) {
    QImage img(qMax(1, width), qMax(1, height), QImage::Format_ARGB32);
    img.fill(Qt::transparent);
    return img;
}

bool writeTransparentPlaceholder(const QString& path, int width, int height, QString* error) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    if (!createTransparentPlaceholder(width, height).save(path, "PNG")) {
        if (error) *error = QString("Cannot write placeholder: %1").arg(path);
        return false;
    }
    return true;
}

QColor parseColor(const QString& text, const QColor& fallback) {
    const QString value = text.trimmed();
    if (value.isEmpty()) return fallback;

    const QStringList parts = value.split(',');
    if (parts.size() == 3 || parts.size() == 4) {
        int channels[4] = {0, 0, 0, 255};
        for (int i = 0; i < parts.size(); ++i) {
            bool ok = false;
            channels[i] = parts[i].trimmed().toInt(&ok);
            if (!ok || channels[i] < 0 || channels[i] > 255) return fallback;
        }
        return QColor(channels[0], channels[1], channels[2], channels[3]);
    }

    QColor color(value);
    return color.isValid() ? color : fallback;
}

} // namespace ImageUtil
