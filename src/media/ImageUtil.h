#pragma once

#include <QImage>
#include <QString>

namespace ImageUtil {
    // Fully transparent ARGB card, used where a segment keeps its timing
    // but shows nothing
    QImage createTransparentPlaceholder(int width, int height);
    bool writeTransparentPlaceholder(const QString& path, int width, int height, QString* error = nullptr);

    // "255,255,255", "#rrggbb" or an SVG color name
    QColor parseColor(const QString& text, const QColor& fallback);
}
