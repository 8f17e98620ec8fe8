#pragma once

#include <QString>
#include <QRegularExpression>
#include "AppConstants.h"

namespace NameUtil {

// Drops filesystem-reserved characters and spells out slashes ("w/o", "9/10", "a/b")
inline QString normalizeTitle(const QString& title) {
    static const QRegularExpression reserved(R"([?\\"%*:|<>])");
    static const QRegularExpression without(R"( [wW]\s?/\s?[oO0])");
    static const QRegularExpression with(R"( [wW]\s?/)");
    static const QRegularExpression ratio(R"((\d+)\s?/\s?(\d+))");
    static const QRegularExpression alternative(R"((\w+)\s?/\s?(\w+))");

    QString name = title;
    name.remove(reserved);
    name.replace(without, " without");
    name.replace(with, " with");
    name.replace(ratio, "\\1 of \\2");
    name.replace(alternative, "\\1 or \\2");
    name.remove(QChar('/'));
    return name;
}

// Turns a content title into a file name usable on every common filesystem
inline QString normalizeFileName(const QString& title) {
    return normalizeTitle(title).left(AppConstants::MaxFileNameLength);
}

} // namespace NameUtil
