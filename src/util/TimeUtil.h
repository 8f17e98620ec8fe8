#pragma once

#include <QString>

namespace TimeUtil {

// Video length as reported after timeline assembly, e.g. "1 min 5 s"
inline QString secondsToMinutesText(double totalSeconds) {
    int whole = static_cast<int>(totalSeconds);
    return QString("%1 min %2 s").arg(whole / 60).arg(whole % 60);
}

// Fraction in [0, 1] rendered as "NN.NN%"
inline QString fractionToPercent(double fraction) {
    return QString("%1%").arg(fraction * 100.0, 0, 'f', 2);
}

} // namespace TimeUtil
