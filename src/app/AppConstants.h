#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "ReelForge";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "ReelForge";

    inline constexpr int DefaultVideoWidth = 1080;
    inline constexpr int DefaultVideoHeight = 1920;

    // Overlay images are scaled to this percentage of the output width
    inline constexpr int ScreenshotWidthPercent = 45;

    // ProgressMonitor polls the encoder's progress channel at this interval
    inline constexpr int ProgressPollIntervalMs = 1000;

    // Output file names are truncated to this many characters
    inline constexpr int MaxFileNameLength = 251;

    inline constexpr double MicrosecondsPerSecond = 1000000.0;
}
