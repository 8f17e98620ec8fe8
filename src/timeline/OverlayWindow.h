#pragma once

enum class OverlayAnchor {
    Center
};

struct OverlayWindow {
    int segmentIndex = 0;
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    OverlayAnchor anchor = OverlayAnchor::Center;
    double opacity = 1.0;   // 0.0 - 1.0

    double length() const { return endSeconds - startSeconds; }
};
