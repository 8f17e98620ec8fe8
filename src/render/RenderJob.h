#pragma once

#include <QString>
#include <vector>
#include "LayoutMode.h"
#include "MediaSegment.h"

struct RenderJob {
    QString backgroundVideoPath;
    QString backgroundAudioPath;    // only read when backgroundAudioVolume > 0
    std::vector<MediaSegment> segments;
    LayoutMode mode = LayoutMode::FlatComments;
    int width = 1080;
    int height = 1920;
    double opacity = 1.0;
    double backgroundAudioVolume = 0.0;

    // Credit drawn in the bottom-right corner, skipped when empty
    QString creditText;
    QString creditFontPath;
    int creditFontSize = 5;
    QString creditFontColor = "White";

    QString mainOutputPath;
    QString audioOnlyOutputPath;    // empty = no narration-only variant

    bool hasBackgroundAudio() const { return backgroundAudioVolume != 0.0; }
    bool wantsAudioOnlyVariant() const {
        return !audioOnlyOutputPath.isEmpty() && hasBackgroundAudio();
    }
};
