#pragma once

#include <QString>
#include <QSize>
#include "AppConstants.h"
#include "LayoutMode.h"
#include "Renderer.h"

struct TitleSettings {
    QString templatePath = "assets/title_template.png";
    QString fontPath = "fonts/Roboto-Bold.ttf";
    int fontSize = 47;
    QString color = "#000000";
    int padding = 5;
    int wrap = 35;
    QString channelName = "Reddit Tales";
};

struct BackgroundSettings {
    double audioVolume = 0.15;
    bool enableExtraAudio = false;   // also render the narration-only variant
    QString credit;                  // author of the background clip
    QString creditFontPath = "fonts/Roboto-Regular.ttf";
    int creditFontSize = 5;
    QString creditFontColor = "White";
};

struct ThumbnailSettings {
    bool enabled = false;
    QString backgroundsDir = "assets/backgrounds";
    QString fontFamily = "arial";
    int fontSize = 96;
    QString fontColor = "255,255,255";
};

struct PathSettings {
    QString scratchRoot = "assets/temp";
    QString resultsRoot = "results";
    QString category = "AskReddit";
};

// Everything a render job reads, passed explicitly to each component.
struct RenderSettings {
    QSize resolution{AppConstants::DefaultVideoWidth, AppConstants::DefaultVideoHeight};
    double opacity = 0.9;
    LayoutMode layoutMode = LayoutMode::FlatComments;

    BackgroundSettings background;
    TitleSettings title;
    ThumbnailSettings thumbnail;
    EncoderSettings encoder;
    PathSettings paths;

    // Narration-only output needs an audible background track to differ from the main one
    bool rendersAudioOnlyVariant() const {
        return background.enableExtraAudio && background.audioVolume != 0.0;
    }
};
