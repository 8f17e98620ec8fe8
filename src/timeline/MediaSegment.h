#pragma once

#include <QString>

enum class SegmentRole {
    Title,
    Body
};

// One narrated unit: an audio file and the card shown while it plays.
struct MediaSegment {
    int index = 0;                  // enumeration order, the title is 0
    SegmentRole role = SegmentRole::Body;
    QString audioPath;
    QString imagePath;              // empty = no visual payload
    double durationSeconds = 0.0;   // probed, >= 0

    bool hasImage() const { return !imagePath.isEmpty(); }
};
