#pragma once

#include <QString>

// Read-only duration lookup for a media file.
class DurationProbe {
public:
    virtual ~DurationProbe() = default;

    virtual bool probeDuration(const QString& filePath, double& seconds) = 0;
    virtual QString errorString() const = 0;
};
