#pragma once

#include <QObject>
#include <QString>
#include "DurationProbe.h"

struct MediaInfo {
    QString filePath;
    double duration = 0.0;
    bool hasDuration = false;   // false when neither container nor streams report one
    bool hasVideo = false;
    bool hasAudio = false;
    int audioSampleRate = 0;
    int audioChannels = 0;
};

class MediaProbe : public QObject, public DurationProbe {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe();

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }

    bool probeDuration(const QString& filePath, double& seconds) override;
    QString errorString() const override { return m_error; }

private:
    MediaInfo m_info;
    QString m_error;
};
