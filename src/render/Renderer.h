#pragma once

#include <QString>
#include <QStringList>
#include "CompositionGraph.h"
#include "ProgressMonitor.h"
#include "RenderError.h"

class EncoderProcess;

struct EncoderSettings {
    QString program = "ffmpeg";
    QString videoCodec = "h264";
    QString videoBitrate = "20M";
    QString audioBitrate = "192k";
    QString format = "mp4";
    int threads = 0;            // 0 = one per core

    int effectiveThreads() const;
};

// Runs the encoder once per call for one output variant. A fresh
// ProgressMonitor lives for the duration of each call; once the encoder
// exits the monitor is stopped and, on success, progress is pinned to 1.0.
// Failed encodes are not retried and their partial output is left in place.
class Renderer {
public:
    Renderer(EncoderProcess* encoder, const EncoderSettings& settings);

    void setPollInterval(int intervalMs) { m_pollIntervalMs = intervalMs; }

    bool render(const CompositionGraph& graph, const QString& outputPath,
                double expectedDurationSeconds, const ProgressCallback& progress);

    QStringList buildArguments(const CompositionGraph& graph, const QString& outputPath,
                               const QString& progressChannel) const;

    RenderError error() const { return m_error; }
    QString errorString() const { return m_errorString; }
    QString diagnostics() const { return m_diagnostics; }
    QString producedPath() const { return m_producedPath; }

private:
    bool fail(RenderError error, const QString& message);

    EncoderProcess* m_encoder;
    EncoderSettings m_settings;
    int m_pollIntervalMs;

    RenderError m_error = RenderError::None;
    QString m_errorString;
    QString m_diagnostics;
    QString m_producedPath;
};
