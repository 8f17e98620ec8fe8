#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <vector>
#include "OverlayWindow.h"
#include "RenderError.h"
#include "RenderJob.h"
#include "RenderSettings.h"
#include "ScratchLayout.h"

class DurationProbe;
class EncoderProcess;

struct AssemblyRequest {
    QString jobId;          // scratch directory name
    QString title;          // content title, also the source of the output name
    int itemCount = 0;      // body items (comments or paragraphs)
};

enum class RenderVariant {
    Main,
    AudioOnly
};
Q_DECLARE_METATYPE(RenderVariant)

// Drives one job through the pipeline: title card, asset gathering,
// timeline, thumbnail, then one graph build and one encode per variant.
// The main variant always renders first; the narration-only variant is
// skipped when the main one fails.
class VideoAssembler : public QObject {
    Q_OBJECT
public:
    VideoAssembler(const RenderSettings& settings, DurationProbe* probe,
                   EncoderProcess* encoder, QObject* parent = nullptr);
    ~VideoAssembler();

    void setPollInterval(int intervalMs) { m_pollIntervalMs = intervalMs; }

    bool assemble(const AssemblyRequest& request);

    RenderError error() const { return m_error; }
    QString errorString() const { return m_errorString; }
    QString diagnostics() const { return m_diagnostics; }

    QStringList producedPaths() const { return m_producedPaths; }
    QString thumbnailPath() const { return m_thumbnailPath; }
    double videoLength() const { return m_videoLength; }

    static QString variantName(RenderVariant variant);

signals:
    void stageStarted(const QString& description);
    // Emitted from the progress polling thread while an encode runs
    void progress(RenderVariant variant, double fraction);

private:
    bool prepareTitleCard(const ScratchLayout& layout, const QString& title);
    bool preparePlaceholders(const ScratchLayout& layout, int itemCount);
    void prepareThumbnail(ResultLayout& results, const QString& title, const QString& name);
    bool renderVariant(RenderVariant variant, const RenderJob& job,
                       const std::vector<OverlayWindow>& windows, const QString& outputPath);
    bool fail(RenderError error, const QString& message);

    RenderSettings m_settings;
    DurationProbe* m_probe;
    EncoderProcess* m_encoder;
    int m_pollIntervalMs;

    RenderError m_error = RenderError::None;
    QString m_errorString;
    QString m_diagnostics;
    QStringList m_producedPaths;
    QString m_thumbnailPath;
    double m_videoLength = 0.0;
};
