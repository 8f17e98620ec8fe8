#pragma once

#include <QString>
#include "LayoutMode.h"

// Per-job scratch directory produced by the upstream steps (TTS, screenshots,
// background download):
//   <root>/<id>/background.mp4, background.mp3, content.json
//   <root>/<id>/mp3/...   one audio file per segment
//   <root>/<id>/png/...   one card per segment
class ScratchLayout {
public:
    ScratchLayout(const QString& scratchRoot, const QString& jobId);

    QString jobId() const { return m_jobId; }
    QString jobDir() const { return m_jobDir; }
    QString audioDir() const;
    QString imageDir() const;

    QString backgroundVideo() const;
    QString backgroundAudio() const;
    QString contentFile() const;

    QString titleAudio() const;
    QString titleImage() const;
    QString bodyAudio(LayoutMode mode, int index) const;
    QString bodyImage(LayoutMode mode, int index) const;

private:
    QString m_jobId;
    QString m_jobDir;
};

// Final outputs, grouped by category:
//   <root>/<category>/<name>.mp4
//   <root>/<category>/OnlyTTS/<name>.mp4
//   <root>/<category>/thumbnails/<name>.png
class ResultLayout {
public:
    ResultLayout(const QString& resultsRoot, const QString& category);

    QString categoryDir() const { return m_categoryDir; }
    QString mainVideo(const QString& name) const;
    QString audioOnlyVideo(const QString& name) const;
    QString thumbnail(const QString& name) const;

    bool ensureFolders(bool audioOnlyVariant, bool thumbnails);
    QString errorString() const { return m_error; }

private:
    bool ensureDir(const QString& path);

    QString m_categoryDir;
    QString m_error;
};
