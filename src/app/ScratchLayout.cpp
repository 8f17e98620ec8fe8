#include "ScratchLayout.h"
#include "Logging.h"
#include <QDir>

ScratchLayout::ScratchLayout(const QString& scratchRoot, const QString& jobId)
    : m_jobId(jobId)
    , m_jobDir(QDir(scratchRoot).filePath(jobId)) {}

QString ScratchLayout::audioDir() const {
    return QDir(m_jobDir).filePath("mp3");
}

QString ScratchLayout::imageDir() const {
    return QDir(m_jobDir).filePath("png");
}

QString ScratchLayout::backgroundVideo() const {
    return QDir(m_jobDir).filePath("background.mp4");
}

QString ScratchLayout::backgroundAudio() const {
    return QDir(m_jobDir).filePath("background.mp3");
}

QString ScratchLayout::contentFile() const {
    return QDir(m_jobDir).filePath("content.json");
}

QString ScratchLayout::titleAudio() const {
    return QDir(audioDir()).filePath("title.mp3");
}

QString ScratchLayout::titleImage() const {
    return QDir(imageDir()).filePath("title.png");
}

QString ScratchLayout::bodyAudio(LayoutMode mode, int index) const {
    QDir dir(audioDir());
    switch (mode) {
        case LayoutMode::FlatComments:
            return dir.filePath(QString("%1.mp3").arg(index));
        case LayoutMode::StoryTitleAndBody:
            return dir.filePath("postaudio.mp3");
        case LayoutMode::StoryPerParagraph:
        case LayoutMode::StoryPerParagraphBlank:
            return dir.filePath(QString("postaudio-%1.mp3").arg(index));
    }
    return QString();
}

QString ScratchLayout::bodyImage(LayoutMode mode, int index) const {
    QDir dir(imageDir());
    switch (mode) {
        case LayoutMode::FlatComments:
            return dir.filePath(QString("comment_%1.png").arg(index));
        case LayoutMode::StoryTitleAndBody:
            return dir.filePath("story_content.png");
        case LayoutMode::StoryPerParagraph:
            return dir.filePath(QString("img%1.png").arg(index));
        case LayoutMode::StoryPerParagraphBlank:
            return dir.filePath(QString("trs%1.png").arg(index));
    }
    return QString();
}

ResultLayout::ResultLayout(const QString& resultsRoot, const QString& category)
    : m_categoryDir(QDir(resultsRoot).filePath(category)) {}

QString ResultLayout::mainVideo(const QString& name) const {
    return QDir(m_categoryDir).filePath(name + ".mp4");
}

QString ResultLayout::audioOnlyVideo(const QString& name) const {
    return QDir(m_categoryDir).filePath("OnlyTTS/" + name + ".mp4");
}

QString ResultLayout::thumbnail(const QString& name) const {
    return QDir(m_categoryDir).filePath("thumbnails/" + name + ".png");
}

bool ResultLayout::ensureFolders(bool audioOnlyVariant, bool thumbnails) {
    if (!ensureDir(m_categoryDir)) return false;
    if (audioOnlyVariant && !ensureDir(QDir(m_categoryDir).filePath("OnlyTTS"))) return false;
    if (thumbnails && !ensureDir(QDir(m_categoryDir).filePath("thumbnails"))) return false;
    return true;
}

bool ResultLayout::ensureDir(const QString& path) {
    QDir dir(path);
    if (dir.exists()) return true;

    if (!QDir().mkpath(path)) {
        m_error = QString("Cannot create folder: %1").arg(path);
        return false;
    }
    qCInfo(lcAssembly) << "Created missing results folder" << path;
    return true;
}
