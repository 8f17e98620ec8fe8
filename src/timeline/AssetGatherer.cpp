#include "AssetGatherer.h"
#include "DurationProbe.h"
#include "Logging.h"
#include <QFileInfo>

AssetGatherer::AssetGatherer(const ScratchLayout& layout, DurationProbe* probe)
    : m_layout(layout), m_probe(probe) {}

std::vector<MediaSegment> AssetGatherer::enumerate(LayoutMode mode, int itemCount) const {
    std::vector<MediaSegment> segments;

    MediaSegment title;
    title.index = 0;
    title.role = SegmentRole::Title;
    title.audioPath = m_layout.titleAudio();
    title.imagePath = m_layout.titleImage();
    segments.push_back(title);

    const int bodyCount = (mode == LayoutMode::StoryTitleAndBody) ? 1 : itemCount;
    for (int i = 0; i < bodyCount; ++i) {
        MediaSegment seg;
        seg.index = static_cast<int>(segments.size());
        seg.role = SegmentRole::Body;
        seg.audioPath = m_layout.bodyAudio(mode, i);
        seg.imagePath = m_layout.bodyImage(mode, i);
        segments.push_back(seg);
    }
    return segments;
}

bool AssetGatherer::gather(LayoutMode mode, int itemCount, std::vector<MediaSegment>& segments) {
    m_error = RenderError::None;
    m_errorString.clear();
    segments.clear();

    if (itemCount < 0) {
        return fail(RenderError::EmptySegmentSet,
                    QString("Invalid item count %1").arg(itemCount));
    }
    if (itemCount == 0 && LayoutModes::requiresBodyItems(mode)) {
        return fail(RenderError::EmptySegmentSet,
                    QString("No audio clips to gather for %1").arg(LayoutModes::toString(mode)));
    }
    if (!m_probe) {
        return fail(RenderError::Probe, "No duration probe configured");
    }

    std::vector<MediaSegment> refs = enumerate(mode, itemCount);

    // Every file must exist before anything is probed
    for (const auto& seg : refs) {
        if (!QFileInfo::exists(seg.audioPath)) {
            return fail(RenderError::MissingAsset,
                        QString("Missing audio for segment %1: %2").arg(seg.index).arg(seg.audioPath));
        }
        if (seg.hasImage() && !QFileInfo::exists(seg.imagePath)) {
            return fail(RenderError::MissingAsset,
                        QString("Missing image for segment %1: %2").arg(seg.index).arg(seg.imagePath));
        }
    }

    for (auto& seg : refs) {
        double seconds = 0.0;
        if (!m_probe->probeDuration(seg.audioPath, seconds)) {
            return fail(RenderError::Probe,
                        QString("Cannot probe %1: %2").arg(seg.audioPath, m_probe->errorString()));
        }
        if (seconds < 0.0) {
            return fail(RenderError::Probe,
                        QString("Negative duration %1 for %2").arg(seconds).arg(seg.audioPath));
        }
        seg.durationSeconds = seconds;
        qCDebug(lcAssets) << "Segment" << seg.index << seg.audioPath << seconds << "s";
    }

    segments = std::move(refs);
    qCInfo(lcAssets) << "Collected" << segments.size() << "segments for"
                     << LayoutModes::toString(mode);
    return true;
}

bool AssetGatherer::fail(RenderError error, const QString& message) {
    m_error = error;
    m_errorString = message;
    qCWarning(lcAssets).noquote() << renderErrorName(error) << message;
    return false;
}
