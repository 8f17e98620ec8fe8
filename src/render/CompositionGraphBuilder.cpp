#include "CompositionGraphBuilder.h"
#include "AppConstants.h"
#include "Logging.h"
#include "TimelineBuilder.h"
#include <QFileInfo>

// Half-open so a card switches off on the frame where the next one starts
QString CompositionGraphBuilder::enableExpression(const OverlayWindow& window) {
    return QString("gte(t,%1)*lt(t,%2)")
        .arg(CompositionGraph::formatNumber(window.startSeconds),
             CompositionGraph::formatNumber(window.endSeconds));
}

int CompositionGraphBuilder::overlayWidth(int videoWidth) {
    return (videoWidth * AppConstants::ScreenshotWidthPercent) / 100;
}

bool CompositionGraphBuilder::build(const RenderJob& job, const std::vector<OverlayWindow>& windows,
                                    AudioVariant variant, CompositionGraph& graph) {
    m_error = RenderError::None;
    m_errorString.clear();
    graph.clear();

    if (!checkJob(job, windows, variant))
        return false;

    // 1. Base stream: background cropped to the target aspect ratio, full height
    NodeId bg = graph.addInput(job.backgroundVideoPath, StreamType::Video);
    NodeId video = graph.addFilter(NodeKind::Crop, StreamType::Video, {bg}, {
        {"", QString("ih*(%1/%2)").arg(job.width).arg(job.height)},
        {"", "ih"}
    });

    // 2. One centered card per window, visible only inside [start, end)
    const int cardWidth = overlayWidth(job.width);
    const bool mixOpacity = LayoutModes::appliesOpacity(job.mode);
    for (size_t i = 0; i < windows.size(); ++i) {
        const OverlayWindow& w = windows[i];
        const MediaSegment& seg = job.segments[i];
        if (!seg.hasImage()) continue;

        NodeId img = graph.addInput(seg.imagePath, StreamType::Video);
        NodeId card = graph.addFilter(NodeKind::Scale, StreamType::Video, {img}, {
            {"", QString::number(cardWidth)},
            {"", "-1"}
        });
        if (mixOpacity) {
            card = graph.addFilter(NodeKind::ColorMix, StreamType::Video, {card}, {
                {"aa", CompositionGraph::formatNumber(w.opacity)}
            });
        }
        video = graph.addFilter(NodeKind::Overlay, StreamType::Video, {video, card}, {
            {"enable", enableExpression(w)},
            {"x", "(main_w-overlay_w)/2"},
            {"y", "(main_h-overlay_h)/2"}
        });
    }

    // 3. Narration in window order
    std::vector<NodeId> clips;
    clips.reserve(job.segments.size());
    for (const auto& seg : job.segments) {
        clips.push_back(graph.addInput(seg.audioPath, StreamType::Audio));
    }
    NodeId audio = graph.addFilter(NodeKind::ConcatAudio, StreamType::Audio, clips, {
        {"n", QString::number(clips.size())},
        {"v", "0"},
        {"a", "1"}
    });

    // 4. Background track, only when audible
    if (variant == AudioVariant::Mixed && job.hasBackgroundAudio()) {
        NodeId bgAudio = graph.addInput(job.backgroundAudioPath, StreamType::Audio);
        NodeId scaled = graph.addFilter(NodeKind::Volume, StreamType::Audio, {bgAudio}, {
            {"", CompositionGraph::formatNumber(job.backgroundAudioVolume)}
        });
        audio = graph.addFilter(NodeKind::MixAudio, StreamType::Audio, {audio, scaled}, {
            {"inputs", "2"},
            {"duration", "longest"}
        });
    }

    // 5. Credit in the bottom-right corner
    if (!job.creditText.isEmpty()) {
        std::vector<NodeParam> params = {
            {"text", job.creditText},
            {"x", "(w-text_w)"},
            {"y", "(h-text_h)"},
            {"fontsize", QString::number(job.creditFontSize)},
            {"fontcolor", job.creditFontColor},
            {"expansion", "none"}   // credits are literal text, '%' included
        };
        if (!job.creditFontPath.isEmpty()) {
            params.push_back({"fontfile", job.creditFontPath});
        }
        video = graph.addFilter(NodeKind::DrawText, StreamType::Video, {video}, params);
    }

    // 6. Exact output size
    video = graph.addFilter(NodeKind::Scale, StreamType::Video, {video}, {
        {"", QString::number(job.width)},
        {"", QString::number(job.height)}
    });

    graph.addOutput(video, audio);

    QString graphError;
    if (!graph.validate(&graphError)) {
        graph.clear();
        return fail(graphError);
    }

    qCDebug(lcGraph) << "Graph for" << LayoutModes::toString(job.mode)
                     << (variant == AudioVariant::Mixed ? "(mixed)" : "(narration only)")
                     << "has" << graph.nodeCount() << "nodes";
    return true;
}

bool CompositionGraphBuilder::checkJob(const RenderJob& job, const std::vector<OverlayWindow>& windows,
                                       AudioVariant variant) {
    if (job.width <= 0 || job.height <= 0)
        return fail(QString("Invalid resolution %1x%2").arg(job.width).arg(job.height));
    if (job.opacity < 0.0 || job.opacity > 1.0)
        return fail(QString("Opacity %1 outside [0, 1]").arg(job.opacity));
    if (job.backgroundAudioVolume < 0.0)
        return fail(QString("Negative background volume %1").arg(job.backgroundAudioVolume));

    if (job.segments.empty())
        return fail("Job has no segments");
    if (windows.size() != job.segments.size())
        return fail(QString("%1 windows for %2 segments").arg(windows.size()).arg(job.segments.size()));
    for (size_t i = 0; i < windows.size(); ++i) {
        if (windows[i].segmentIndex != job.segments[i].index)
            return fail(QString("Window %1 does not match segment order").arg(i));
    }
    if (!TimelineBuilder::isContiguous(windows, TimelineBuilder::totalDuration(job.segments)))
        return fail("Overlay windows are not contiguous");

    if (!QFileInfo::exists(job.backgroundVideoPath))
        return fail(QString("Missing background video: %1").arg(job.backgroundVideoPath));
    if (variant == AudioVariant::Mixed && job.hasBackgroundAudio() &&
        !QFileInfo::exists(job.backgroundAudioPath))
        return fail(QString("Missing background audio: %1").arg(job.backgroundAudioPath));

    for (const auto& seg : job.segments) {
        if (!QFileInfo::exists(seg.audioPath))
            return fail(QString("Missing audio for segment %1: %2").arg(seg.index).arg(seg.audioPath));
        if (seg.hasImage() && !QFileInfo::exists(seg.imagePath))
            return fail(QString("Missing image for segment %1: %2").arg(seg.index).arg(seg.imagePath));
    }

    if (!job.creditText.isEmpty() && !job.creditFontPath.isEmpty() &&
        !QFileInfo::exists(job.creditFontPath))
        return fail(QString("Missing credit font: %1").arg(job.creditFontPath));

    return true;
}

bool CompositionGraphBuilder::fail(const QString& message) {
    m_error = RenderError::GraphBuild;
    m_errorString = message;
    qCWarning(lcGraph).noquote() << renderErrorName(m_error) << message;
    return false;
}
