#include "TimelineBuilder.h"
#include "Logging.h"
#include <cmath>

namespace {

std::vector<OverlayWindow> windowSequence(const std::vector<MediaSegment>& segments, double opacity) {
    std::vector<OverlayWindow> windows;
    windows.reserve(segments.size());

    double cursor = 0.0;
    for (const auto& seg : segments) {
        OverlayWindow w;
        w.segmentIndex = seg.index;
        w.startSeconds = cursor;
        w.endSeconds = cursor + seg.durationSeconds;
        w.opacity = opacity;
        windows.push_back(w);
        cursor = w.endSeconds;
    }
    return windows;
}

std::vector<OverlayWindow> windowFlatComments(const std::vector<MediaSegment>& segments,
                                              const TimelineConfig& config) {
    return windowSequence(segments, config.opacity);
}

std::vector<OverlayWindow> windowTitleAndBody(const std::vector<MediaSegment>& segments,
                                              const TimelineConfig&) {
    return windowSequence(segments, 1.0);
}

std::vector<OverlayWindow> windowPerParagraph(const std::vector<MediaSegment>& segments,
                                              const TimelineConfig&) {
    return windowSequence(segments, 1.0);
}

// Same timing as per-paragraph; the cards themselves are transparent placeholders
std::vector<OverlayWindow> windowPerParagraphBlank(const std::vector<MediaSegment>& segments,
                                                   const TimelineConfig& config) {
    return windowPerParagraph(segments, config);
}

} // namespace

TimelineBuilder::TimelineBuilder(const TimelineConfig& config)
    : m_config(config) {}

bool TimelineBuilder::build(const std::vector<MediaSegment>& segments,
                            std::vector<OverlayWindow>& windows) {
    m_error = RenderError::None;
    m_errorString.clear();
    windows.clear();

    if (segments.empty()) {
        return fail(RenderError::EmptySegmentSet, "No segments to place on the timeline");
    }
    if (segments.front().role != SegmentRole::Title) {
        return fail(RenderError::EmptySegmentSet, "Timeline must start with the title segment");
    }
    for (const auto& seg : segments) {
        if (!(seg.durationSeconds >= 0.0) || std::isinf(seg.durationSeconds)) {
            return fail(RenderError::Probe,
                        QString("Segment %1 has an invalid duration").arg(seg.index));
        }
    }

    switch (m_config.mode) {
        case LayoutMode::FlatComments:
            windows = windowFlatComments(segments, m_config);
            break;
        case LayoutMode::StoryTitleAndBody:
            if (segments.size() != 2) {
                return fail(RenderError::EmptySegmentSet,
                            QString("Title-and-body layout needs exactly 2 segments, got %1")
                                .arg(segments.size()));
            }
            windows = windowTitleAndBody(segments, m_config);
            break;
        case LayoutMode::StoryPerParagraph:
            windows = windowPerParagraph(segments, m_config);
            break;
        case LayoutMode::StoryPerParagraphBlank:
            windows = windowPerParagraphBlank(segments, m_config);
            break;
    }

    for (const auto& w : windows) {
        if (w.length() == 0.0) {
            qCWarning(lcTimeline) << "Segment" << w.segmentIndex
                                  << "has zero duration; keeping a zero-width window at"
                                  << w.startSeconds;
        }
    }

    qCDebug(lcTimeline) << "Built" << windows.size() << "windows for"
                        << LayoutModes::toString(m_config.mode)
                        << "ending at" << timelineEnd(windows);
    return true;
}

double TimelineBuilder::totalDuration(const std::vector<MediaSegment>& segments) {
    double total = 0.0;
    for (const auto& seg : segments) {
        total += seg.durationSeconds;
    }
    return total;
}

double TimelineBuilder::timelineEnd(const std::vector<OverlayWindow>& windows) {
    return windows.empty() ? 0.0 : windows.back().endSeconds;
}

bool TimelineBuilder::isContiguous(const std::vector<OverlayWindow>& windows, double expectedTotal,
                                   double tolerance) {
    if (windows.empty()) return false;
    if (std::abs(windows.front().startSeconds) > tolerance) return false;

    for (size_t i = 0; i + 1 < windows.size(); ++i) {
        if (std::abs(windows[i].endSeconds - windows[i + 1].startSeconds) > tolerance) return false;
        if (windows[i].endSeconds < windows[i].startSeconds) return false;
    }
    if (windows.back().endSeconds < windows.back().startSeconds) return false;
    return std::abs(windows.back().endSeconds - expectedTotal) <= tolerance;
}

bool TimelineBuilder::fail(RenderError error, const QString& message) {
    m_error = error;
    m_errorString = message;
    qCWarning(lcTimeline) << renderErrorName(error) << message;
    return false;
}
