#pragma once

#include <QString>
#include <vector>
#include "LayoutMode.h"
#include "MediaSegment.h"
#include "OverlayWindow.h"
#include "RenderError.h"

struct TimelineConfig {
    LayoutMode mode = LayoutMode::FlatComments;
    double opacity = 1.0;
};

// Turns probed segment durations into back-to-back overlay windows.
// Every mode keeps the same invariant: window[0] starts at 0, each window
// starts where the previous one ended and the last one ends at the sum of
// all durations. Zero-length segments yield zero-width windows.
class TimelineBuilder {
public:
    explicit TimelineBuilder(const TimelineConfig& config);

    bool build(const std::vector<MediaSegment>& segments, std::vector<OverlayWindow>& windows);

    RenderError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    static double totalDuration(const std::vector<MediaSegment>& segments);
    static double timelineEnd(const std::vector<OverlayWindow>& windows);
    static bool isContiguous(const std::vector<OverlayWindow>& windows, double expectedTotal,
                             double tolerance = 1e-6);

private:
    bool fail(RenderError error, const QString& message);

    TimelineConfig m_config;
    RenderError m_error = RenderError::None;
    QString m_errorString;
};
