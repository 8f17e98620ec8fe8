#pragma once

#include <QString>
#include <vector>
#include "CompositionGraph.h"
#include "OverlayWindow.h"
#include "RenderError.h"
#include "RenderJob.h"

enum class AudioVariant {
    Mixed,          // narration mixed with the background track (if audible)
    NarrationOnly   // narration alone, for the audio-only variant
};

// Builds the filter graph for one render invocation:
//   background -> crop to W/H -> overlay each card inside its [start, end) window
//   -> credit text -> scale to W x H
//   narration clips -> concat (-> amix with background audio)
// The builder keeps no state between builds.
class CompositionGraphBuilder {
public:
    bool build(const RenderJob& job, const std::vector<OverlayWindow>& windows,
               AudioVariant variant, CompositionGraph& graph);

    RenderError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    static int overlayWidth(int videoWidth);
    static QString enableExpression(const OverlayWindow& window);

private:
    bool checkJob(const RenderJob& job, const std::vector<OverlayWindow>& windows,
                  AudioVariant variant);
    bool fail(const QString& message);

    RenderError m_error = RenderError::None;
    QString m_errorString;
};
