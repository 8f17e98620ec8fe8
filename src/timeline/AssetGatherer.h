#pragma once

#include <QString>
#include <vector>
#include "LayoutMode.h"
#include "MediaSegment.h"
#include "RenderError.h"
#include "ScratchLayout.h"

class DurationProbe;

// Resolves the ordered segment list for a layout mode: the title segment
// first, then the body segments in enumeration order, each with its
// probed audio duration. Source files are only read, never touched.
class AssetGatherer {
public:
    AssetGatherer(const ScratchLayout& layout, DurationProbe* probe);

    bool gather(LayoutMode mode, int itemCount, std::vector<MediaSegment>& segments);

    RenderError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    // Segment references for a mode without touching the filesystem
    std::vector<MediaSegment> enumerate(LayoutMode mode, int itemCount) const;

private:
    bool fail(RenderError error, const QString& message);

    ScratchLayout m_layout;
    DurationProbe* m_probe;
    RenderError m_error = RenderError::None;
    QString m_errorString;
};
