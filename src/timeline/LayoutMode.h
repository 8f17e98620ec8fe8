#pragma once

#include <QString>

enum class LayoutMode {
    FlatComments,           // title + one screenshot per comment
    StoryTitleAndBody,      // title + whole post as a single card
    StoryPerParagraph,      // title + one card per paragraph
    StoryPerParagraphBlank  // per-paragraph timing, transparent cards
};

namespace LayoutModes {

inline QString toString(LayoutMode mode) {
    switch (mode) {
        case LayoutMode::FlatComments:           return "flat_comments";
        case LayoutMode::StoryTitleAndBody:      return "story_title_and_body";
        case LayoutMode::StoryPerParagraph:      return "story_per_paragraph";
        case LayoutMode::StoryPerParagraphBlank: return "story_per_paragraph_blank";
    }
    return QString();
}

inline bool fromString(const QString& name, LayoutMode& mode) {
    const QString key = name.trimmed().toLower();
    if (key == "flat_comments")             mode = LayoutMode::FlatComments;
    else if (key == "story_title_and_body") mode = LayoutMode::StoryTitleAndBody;
    else if (key == "story_per_paragraph")  mode = LayoutMode::StoryPerParagraph;
    else if (key == "story_per_paragraph_blank") mode = LayoutMode::StoryPerParagraphBlank;
    else return false;
    return true;
}

// Only comment screenshots are alpha-mixed with the configured opacity
inline bool appliesOpacity(LayoutMode mode) {
    return mode == LayoutMode::FlatComments;
}

// StoryTitleAndBody reads a single body file regardless of the item count
inline bool requiresBodyItems(LayoutMode mode) {
    return mode != LayoutMode::StoryTitleAndBody;
}

} // namespace LayoutModes
