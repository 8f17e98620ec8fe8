#pragma once

#include <QString>

enum class RenderError {
    None,
    MissingAsset,     // referenced audio/image file absent
    Probe,            // duration probe failed
    EmptySegmentSet,  // mode needs body segments but none were enumerated
    GraphBuild,       // invariant violated while composing the graph
    Encode,           // external encoder failed
    Config,           // invalid settings file
    Compose           // title/thumbnail image could not be produced
};

inline QString renderErrorName(RenderError error) {
    switch (error) {
        case RenderError::None:            return "NoError";
        case RenderError::MissingAsset:    return "MissingAssetError";
        case RenderError::Probe:           return "ProbeError";
        case RenderError::EmptySegmentSet: return "EmptySegmentSetError";
        case RenderError::GraphBuild:      return "GraphBuildError";
        case RenderError::Encode:          return "EncodeError";
        case RenderError::Config:          return "ConfigError";
        case RenderError::Compose:         return "ComposeError";
    }
    return "UnknownError";
}
