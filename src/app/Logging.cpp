#include "Logging.h"

Q_LOGGING_CATEGORY(lcAssembly, "reelforge.assembly")
Q_LOGGING_CATEGORY(lcAssets, "reelforge.assets")
Q_LOGGING_CATEGORY(lcTimeline, "reelforge.timeline")
Q_LOGGING_CATEGORY(lcGraph, "reelforge.graph")
Q_LOGGING_CATEGORY(lcProgress, "reelforge.progress")
Q_LOGGING_CATEGORY(lcRender, "reelforge.render")
Q_LOGGING_CATEGORY(lcCompose, "reelforge.compose")
