#pragma once

#include <QString>
#include <map>
#include <vector>
#include "AppConstants.h"
#include "SyncTypes.h"

enum class FrameType {
    Static,
    Flip
};

enum class FlipDirection {
    Forward,
    Backward
};

// One capture instant requested from the render surface.
struct FrameRequest {
    double time = 0.0;            // video time (seconds)
    FrameType type = FrameType::Static;
    int chapterIndex = 0;
    int pageIndex = 0;            // left page of the spread
    int flipFrame = -1;           // flip frames only
    FlipDirection flipDirection = FlipDirection::Forward;
    int wordIndex = -1;           // highlighted word, -1 for none
};

struct FramePlanOptions {
    double highlightInterval = AppConstants::DefaultHighlightInterval;  // <= 0 disables sampling
    int flipFrameCount = AppConstants::DefaultFlipFrameCount;
};

// Word timestamps per chapter index (chapter-relative times).
using ChapterTimestamps = std::map<int, std::vector<AudioTimestamp>>;

// Which frames a chapter needs. Two independent paths exist: the
// arithmetic estimate used while building the manifest and the explicit
// enumeration the renderer walks. Both share staticFramesForSpread() and
// must always agree.
namespace FramePlan {

// max(1, ceil(spreadDuration / interval)); 1 when sampling is disabled.
int staticFramesForSpread(double spreadDuration, double interval);

// Time from spread start (pages[spreadStart]) to the next spread start, or
// to the end of the chapter's last page.
double spreadDuration(const ChapterTiming& chapter, int spreadStart);

int estimateChapterFrameCount(const ChapterTiming& chapter,
                              double highlightInterval = AppConstants::DefaultHighlightInterval,
                              int flipFrameCount = AppConstants::DefaultFlipFrameCount);

std::vector<FrameRequest> planChapterFrames(const ChapterTiming& chapter,
                                            const std::vector<AudioTimestamp>& timestamps,
                                            const FramePlanOptions& options = {});

// Frames for every chapter of a manifest, in capture order.
std::vector<FrameRequest> planManifestFrames(const VideoManifest& manifest,
                                             const ChapterTimestamps& timestamps,
                                             const FramePlanOptions& options = {});

QString frameTypeName(FrameType type);
QString flipDirectionName(FlipDirection direction);

} // namespace FramePlan
