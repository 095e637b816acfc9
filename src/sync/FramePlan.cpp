#include "FramePlan.h"
#include "SyncCalculator.h"

#include <algorithm>
#include <cmath>

namespace {

bool samplesWords(const ChapterTiming& chapter, double interval) {
    return chapter.hasTimestamps && interval > 0.0;
}

} // namespace

namespace FramePlan {

int staticFramesForSpread(double spreadDuration, double interval) {
    if (interval <= 0.0) return 1;
    return std::max(1, static_cast<int>(std::ceil(spreadDuration / interval)));
}

double spreadDuration(const ChapterTiming& chapter, int spreadStart) {
    const auto& pages = chapter.pages;
    if (spreadStart < 0 || spreadStart >= static_cast<int>(pages.size())) return 0.0;

    const double start = pages[spreadStart].startTime;
    const double end = spreadStart + 2 < static_cast<int>(pages.size())
        ? pages[spreadStart + 2].startTime
        : pages.back().endTime;
    return end - start;
}

int estimateChapterFrameCount(const ChapterTiming& chapter, double highlightInterval,
                              int flipFrameCount) {
    int staticFrames = 0;
    if (samplesWords(chapter, highlightInterval)) {
        for (int i = 0; i < static_cast<int>(chapter.pages.size()); i += 2) {
            staticFrames += staticFramesForSpread(spreadDuration(chapter, i), highlightInterval);
        }
    } else {
        // One frame per spread of timed pages
        staticFrames = (static_cast<int>(chapter.pages.size()) + 1) / 2;
    }

    const int flipFrames = static_cast<int>(chapter.flipTransitions.size()) * flipFrameCount;
    return staticFrames + flipFrames;
}

std::vector<FrameRequest> planChapterFrames(const ChapterTiming& chapter,
                                            const std::vector<AudioTimestamp>& timestamps,
                                            const FramePlanOptions& options) {
    std::vector<FrameRequest> frames;
    const bool sampling = samplesWords(chapter, options.highlightInterval);

    for (int i = 0; i < static_cast<int>(chapter.pages.size()); i += 2) {
        const double spreadStart = chapter.pages[i].startTime;
        const int count = sampling
            ? staticFramesForSpread(spreadDuration(chapter, i), options.highlightInterval)
            : 1;

        for (int k = 0; k < count; ++k) {
            FrameRequest frame;
            frame.type = FrameType::Static;
            frame.chapterIndex = chapter.chapterIndex;
            frame.pageIndex = i;
            if (sampling) {
                frame.time = spreadStart + k * options.highlightInterval;
                frame.wordIndex = SyncCalculator::findWordIndexByTime(
                    timestamps, frame.time - chapter.timeOffset);
            } else {
                frame.time = spreadStart;
            }
            frames.push_back(frame);
        }
    }

    for (const FlipTransition& flip : chapter.flipTransitions) {
        for (int f = 0; f < options.flipFrameCount; ++f) {
            FrameRequest frame;
            frame.time = flip.startTime
                + (static_cast<double>(f) / options.flipFrameCount) * flip.duration;
            frame.type = FrameType::Flip;
            frame.chapterIndex = chapter.chapterIndex;
            frame.pageIndex = flip.fromPage;
            frame.flipFrame = f;
            frame.flipDirection = FlipDirection::Forward;
            frames.push_back(frame);
        }
    }

    return frames;
}

std::vector<FrameRequest> planManifestFrames(const VideoManifest& manifest,
                                             const ChapterTimestamps& timestamps,
                                             const FramePlanOptions& options) {
    static const std::vector<AudioTimestamp> none;
    std::vector<FrameRequest> frames;
    for (const ChapterTiming& chapter : manifest.chapters) {
        auto it = timestamps.find(chapter.chapterIndex);
        const auto& words = it != timestamps.end() ? it->second : none;
        auto chapterFrames = planChapterFrames(chapter, words, options);
        frames.insert(frames.end(), chapterFrames.begin(), chapterFrames.end());
    }
    return frames;
}

QString frameTypeName(FrameType type) {
    return type == FrameType::Flip ? QStringLiteral("flip") : QStringLiteral("static");
}

QString flipDirectionName(FlipDirection direction) {
    return direction == FlipDirection::Backward ? QStringLiteral("backward")
                                                : QStringLiteral("forward");
}

} // namespace FramePlan
