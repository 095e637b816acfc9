#pragma once

#include <QString>
#include <vector>
#include "AppConstants.h"
#include "Paginator.h"
#include "SyncTypes.h"

// Page and flip timing for audio-synchronized book video.
//
// All functions are pure and safe to call concurrently. Timestamp lists are
// assumed sorted by start and non-overlapping; callers that bypass
// JsonBookSource validation get unspecified (but bounded) results.
namespace SyncCalculator {

// Offsets (QString code units) where each word-like token begins.
// A token is a run of letters, digits and apostrophes.
std::vector<int> buildWordStartCharIndices(const QString& text);

// Index of the last word starting at or before charPos, clamped to the
// valid range. Returns 0 for an empty list.
int wordIndexAtCharPos(const std::vector<int>& wordStarts, int charPos);

// Word being spoken at `time`: the word whose [start, end] contains it, or
// else the most recently started word. -1 before the first word.
int findWordIndexByTime(const std::vector<AudioTimestamp>& timestamps, double time);

// Forces contiguous coverage of [0, totalDuration]: gaps and overlaps between
// neighbours are split at the midpoint, durations are recomputed.
void normalizePageTimings(std::vector<PageTiming>& pages, double totalDuration);

// One transition per spread boundary (pages i, i+1 -> i+2), centred on the
// spread's end time.
std::vector<FlipTransition> generateFlipTransitions(const std::vector<PageTiming>& pages,
                                                    double flipDuration);

ChapterTiming calculateChapterTiming(int chapterIndex,
                                     const QString& chapterTitle,
                                     const QString& chapterContent,
                                     const std::vector<AudioTimestamp>& timestamps,
                                     double audioDuration,
                                     FontSize fontSize,
                                     const Paginator& paginator,
                                     double flipDuration = AppConstants::DefaultFlipDuration);

// Whole-book manifest: chapter times are shifted into video time and the
// frame count is accumulated per chapter.
VideoManifest calculateBookTiming(qint64 bookId,
                                  const QString& bookTitle,
                                  const QString& author,
                                  const std::vector<ChapterInput>& chapters,
                                  FontSize fontSize,
                                  ReadingTheme theme,
                                  const Paginator& paginator,
                                  double flipDuration = AppConstants::DefaultFlipDuration,
                                  double highlightInterval = AppConstants::DefaultHighlightInterval,
                                  int flipFrameCount = AppConstants::DefaultFlipFrameCount);

// Manifest for a chapter-only export. The chapter starts at video time 0.
VideoManifest calculateSingleChapterTiming(qint64 bookId,
                                           const QString& bookTitle,
                                           const QString& author,
                                           const ChapterInput& chapter,
                                           FontSize fontSize,
                                           ReadingTheme theme,
                                           const Paginator& paginator,
                                           double flipDuration = AppConstants::DefaultFlipDuration,
                                           double highlightInterval = AppConstants::DefaultHighlightInterval,
                                           int flipFrameCount = AppConstants::DefaultFlipFrameCount);

// Rough size and processing-time estimate shown before an export starts.
ExportEstimate estimateExport(const VideoManifest& manifest);

} // namespace SyncCalculator
