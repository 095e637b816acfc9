#include "SyncCalculator.h"
#include "FramePlan.h"
#include "Log.h"

#include <QRegularExpression>
#include <algorithm>
#include <cmath>

namespace {

double wordStartTime(const std::vector<AudioTimestamp>& timestamps, int wordIndex) {
    if (wordIndex < 0 || wordIndex >= static_cast<int>(timestamps.size())) return 0.0;
    return timestamps[wordIndex].start;
}

double wordEndTime(const std::vector<AudioTimestamp>& timestamps, int wordIndex) {
    if (wordIndex < 0 || wordIndex >= static_cast<int>(timestamps.size())) {
        return timestamps.empty() ? 0.0 : timestamps.back().end;
    }
    return timestamps[wordIndex].end;
}

// Even split of the narration when no word timing exists.
std::vector<PageTiming> evenPageTimings(const PaginatedContent& content, double audioDuration) {
    std::vector<PageTiming> timings;
    const double timePerPage = audioDuration / std::max(1, content.totalPages);

    for (int i = 0; i < content.totalPages; ++i) {
        PageTiming t;
        t.pageIndex = i;
        t.startTime = i * timePerPage;
        t.endTime = (i + 1) * timePerPage;
        t.duration = timePerPage;
        if (i < static_cast<int>(content.pages.size()) && !content.pages[i].empty()) {
            t.startCharIndex = content.pages[i].front().startCharIndex;
            t.endCharIndex = content.pages[i].back().endCharIndex;
        }
        timings.push_back(t);
    }
    return timings;
}

void shiftChapter(ChapterTiming& chapter, double offset) {
    chapter.timeOffset = offset;
    for (auto& page : chapter.pages) {
        page.startTime += offset;
        page.endTime += offset;
    }
    for (auto& flip : chapter.flipTransitions) {
        flip.startTime += offset;
        flip.endTime += offset;
    }
}

} // namespace

namespace SyncCalculator {

std::vector<int> buildWordStartCharIndices(const QString& text) {
    static const QRegularExpression wordRe(QStringLiteral("[\\p{L}\\p{N}'\\x{2019}]+"),
                                           QRegularExpression::UseUnicodePropertiesOption);
    std::vector<int> indices;
    auto it = wordRe.globalMatch(text);
    while (it.hasNext()) {
        indices.push_back(static_cast<int>(it.next().capturedStart()));
    }
    return indices;
}

int wordIndexAtCharPos(const std::vector<int>& wordStarts, int charPos) {
    if (wordStarts.empty()) return 0;
    auto upper = std::upper_bound(wordStarts.begin(), wordStarts.end(), charPos);
    int idx = static_cast<int>(upper - wordStarts.begin()) - 1;
    return std::clamp(idx, 0, static_cast<int>(wordStarts.size()) - 1);
}

int findWordIndexByTime(const std::vector<AudioTimestamp>& timestamps, double time) {
    if (timestamps.empty()) return -1;

    int lo = 0;
    int hi = static_cast<int>(timestamps.size()) - 1;
    while (lo <= hi) {
        int mid = (lo + hi) / 2;
        const AudioTimestamp& t = timestamps[mid];
        if (time < t.start) hi = mid - 1;
        else if (time > t.end) lo = mid + 1;
        else return mid;
    }

    // Between words: the last one that has started
    auto upper = std::upper_bound(timestamps.begin(), timestamps.end(), time,
        [](double value, const AudioTimestamp& t) { return value < t.start; });
    int idx = static_cast<int>(upper - timestamps.begin()) - 1;
    return idx >= 0 ? idx : -1;
}

void normalizePageTimings(std::vector<PageTiming>& pages, double totalDuration) {
    if (pages.empty()) return;

    pages.front().startTime = 0.0;

    for (size_t i = 0; i + 1 < pages.size(); ++i) {
        PageTiming& current = pages[i];
        PageTiming& next = pages[i + 1];
        if (current.endTime != next.startTime) {
            double midpoint = (current.endTime + next.startTime) / 2.0;
            current.endTime = midpoint;
            next.startTime = midpoint;
        }
        current.duration = current.endTime - current.startTime;
    }

    PageTiming& last = pages.back();
    last.endTime = totalDuration;
    last.duration = last.endTime - last.startTime;
}

std::vector<FlipTransition> generateFlipTransitions(const std::vector<PageTiming>& pages,
                                                    double flipDuration) {
    std::vector<FlipTransition> transitions;
    const int count = static_cast<int>(pages.size());

    for (int i = 0; i < count - 2; i += 2) {
        const double spreadEnd = pages[i + 1].endTime;

        FlipTransition flip;
        flip.fromPage = i;
        flip.toPage = i + 2;
        flip.startTime = spreadEnd - flipDuration / 2.0;
        flip.endTime = spreadEnd + flipDuration / 2.0;
        flip.duration = flipDuration;
        transitions.push_back(flip);
    }
    return transitions;
}

ChapterTiming calculateChapterTiming(int chapterIndex,
                                     const QString& chapterTitle,
                                     const QString& chapterContent,
                                     const std::vector<AudioTimestamp>& timestamps,
                                     double audioDuration,
                                     FontSize fontSize,
                                     const Paginator& paginator,
                                     double flipDuration) {
    const PaginatedContent content = paginator.paginate(chapterContent, fontSize);
    const std::vector<int> wordStarts = buildWordStartCharIndices(chapterContent);

    ChapterTiming chapter;
    chapter.chapterIndex = chapterIndex;
    chapter.chapterTitle = chapterTitle;
    chapter.totalPages = content.totalPages;
    chapter.audioDuration = audioDuration;
    chapter.hasTimestamps = !timestamps.empty();

    if (timestamps.empty()) {
        qCDebug(lcSync) << "Chapter" << chapterIndex << "has no word timestamps,"
                        << "spreading" << audioDuration << "s over" << content.totalPages << "pages";
        chapter.pages = evenPageTimings(content, audioDuration);
        chapter.flipTransitions = generateFlipTransitions(chapter.pages, flipDuration);
        return chapter;
    }

    const int pageCount = std::min(content.totalPages, static_cast<int>(content.pages.size()));
    if (pageCount < content.totalPages) {
        qCWarning(lcSync) << "Paginator reported" << content.totalPages << "pages but returned"
                          << content.pages.size();
    }
    for (int pageIdx = 0; pageIdx < pageCount; ++pageIdx) {
        const auto& chunks = content.pages[pageIdx];
        if (chunks.empty()) continue;

        PageTiming t;
        t.pageIndex = pageIdx;
        t.startCharIndex = chunks.front().startCharIndex;
        t.endCharIndex = chunks.back().endCharIndex;
        t.startWordIndex = wordIndexAtCharPos(wordStarts, t.startCharIndex);
        t.endWordIndex = wordIndexAtCharPos(wordStarts, t.endCharIndex);
        t.startTime = wordStartTime(timestamps, t.startWordIndex);
        t.endTime = wordEndTime(timestamps, t.endWordIndex);
        t.duration = std::max(AppConstants::MinPageDuration, t.endTime - t.startTime);
        chapter.pages.push_back(t);
    }

    normalizePageTimings(chapter.pages, audioDuration);
    chapter.flipTransitions = generateFlipTransitions(chapter.pages, flipDuration);
    return chapter;
}

VideoManifest calculateBookTiming(qint64 bookId,
                                  const QString& bookTitle,
                                  const QString& author,
                                  const std::vector<ChapterInput>& chapters,
                                  FontSize fontSize,
                                  ReadingTheme theme,
                                  const Paginator& paginator,
                                  double flipDuration,
                                  double highlightInterval,
                                  int flipFrameCount) {
    VideoManifest manifest;
    manifest.bookId = bookId;
    manifest.bookTitle = bookTitle;
    manifest.author = author;
    manifest.fontSize = fontSize;
    manifest.theme = theme;

    for (const ChapterInput& input : chapters) {
        ChapterTiming timing = calculateChapterTiming(input.index, input.title, input.content,
                                                      input.timestamps, input.audioDuration,
                                                      fontSize, paginator, flipDuration);
        shiftChapter(timing, manifest.totalDuration);
        manifest.totalDuration += timing.audioDuration;
        manifest.totalFrames += FramePlan::estimateChapterFrameCount(timing, highlightInterval,
                                                                     flipFrameCount);
        manifest.chapters.push_back(std::move(timing));
    }

    qCInfo(lcSync) << "Manifest for book" << bookId << ":" << manifest.chapters.size() << "chapters,"
                   << manifest.totalFrames << "frames," << manifest.totalDuration << "s";
    return manifest;
}

VideoManifest calculateSingleChapterTiming(qint64 bookId,
                                           const QString& bookTitle,
                                           const QString& author,
                                           const ChapterInput& chapter,
                                           FontSize fontSize,
                                           ReadingTheme theme,
                                           const Paginator& paginator,
                                           double flipDuration,
                                           double highlightInterval,
                                           int flipFrameCount) {
    return calculateBookTiming(bookId, bookTitle, author, {chapter}, fontSize, theme, paginator,
                               flipDuration, highlightInterval, flipFrameCount);
}

ExportEstimate estimateExport(const VideoManifest& manifest) {
    ExportEstimate estimate;
    const double durationMinutes = manifest.totalDuration / 60.0;

    // ~3 MB per minute at the fixed encoder profile
    estimate.estimatedSizeMB = static_cast<int>(std::ceil(durationMinutes * 3.0));
    estimate.estimatedDurationMinutes = std::round(durationMinutes * 10.0) / 10.0;

    // ~2.5 s per captured frame plus 30% for stitching and upload
    const double renderMinutes = (manifest.totalFrames * 2.5) / 60.0;
    estimate.estimatedMinutes = static_cast<int>(std::ceil(renderMinutes * 1.3));

    estimate.totalFrames = manifest.totalFrames;
    estimate.totalDuration = manifest.totalDuration;
    return estimate;
}

} // namespace SyncCalculator
