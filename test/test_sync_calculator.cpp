#include <cassert>
#include <cstdio>
#include <cmath>
#include "sync/SyncCalculator.h"
#include "sync/FramePlan.h"
#include "TestFakes.h"

static bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

static QString numberedWords(int count) {
    QStringList words;
    for (int i = 0; i < count; ++i) words << QString("w%1").arg(i);
    return words.join(' ');
}

static void assertContinuous(const std::vector<PageTiming>& pages, double total) {
    assert(!pages.empty());
    assert(pages.front().startTime == 0.0);
    for (size_t i = 0; i + 1 < pages.size(); ++i) {
        assert(pages[i].endTime == pages[i + 1].startTime);
    }
    assert(pages.back().endTime == total);
    for (const PageTiming& p : pages) {
        assert(near(p.duration, p.endTime - p.startTime));
    }
}

void test_word_start_indices() {
    auto starts = SyncCalculator::buildWordStartCharIndices("Hello world, it's 42.");
    assert(starts.size() == 4);
    assert(starts[0] == 0);
    assert(starts[1] == 6);
    assert(starts[2] == 13);
    assert(starts[3] == 18);

    assert(SyncCalculator::buildWordStartCharIndices("  ... !!").empty());
    printf("PASS: test_word_start_indices\n");
}

void test_word_index_at_char_pos() {
    const std::vector<int> starts = {0, 5, 10};
    assert(SyncCalculator::wordIndexAtCharPos(starts, 0) == 0);
    assert(SyncCalculator::wordIndexAtCharPos(starts, 4) == 0);
    assert(SyncCalculator::wordIndexAtCharPos(starts, 5) == 1);
    assert(SyncCalculator::wordIndexAtCharPos(starts, 7) == 1);
    assert(SyncCalculator::wordIndexAtCharPos(starts, 12) == 2);
    assert(SyncCalculator::wordIndexAtCharPos(starts, 1000) == 2);
    assert(SyncCalculator::wordIndexAtCharPos(starts, -3) == 0);
    assert(SyncCalculator::wordIndexAtCharPos({}, 5) == 0);
    printf("PASS: test_word_index_at_char_pos\n");
}

void test_find_word_index_by_time() {
    const std::vector<AudioTimestamp> words = {{"a", 0.0, 1.0}, {"b", 1.0, 2.0}};
    assert(SyncCalculator::findWordIndexByTime(words, 0.5) == 0);
    assert(SyncCalculator::findWordIndexByTime(words, 1.5) == 1);
    assert(SyncCalculator::findWordIndexByTime(words, -1.0) == -1);
    assert(SyncCalculator::findWordIndexByTime(words, 10.0) == 1);
    assert(SyncCalculator::findWordIndexByTime({}, 1.0) == -1);

    // In a pause the previous word stays highlighted
    const std::vector<AudioTimestamp> gapped = {{"a", 0.0, 1.0}, {"b", 2.0, 3.0}};
    assert(SyncCalculator::findWordIndexByTime(gapped, 1.5) == 0);
    assert(SyncCalculator::findWordIndexByTime(gapped, 2.0) == 1);
    printf("PASS: test_find_word_index_by_time\n");
}

void test_normalize_page_timings() {
    std::vector<PageTiming> pages(3);
    pages[0].startTime = 0.4; pages[0].endTime = 2.0;
    pages[1].startTime = 3.0; pages[1].endTime = 5.0;   // gap before
    pages[2].startTime = 4.0; pages[2].endTime = 6.0;   // overlap before

    SyncCalculator::normalizePageTimings(pages, 10.0);
    assertContinuous(pages, 10.0);
    assert(near(pages[0].endTime, 2.5));
    assert(near(pages[1].endTime, 4.5));
    assert(near(pages[2].duration, 5.5));

    std::vector<PageTiming> none;
    SyncCalculator::normalizePageTimings(none, 10.0);
    assert(none.empty());
    printf("PASS: test_normalize_page_timings\n");
}

void test_flip_transitions() {
    std::vector<PageTiming> pages(6);
    for (int i = 0; i < 6; ++i) {
        pages[i].pageIndex = i;
        pages[i].startTime = i * 5.0;
        pages[i].endTime = (i + 1) * 5.0;
    }

    auto flips = SyncCalculator::generateFlipTransitions(pages, 0.6);
    assert(flips.size() == 2);
    assert(flips[0].fromPage == 0 && flips[0].toPage == 2);
    assert(flips[1].fromPage == 2 && flips[1].toPage == 4);
    assert(near(flips[0].startTime, 9.7));
    assert(near(flips[0].endTime, 10.3));
    assert(near(flips[1].startTime, 19.7));
    assert(near(flips[1].duration, 0.6));

    pages.resize(5);
    assert(SyncCalculator::generateFlipTransitions(pages, 0.6).size() == 2);
    pages.resize(2);
    assert(SyncCalculator::generateFlipTransitions(pages, 0.6).empty());
    printf("PASS: test_flip_transitions\n");
}

void test_chapter_without_timestamps() {
    FixedPaginator paginator(3);
    ChapterTiming chapter = SyncCalculator::calculateChapterTiming(
        0, "One", numberedWords(30), {}, 30.0, FontSize::Base, paginator);

    assert(!chapter.hasTimestamps);
    assert(chapter.totalPages == 3);
    assert(chapter.pages.size() == 3);
    for (int i = 0; i < 3; ++i) {
        assert(near(chapter.pages[i].startTime, i * 10.0));
        assert(near(chapter.pages[i].duration, 10.0));
    }
    assert(near(chapter.pages.back().endTime, 30.0));
    assert(chapter.flipTransitions.size() == 1);
    assert(near(chapter.flipTransitions[0].startTime, 20.0 - 0.3));
    printf("PASS: test_chapter_without_timestamps\n");
}

void test_chapter_with_timestamps() {
    const QString content = numberedWords(40);
    const auto stamps = evenTimestamps(content, 0.5);
    FixedPaginator paginator(4);

    ChapterTiming chapter = SyncCalculator::calculateChapterTiming(
        2, "Two", content, stamps, 21.0, FontSize::Base, paginator, 0.6);

    assert(chapter.hasTimestamps);
    assert(chapter.chapterIndex == 2);
    assert(chapter.pages.size() == 4);
    assertContinuous(chapter.pages, 21.0);

    for (size_t i = 0; i + 1 < chapter.pages.size(); ++i) {
        assert(chapter.pages[i].startWordIndex <= chapter.pages[i + 1].startWordIndex);
        assert(chapter.pages[i].endCharIndex <= chapter.pages[i + 1].endCharIndex);
    }
    assert(chapter.pages.back().endWordIndex == 39);
    assert(chapter.flipTransitions.size() == 1);
    printf("PASS: test_chapter_with_timestamps\n");
}

// Claims more pages than it hands back.
class ShortPaginator : public Paginator {
public:
    PaginatedContent paginate(const QString& content, FontSize fontSize) const override {
        PaginatedContent result = FixedPaginator(2).paginate(content, fontSize);
        result.totalPages = 5;
        return result;
    }
};

void test_chapter_with_short_pagination() {
    const QString content = numberedWords(20);
    const auto stamps = evenTimestamps(content, 0.5);
    ShortPaginator paginator;

    ChapterTiming chapter = SyncCalculator::calculateChapterTiming(
        0, "Short", content, stamps, 10.0, FontSize::Base, paginator);

    assert(chapter.pages.size() == 2);
    assertContinuous(chapter.pages, 10.0);
    assert(chapter.flipTransitions.empty());
    assert(FramePlan::estimateChapterFrameCount(chapter, 0.0, 15) == 1);
    printf("PASS: test_chapter_with_short_pagination\n");
}

void test_book_timing_offsets() {
    FixedPaginator paginator(4);
    const QString content = numberedWords(20);

    ChapterInput first;
    first.index = 0;
    first.title = "First";
    first.content = content;
    first.timestamps = evenTimestamps(content, 1.0);
    first.audioDuration = 20.0;

    ChapterInput second;
    second.index = 1;
    second.title = "Second";
    second.content = content;
    second.audioDuration = 12.0;

    VideoManifest manifest = SyncCalculator::calculateBookTiming(
        9, "Book", "Author", {first, second}, FontSize::LG, ReadingTheme::Sepia, paginator);

    assert(manifest.bookId == 9);
    assert(manifest.theme == ReadingTheme::Sepia);
    assert(manifest.fontSize == FontSize::LG);
    assert(manifest.chapters.size() == 2);
    assert(near(manifest.totalDuration, 32.0));
    assert(near(manifest.chapters[0].timeOffset, 0.0));
    assert(near(manifest.chapters[1].timeOffset, 20.0));
    assert(near(manifest.chapters[1].pages.front().startTime, 20.0));
    assert(near(manifest.chapters[1].pages.back().endTime, 32.0));
    assert(manifest.chapters[1].flipTransitions.front().startTime > 20.0);

    int expected = 0;
    for (const ChapterTiming& chapter : manifest.chapters) {
        expected += FramePlan::estimateChapterFrameCount(chapter);
    }
    assert(manifest.totalFrames == expected);

    VideoManifest single = SyncCalculator::calculateSingleChapterTiming(
        9, "Book", "Author", second, FontSize::LG, ReadingTheme::Sepia, paginator);
    assert(single.chapters.size() == 1);
    assert(single.chapters[0].chapterIndex == 1);
    assert(near(single.chapters[0].pages.front().startTime, 0.0));
    assert(near(single.totalDuration, 12.0));
    printf("PASS: test_book_timing_offsets\n");
}

void test_estimate_export() {
    VideoManifest manifest;
    manifest.totalDuration = 600.0;
    manifest.totalFrames = 120;

    ExportEstimate estimate = SyncCalculator::estimateExport(manifest);
    assert(estimate.estimatedSizeMB == 30);
    assert(near(estimate.estimatedDurationMinutes, 10.0));
    assert(estimate.estimatedMinutes == 7);
    assert(estimate.totalFrames == 120);
    assert(near(estimate.totalDuration, 600.0));
    printf("PASS: test_estimate_export\n");
}

int main() {
    test_word_start_indices();
    test_word_index_at_char_pos();
    test_find_word_index_by_time();
    test_normalize_page_timings();
    test_flip_transitions();
    test_chapter_without_timestamps();
    test_chapter_with_timestamps();
    test_chapter_with_short_pagination();
    test_book_timing_offsets();
    test_estimate_export();
    printf("All sync calculator tests passed.\n");
    return 0;
}
