#include <cassert>
#include <cstdio>
#include <cmath>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>
#include <QTemporaryDir>
#include "export/VideoExporter.h"
#include "media/FfmpegRunner.h"
#include "media/VideoEncoder.h"
#include "storage/LocalObjectStore.h"
#include "TestFakes.h"

static QString numberedWords(int count) {
    QStringList words;
    for (int i = 0; i < count; ++i) words << QString("w%1").arg(i);
    return words.join(' ');
}

static ChapterData makeChapter(int number, double duration, const QString& audioUrl = QString()) {
    ChapterData chapter;
    chapter.chapterNumber = number;
    chapter.title = QString("Chapter %1").arg(number);
    chapter.content = numberedWords(40);
    chapter.audioDuration = duration;
    chapter.audioUrl = audioUrl;
    return chapter;
}

// Narration with one word per `duration / 40` seconds across the whole chapter.
static ChapterData makeTimedChapter(int number, double duration, const QString& audioUrl = QString()) {
    ChapterData chapter = makeChapter(number, duration, audioUrl);
    chapter.audioTimestamps = evenTimestamps(chapter.content, duration / 40.0);
    return chapter;
}

static BookData makeBook(qint64 id, const std::vector<ChapterData>& chapters) {
    BookData book;
    book.id = id;
    book.title = "The Export Test";
    book.chapters = chapters;
    return book;
}

static ExportConfig fastConfig(const QString& tempRoot) {
    ExportConfig config;
    config.baseUrl = "http://localhost:5000";
    config.tempRoot = tempRoot;
    config.capture.readyTimeoutMs = 200;
    config.capture.readyPollMs = 1;
    config.capture.settleDelayMs = 0;
    config.encoder.preset = "ultrafast";
    return config;
}

static bool makeTone(const QString& path, double seconds) {
    FfmpegRunner ffmpeg;
    return ffmpeg.run({"-y", "-f", "lavfi", "-i", QString("sine=frequency=330:duration=%1").arg(seconds),
                       "-loglevel", "error", path});
}

static bool isEmptyDir(const QString& path) {
    return QDir(path).entryList(QDir::AllEntries | QDir::NoDotAndDotDot).isEmpty();
}

static void assertStrictlyIncreasing(const std::vector<ConcatFrame>& sequence) {
    assert(!sequence.empty());
    for (size_t i = 1; i < sequence.size(); ++i) {
        assert(sequence[i].time > sequence[i - 1].time);
        assert(sequence[i].path != sequence[i - 1].path);
    }
}

// Phases only move forward and progress never decreases, except for the
// terminal error event.
static void assertOrderedProgress(const std::vector<ExportProgress>& events) {
    assert(!events.empty());
    for (size_t i = 1; i < events.size(); ++i) {
        if (events[i].phase == ExportPhase::Error) {
            assert(i == events.size() - 1);
            continue;
        }
        assert(static_cast<int>(events[i].phase) >= static_cast<int>(events[i - 1].phase));
        assert(events[i].progress >= events[i - 1].progress);
    }
}

void test_generate_manifest() {
    MemoryBookSource books;
    books.addBook(makeBook(1, {makeChapter(1, 40.0), makeChapter(2, 20.0)}));
    FixedPaginator paginator(4);
    VideoExporter exporter(&books, nullptr, &paginator, ExportConfig());

    ExportRequest request;
    request.bookId = 1;
    VideoManifest manifest;
    assert(exporter.generateManifest(request, manifest));
    assert(manifest.chapters.size() == 2);
    assert(manifest.author == "Unknown Author");
    assert(std::fabs(manifest.totalDuration - 60.0) < 1e-9);
    assert(manifest.totalFrames == 34);

    request.scope = ExportScope::Chapter;
    request.chapterNumber = 2;
    assert(exporter.generateManifest(request, manifest));
    assert(manifest.chapters.size() == 1);
    assert(manifest.chapters[0].chapterIndex == 1);
    assert(std::fabs(manifest.totalDuration - 20.0) < 1e-9);

    ExportEstimate estimate;
    assert(exporter.estimate(request, estimate));
    assert(estimate.totalFrames == 17);

    request.chapterNumber = 9;
    assert(!exporter.generateManifest(request, manifest));
    assert(exporter.errorKind() == ExportError::Manifest);
    assert(exporter.errorString() == "Chapter 9 not found");

    request.bookId = 5;
    assert(!exporter.generateManifest(request, manifest));
    assert(exporter.errorString().startsWith("Book not found"));
    printf("PASS: test_generate_manifest\n");
}

void test_empty_narration_fails_early() {
    QTemporaryDir temp;
    MemoryBookSource books;
    books.addBook(makeBook(1, {makeChapter(1, 0.0)}));
    FixedPaginator paginator(2);
    MemoryObjectStore store;
    FakeBrowserState state;
    auto launcher = makeFakeLauncher(&state);

    VideoExporter exporter(&books, &store, &paginator, fastConfig(temp.path()));
    exporter.setBrowserLauncher(launcher.get());

    ExportRequest request;
    request.bookId = 1;
    const ExportResult result = exporter.exportVideo(request);
    assert(!result.success);
    assert(result.errorKind == ExportError::Manifest);
    assert(result.error.contains("no duration"));
    assert(state.pagesCreated == 0);
    assert(isEmptyDir(temp.path()));
    printf("PASS: test_empty_narration_fails_early\n");
}

void test_render_timeout_cleans_up() {
    QTemporaryDir temp;
    MemoryBookSource books;
    books.addBook(makeBook(1, {makeChapter(1, 40.0)}));
    FixedPaginator paginator(4);
    MemoryObjectStore store;
    FakeBrowserState state;
    state.ready = false;
    auto launcher = makeFakeLauncher(&state);

    ExportConfig config = fastConfig(temp.path());
    config.capture.readyTimeoutMs = 50;
    VideoExporter exporter(&books, &store, &paginator, config);
    exporter.setBrowserLauncher(launcher.get());

    std::vector<ExportProgress> events;
    QObject::connect(&exporter, &VideoExporter::progress, [&](const ExportProgress& p) { events.push_back(p); });

    ExportRequest request;
    request.bookId = 1;
    const ExportResult result = exporter.exportVideo(request);

    assert(!result.success);
    assert(result.errorKind == ExportError::RenderTimeout);
    assert(result.error.contains("Timeout waiting for render"));
    assert(result.videoUrl.isEmpty());
    assert(store.objects.isEmpty());

    assert(!exporter.lastWorkingDirectory().isEmpty());
    assert(!QDir(exporter.lastWorkingDirectory()).exists());
    assert(isEmptyDir(temp.path()));

    assertOrderedProgress(events);
    assert(events.front().phase == ExportPhase::Initializing);
    assert(events.back().phase == ExportPhase::Error);
    assert(events.back().error == result.error);
    printf("PASS: test_render_timeout_cleans_up\n");
}

void test_browser_unavailable() {
    QTemporaryDir temp;
    MemoryBookSource books;
    books.addBook(makeBook(1, {makeChapter(1, 10.0)}));
    FixedPaginator paginator(2);
    MemoryObjectStore store;
    FakeBrowserState state;
    BrowserLauncher launcher{BrowserEnvironment()};
    launcher.addStrategy(std::make_unique<FakeLaunchStrategy>(&state, "fake", true, "no display"));

    VideoExporter exporter(&books, &store, &paginator, fastConfig(temp.path()));
    exporter.setBrowserLauncher(&launcher);

    ExportRequest request;
    request.bookId = 1;
    const ExportResult result = exporter.exportVideo(request);
    assert(!result.success);
    assert(result.errorKind == ExportError::BrowserLaunch);
    assert(isEmptyDir(temp.path()));
    printf("PASS: test_browser_unavailable\n");
}

void test_cancel_during_render() {
    QTemporaryDir temp;
    MemoryBookSource books;
    books.addBook(makeBook(1, {makeChapter(1, 40.0)}));
    FixedPaginator paginator(4);
    MemoryObjectStore store;
    FakeBrowserState state;
    auto launcher = makeFakeLauncher(&state);

    VideoExporter exporter(&books, &store, &paginator, fastConfig(temp.path()));
    exporter.setBrowserLauncher(launcher.get());
    QObject::connect(&exporter, &VideoExporter::progress, [&](const ExportProgress& p) {
        if (p.phase == ExportPhase::RenderingFrames && p.currentFrame == 3) exporter.cancel();
    });

    ExportRequest request;
    request.bookId = 1;
    const ExportResult result = exporter.exportVideo(request);
    assert(!result.success);
    assert(result.errorKind == ExportError::Cancelled);
    assert(state.captures == 3);
    assert(isEmptyDir(temp.path()));
    printf("PASS: test_cancel_during_render\n");
}

void test_full_export() {
    if (!FfmpegRunner().isAvailable()) {
        printf("SKIP: test_full_export (ffmpeg not found)\n");
        return;
    }

    QTemporaryDir assets;
    const QString audio = QDir(assets.path()).filePath("chapter1.wav");
    assert(makeTone(audio, 40.0));

    QTemporaryDir temp;
    QTemporaryDir storeDir;
    MemoryBookSource books;
    books.addBook(makeBook(1, {makeTimedChapter(1, 40.0, audio)}));
    FixedPaginator paginator(4);
    LocalObjectStore store(storeDir.path(), "https://media.example.com");
    FakeBrowserState state;
    auto launcher = makeFakeLauncher(&state);

    VideoExporter exporter(&books, &store, &paginator, fastConfig(temp.path()));
    exporter.setBrowserLauncher(launcher.get());

    ExportRequest request;
    request.bookId = 1;

    VideoManifest manifest;
    assert(exporter.generateManifest(request, manifest));
    assert(manifest.chapters.size() == 1);
    const ChapterTiming& chapter = manifest.chapters[0];
    assert(chapter.hasTimestamps);
    assert(chapter.pages.size() == 4);
    assert(chapter.flipTransitions.size() == 1);
    double covered = 0.0;
    for (size_t i = 0; i < chapter.pages.size(); ++i) {
        covered += chapter.pages[i].duration;
        if (i > 0) assert(chapter.pages[i].startTime == chapter.pages[i - 1].endTime);
    }
    assert(chapter.pages.front().startTime == 0.0);
    assert(chapter.pages.back().endTime == 40.0);
    assert(std::fabs(covered - 40.0) < 1e-9);
    // Word-synced stills every half second plus one page turn
    assert(manifest.totalFrames > 80 + 15 - 2);
    assert(manifest.totalFrames <= 80 + 2 + 15);

    std::vector<ExportProgress> events;
    QObject::connect(&exporter, &VideoExporter::progress, [&](const ExportProgress& p) { events.push_back(p); });

    const ExportResult result = exporter.exportVideo(request);
    if (!result.success) {
        printf("FAIL: %s\n", qPrintable(result.error));
        assert(false);
    }

    assert(state.captures == manifest.totalFrames);
    assert(result.videoUrl.startsWith("https://media.example.com/video-exports/1/full-book-"));
    assert(result.videoUrl.endsWith(".mp4"));
    assert(result.videoSize > 0);
    assert(std::fabs(result.videoDuration - 40.0) < 1.0);

    const QString stored = store.pathForUrl(result.videoUrl);
    assert(QFileInfo(stored).size() == result.videoSize);

    // Encoder input: time order, no repeated times, last still listed twice
    const std::vector<ConcatFrame>& sequence = exporter.lastFrameSequence();
    assertStrictlyIncreasing(sequence);
    assert(sequence.front().time == 0.0);
    assert(sequence.back().time < 40.0);
    assert(static_cast<int>(sequence.size()) <= manifest.totalFrames);
    const QStringList lines = VideoEncoder::buildConcatList(sequence, manifest.totalDuration)
                                  .split('\n', Qt::SkipEmptyParts);
    const QStringList fileLines = lines.filter(QRegularExpression("^file "));
    assert(fileLines.size() == static_cast<int>(sequence.size()) + 1);
    assert(fileLines.last() == fileLines.at(fileLines.size() - 2));
    const QSet<QString> distinct(fileLines.begin(), fileLines.end());
    assert(distinct.size() == fileLines.size() - 1);

    assertOrderedProgress(events);
    assert(events.back().phase == ExportPhase::Complete);
    assert(events.back().progress == 100.0);
    bool sawStitching = false;
    for (const ExportProgress& p : events) {
        if (p.phase == ExportPhase::Stitching) sawStitching = true;
        if (p.phase == ExportPhase::RenderingFrames && p.totalFrames > 0) {
            assert(p.totalFrames == manifest.totalFrames);
        }
    }
    assert(sawStitching);
    assert(isEmptyDir(temp.path()));
    printf("PASS: test_full_export\n");
}

void test_page_turn_frame_on_spread_start() {
    // Two-frame page turns put the second frame exactly on the next spread
    QTemporaryDir temp;
    MemoryBookSource books;
    books.addBook(makeBook(4, {makeChapter(1, 40.0)}));
    FixedPaginator paginator(4);
    MemoryObjectStore store;
    FakeBrowserState state;
    auto launcher = makeFakeLauncher(&state);

    ExportConfig config = fastConfig(temp.path());
    config.flipDuration = 0.5;
    config.capture.plan.flipFrameCount = 2;
    VideoExporter exporter(&books, &store, &paginator, config);
    exporter.setBrowserLauncher(launcher.get());

    ExportRequest request;
    request.bookId = 4;
    const ExportResult result = exporter.exportVideo(request);

    // Stitching needs ffmpeg; the ordered frames exist either way
    assert(result.success || result.errorKind == ExportError::Encode
           || result.errorKind == ExportError::AudioPreparation);
    assert(state.captures == 4);

    const std::vector<ConcatFrame>& sequence = exporter.lastFrameSequence();
    assert(sequence.size() == 3);
    assertStrictlyIncreasing(sequence);
    assert(sequence[0].time == 0.0);
    assert(std::fabs(sequence[1].time - 19.75) < 1e-9);
    assert(std::fabs(sequence[2].time - 20.0) < 1e-9);
    assert(isEmptyDir(temp.path()));
    printf("PASS: test_page_turn_frame_on_spread_start\n");
}

void test_chapter_export_with_frame_upload() {
    if (!FfmpegRunner().isAvailable()) {
        printf("SKIP: test_chapter_export_with_frame_upload (ffmpeg not found)\n");
        return;
    }

    QTemporaryDir assets;
    const QString audio = QDir(assets.path()).filePath("chapter2.wav");
    assert(makeTone(audio, 12.0));

    QTemporaryDir temp;
    MemoryBookSource books;
    books.addBook(makeBook(8, {makeChapter(1, 30.0, "/nonexistent/chapter1.wav"),
                               makeChapter(2, 12.0, audio)}));
    FixedPaginator paginator(2);
    MemoryObjectStore store;
    FakeBrowserState state;
    auto launcher = makeFakeLauncher(&state);

    ExportConfig config = fastConfig(temp.path());
    config.uploadFrames = true;
    VideoExporter exporter(&books, &store, &paginator, config);
    exporter.setBrowserLauncher(launcher.get());

    ExportRequest request;
    request.bookId = 8;
    request.scope = ExportScope::Chapter;
    request.chapterNumber = 2;
    const ExportResult result = exporter.exportVideo(request);
    if (!result.success) {
        printf("FAIL: %s\n", qPrintable(result.error));
        assert(false);
    }

    assert(result.videoUrl.startsWith("mem://video-exports/8/chapter-2-"));
    assert(std::fabs(result.videoDuration - 12.0) < 1.0);

    // Uploaded frames are gone, only the video remains
    assert(store.removed == state.captures);
    assert(store.objects.size() == 1);
    assert(store.objects.contains(result.videoUrl));
    assert(store.contentTypes.value(result.videoUrl) == "video/mp4");
    for (const QString& url : state.navigated) {
        assert(url.contains("chapter=1"));
    }
    printf("PASS: test_chapter_export_with_frame_upload\n");
}

void test_silent_export_kept_after_upload_failure() {
    if (!FfmpegRunner().isAvailable()) {
        printf("SKIP: test_silent_export_kept_after_upload_failure (ffmpeg not found)\n");
        return;
    }

    QTemporaryDir temp;
    QTemporaryDir recovery;
    MemoryBookSource books;
    books.addBook(makeBook(3, {makeChapter(1, 6.0)}));
    FixedPaginator paginator(2);
    MemoryObjectStore store;
    store.failUploads = true;
    FakeBrowserState state;
    auto launcher = makeFakeLauncher(&state);

    ExportConfig config = fastConfig(temp.path());
    config.keepOutputOnUploadFailure = true;
    config.recoveryDir = recovery.path();
    VideoExporter exporter(&books, &store, &paginator, config);
    exporter.setBrowserLauncher(launcher.get());

    ExportRequest request;
    request.bookId = 3;
    const ExportResult result = exporter.exportVideo(request);
    assert(!result.success);
    assert(result.errorKind == ExportError::Upload);
    assert(result.error.contains("503"));
    assert(!result.recoveredPath.isEmpty());
    assert(result.recoveredPath.startsWith(recovery.path()));
    assert(result.error.contains(result.recoveredPath));
    assert(QFileInfo(result.recoveredPath).size() > 0);
    assert(isEmptyDir(temp.path()));
    printf("PASS: test_silent_export_kept_after_upload_failure\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_generate_manifest();
    test_empty_narration_fails_early();
    test_render_timeout_cleans_up();
    test_browser_unavailable();
    test_cancel_during_render();
    test_full_export();
    test_page_turn_frame_on_spread_start();
    test_chapter_export_with_frame_upload();
    test_silent_export_kept_after_upload_failure();
    printf("All video export tests passed.\n");
    return 0;
}
