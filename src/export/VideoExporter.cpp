#include "VideoExporter.h"
#include "AudioPreparer.h"
#include "BookSource.h"
#include "FfmpegRunner.h"
#include "LaunchStrategy.h"
#include "Log.h"
#include "MediaProbe.h"
#include "ObjectStore.h"
#include "Paginator.h"
#include "SyncCalculator.h"
#include "TimeUtil.h"
#include "VideoEncoder.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <algorithm>
#include <cmath>

namespace {

constexpr double SameFrameTime = 1e-6;   // seconds

ExportError exportErrorFor(CaptureError error) {
    switch (error) {
    case CaptureError::None:                return ExportError::None;
    case CaptureError::BrowserLaunch:       return ExportError::BrowserLaunch;
    case CaptureError::RenderTimeout:       return ExportError::RenderTimeout;
    case CaptureError::RenderTargetMissing: return ExportError::RenderTargetMissing;
    case CaptureError::Capture:             return ExportError::Capture;
    case CaptureError::Upload:              return ExportError::Upload;
    case CaptureError::Cancelled:           return ExportError::Cancelled;
    }
    return ExportError::Capture;
}

BrowserEnvironment environmentFor(const ExportConfig& config) {
    BrowserEnvironment env;
    env.endpoint = config.browserEndpoint;
    env.executablePath = config.browserExecutable;
    env.searchPaths = BrowserEnvironment::systemSearchPaths();
    env.width = config.capture.frameWidth;
    env.height = config.capture.frameHeight;
    env.launchTimeoutMs = config.browserLaunchTimeoutMs;
    return env;
}

} // namespace

VideoExporter::VideoExporter(BookSource* books, ObjectStore* store, const Paginator* paginator,
                             const ExportConfig& config, QObject* parent)
    : QObject(parent)
    , m_books(books)
    , m_store(store)
    , m_paginator(paginator)
    , m_config(config)
    , m_ownLauncher(BrowserLauncher::withDefaultStrategies(environmentFor(config)))
    , m_ffmpeg(std::make_unique<FfmpegRunner>(config.ffmpegPath))
{
    m_launcher = m_ownLauncher.get();
    m_encoder = std::make_unique<VideoEncoder>(m_ffmpeg.get());
    m_encoder->setSettings(config.encoder);
    m_audio = std::make_unique<AudioPreparer>(m_ffmpeg.get());
}

VideoExporter::~VideoExporter() = default;

void VideoExporter::setBrowserLauncher(BrowserLauncher* launcher) {
    m_launcher = launcher ? launcher : m_ownLauncher.get();
}

void VideoExporter::cancel() {
    m_cancelled = true;
    if (m_activeCapture) m_activeCapture->cancel();
    m_encoder->cancel();
}

bool VideoExporter::fail(ExportError kind, const QString& message) {
    m_errorKind = kind;
    m_error = message;
    return false;
}

bool VideoExporter::checkCancelled() {
    if (!m_cancelled) return false;
    fail(ExportError::Cancelled, "Export cancelled");
    return true;
}

void VideoExporter::report(ExportPhase phase, double percent, const QString& message) {
    ExportProgress p;
    p.phase = phase;
    p.progress = percent;
    p.message = message;
    report(p);
}

void VideoExporter::report(const ExportProgress& progress) {
    ExportProgress p = progress;
    if (p.phase != ExportPhase::Error) {
        p.progress = std::clamp(std::max(p.progress, m_lastProgress), 0.0, 100.0);
        m_lastProgress = p.progress;
    }
    qCDebug(lcExport).nospace() << exportPhaseName(p.phase) << " " << p.progress << "% " << p.message;
    emit this->progress(p);
}

// --- manifest ---

bool VideoExporter::loadBook(const ExportRequest& request, BookData& book) {
    if (!m_books) {
        return fail(ExportError::Manifest, "No book source configured");
    }
    if (!m_books->loadBook(request.bookId, book)) {
        return fail(ExportError::Manifest, QString("Book not found: %1").arg(m_books->errorString()));
    }
    if (book.author.isEmpty()) {
        book.author = "Unknown Author";
    }
    return true;
}

bool VideoExporter::buildManifest(const BookData& book, const ExportRequest& request,
                                  VideoManifest& manifest) {
    if (!m_paginator) {
        return fail(ExportError::Manifest, "No paginator configured");
    }

    auto inputFor = [](const ChapterData& chapter, int index) {
        ChapterInput input;
        input.index = index;
        input.title = chapter.title;
        input.content = chapter.content;
        input.timestamps = chapter.audioTimestamps;
        input.audioDuration = chapter.audioDuration;
        return input;
    };

    const FramePlanOptions& plan = m_config.capture.plan;
    if (request.scope == ExportScope::Chapter) {
        const int index = book.chapterIndexForNumber(request.chapterNumber);
        if (index < 0) {
            return fail(ExportError::Manifest, QString("Chapter %1 not found").arg(request.chapterNumber));
        }
        manifest = SyncCalculator::calculateSingleChapterTiming(
            book.id, book.title, book.author, inputFor(book.chapters[index], index),
            request.fontSize, request.theme, *m_paginator,
            m_config.flipDuration, plan.highlightInterval, plan.flipFrameCount);
        return true;
    }

    std::vector<ChapterInput> inputs;
    for (size_t i = 0; i < book.chapters.size(); ++i) {
        inputs.push_back(inputFor(book.chapters[i], static_cast<int>(i)));
    }
    manifest = SyncCalculator::calculateBookTiming(
        book.id, book.title, book.author, inputs, request.fontSize, request.theme, *m_paginator,
        m_config.flipDuration, plan.highlightInterval, plan.flipFrameCount);
    return true;
}

ChapterTimestamps VideoExporter::collectTimestamps(const BookData& book,
                                                   const VideoManifest& manifest) const {
    ChapterTimestamps timestamps;
    for (const ChapterTiming& chapter : manifest.chapters) {
        const ChapterData& data = book.chapters[chapter.chapterIndex];
        if (!data.audioTimestamps.empty()) {
            timestamps[chapter.chapterIndex] = data.audioTimestamps;
        }
    }
    return timestamps;
}

bool VideoExporter::generateManifest(const ExportRequest& request, VideoManifest& manifest) {
    m_errorKind = ExportError::None;
    m_error.clear();
    BookData book;
    return loadBook(request, book) && buildManifest(book, request, manifest);
}

bool VideoExporter::estimate(const ExportRequest& request, ExportEstimate& estimate) {
    VideoManifest manifest;
    if (!generateManifest(request, manifest)) return false;
    estimate = SyncCalculator::estimateExport(manifest);
    return true;
}

// --- job ---

ExportResult VideoExporter::exportVideo(const ExportRequest& request) {
    m_cancelled = false;
    m_errorKind = ExportError::None;
    m_error.clear();
    m_lastProgress = 0.0;
    m_lastSequence.clear();

    qCInfo(lcExport) << "Export of book" << request.bookId << "scope" << exportScopeName(request.scope)
                     << (request.scope == ExportScope::Chapter ? request.chapterNumber : 0);
    report(ExportPhase::Initializing, 0, "Generating video manifest...");

    ExportResult result;
    std::vector<FrameInfo> frames;
    bool ok = false;
    {
        const QString root = m_config.tempRoot.isEmpty() ? QDir::tempPath() : m_config.tempRoot;
        QTemporaryDir workDir(QDir(root).filePath("bookreel-export-XXXXXX"));
        m_lastWorkDir = workDir.path();

        BookData book;
        VideoManifest manifest;
        std::vector<ConcatFrame> ordered;
        QString audioPath;
        QString outputPath;

        ok = loadBook(request, book) && buildManifest(book, request, manifest);
        if (ok && manifest.totalFrames <= 0) {
            ok = fail(ExportError::Manifest, "Nothing to render: the manifest has no frames");
        }
        if (ok && manifest.totalDuration <= 0.0) {
            ok = fail(ExportError::Manifest, "Nothing to render: the narration has no duration");
        }
        if (ok && !workDir.isValid()) {
            ok = fail(ExportError::Capture, QString("Cannot create working directory: %1")
                                                .arg(workDir.errorString()));
        }

        const QString framesDir = QDir(workDir.path()).filePath("frames-raw");
        if (ok && !QDir().mkpath(framesDir)) {
            ok = fail(ExportError::Capture, QString("Cannot create %1").arg(framesDir));
        }

        ok = ok && !checkCancelled()
            && renderPhase(manifest, collectTimestamps(book, manifest), request, framesDir, frames)
            && !checkCancelled()
            && downloadPhase(book, request, workDir.path(), frames, ordered, &audioPath);
        m_lastSequence = ordered;

        ok = ok && !checkCancelled()
            && stitchPhase(manifest, ordered, audioPath, workDir.path(), &outputPath)
            && !checkCancelled()
            && uploadPhase(manifest, request, outputPath, result);

        if (!ok && m_errorKind == ExportError::Upload && m_config.keepOutputOnUploadFailure
            && !outputPath.isEmpty()) {
            keepForRecovery(outputPath, request.bookId, result);
        }
        // workDir is removed here
    }

    if (m_config.uploadFrames) {
        const int removed = FrameCaptureService::cleanupFrames(frames, m_store);
        qCDebug(lcExport) << "Removed" << removed << "uploaded frames";
    }

    if (!ok) {
        qCCritical(lcExport) << "Export failed:" << exportErrorName(m_errorKind) << m_error;
        ExportProgress p;
        p.phase = ExportPhase::Error;
        p.progress = 0;
        p.error = m_error;
        report(p);

        result.success = false;
        result.error = m_error;
        result.errorKind = m_errorKind;
        return result;
    }

    report(ExportPhase::Complete, 100, "Video export complete!");
    qCInfo(lcExport) << "Export complete:" << result.videoUrl << result.videoSize << "bytes,"
                     << TimeUtil::formatDuration(result.videoDuration);
    result.success = true;
    return result;
}

bool VideoExporter::renderPhase(const VideoManifest& manifest, const ChapterTimestamps& timestamps,
                                const ExportRequest& request, const QString& framesDir,
                                std::vector<FrameInfo>& frames) {
    ExportProgress start;
    start.phase = ExportPhase::RenderingFrames;
    start.progress = 5;
    start.totalChapters = static_cast<int>(manifest.chapters.size());
    start.totalFrames = manifest.totalFrames;
    start.message = "Rendering frames...";
    report(start);

    FrameCaptureService capture(m_launcher, m_store);
    capture.setSettings(m_config.capture);

    connect(&capture, &FrameCaptureService::renderProgress, this, [this](const RenderProgress& rp) {
        if (rp.phase != RenderPhase::Rendering || rp.totalFrames <= 0) return;
        ExportProgress p;
        p.phase = ExportPhase::RenderingFrames;
        p.progress = 5.0 + 40.0 * rp.currentFrame / rp.totalFrames;
        p.currentChapter = rp.currentChapter;
        p.totalChapters = rp.totalChapters;
        p.currentFrame = rp.currentFrame;
        p.totalFrames = rp.totalFrames;
        p.message = QString("Rendering frame %1 of %2...").arg(rp.currentFrame).arg(rp.totalFrames);
        report(p);
    });

    RenderOptions options;
    options.bookId = manifest.bookId;
    options.baseUrl = m_config.baseUrl;
    options.theme = request.theme;
    options.fontSize = request.fontSize;
    options.outputPrefix = QString("%1/%2/%3").arg(AppConstants::ExportPrefix)
                               .arg(manifest.bookId).arg(TimeUtil::epochMillis());
    options.outputDir = framesDir;
    options.uploadFrames = m_config.uploadFrames;

    m_activeCapture = &capture;
    if (m_cancelled) capture.cancel();
    const bool ok = capture.renderFrames(manifest, timestamps, options);
    m_activeCapture = nullptr;

    frames = capture.frames();
    if (!ok) {
        return fail(exportErrorFor(capture.errorKind()), capture.errorString());
    }
    return true;
}

bool VideoExporter::downloadPhase(const BookData& book, const ExportRequest& request,
                                  const QString& workDir, std::vector<FrameInfo>& frames,
                                  std::vector<ConcatFrame>& ordered, QString* audioPath) {
    report(ExportPhase::Downloading, 45, "Preparing rendered frames...");

    std::vector<FrameInfo> sorted = frames;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const FrameInfo& a, const FrameInfo& b) { return a.time < b.time; });

    ordered.clear();
    const int count = static_cast<int>(sorted.size());
    for (int i = 0; i < count; ++i) {
        if (checkCancelled()) return false;

        const FrameInfo& frame = sorted[i];
        if (frame.localPath.isEmpty()) {
            return fail(ExportError::Capture, "Frame rendering did not produce local files");
        }

        // Frames sharing a time: the later one in plan order is shown
        if (!ordered.empty() && frame.time - ordered.back().time < SameFrameTime) {
            qCDebug(lcExport) << "Frame at" << frame.time << "replaces" << ordered.back().path;
            QFile::remove(ordered.back().path);
            ordered.pop_back();
        }

        const QString target = QDir(workDir).filePath(
            TimeUtil::frameFileName(static_cast<int>(ordered.size())));
        if (!QFile::rename(frame.localPath, target) && !QFile::copy(frame.localPath, target)) {
            return fail(ExportError::Capture, QString("Cannot move frame %1 to %2")
                                                  .arg(frame.localPath, target));
        }
        ordered.push_back({target, frame.time});

        report(ExportPhase::Downloading, 45.0 + 15.0 * (i + 1) / count,
               QString("Preparing frame %1 of %2...").arg(i + 1).arg(count));
    }

    std::vector<AudioSource> sources;
    for (const ChapterData& chapter : book.chapters) {
        if (request.scope == ExportScope::Chapter && chapter.chapterNumber != request.chapterNumber) {
            continue;
        }
        if (chapter.hasAudio()) {
            sources.push_back({chapter.chapterNumber, chapter.audioUrl});
        }
    }

    report(ExportPhase::Downloading, 60, "Preparing narration audio...");
    if (!m_audio->prepare(sources, workDir, audioPath)) {
        return fail(ExportError::AudioPreparation, m_audio->errorString());
    }
    return true;
}

bool VideoExporter::stitchPhase(const VideoManifest& manifest, const std::vector<ConcatFrame>& ordered,
                                const QString& audioPath, const QString& workDir, QString* outputPath) {
    report(ExportPhase::Stitching, 60, "Assembling video...");

    const QString concatPath = QDir(workDir).filePath("concat.txt");
    if (!m_encoder->writeConcatFile(concatPath, ordered, manifest.totalDuration)) {
        return fail(ExportError::Encode, m_encoder->errorString());
    }

    *outputPath = QDir(workDir).filePath("output.mp4");
    auto conn = connect(m_encoder.get(), &VideoEncoder::progress, this, [this](double fraction) {
        report(ExportPhase::Stitching, 60.0 + 30.0 * fraction,
               QString("Encoding video: %1%...").arg(std::lround(fraction * 100)));
    });
    const bool ok = m_encoder->encode(concatPath, audioPath, *outputPath, manifest.totalDuration);
    disconnect(conn);

    if (!ok) {
        if (m_cancelled) return fail(ExportError::Cancelled, "Export cancelled");
        return fail(ExportError::Encode, m_encoder->errorString());
    }
    return true;
}

bool VideoExporter::uploadPhase(const VideoManifest& manifest, const ExportRequest& request,
                                const QString& outputPath, ExportResult& result) {
    report(ExportPhase::Uploading, 90, "Uploading video...");

    if (!m_store) {
        return fail(ExportError::Upload, "No object store configured");
    }

    QFile file(outputPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(ExportError::Upload, QString("Cannot read encoded video: %1").arg(outputPath));
    }
    const QByteArray data = file.readAll();
    file.close();

    const QString key = request.scope == ExportScope::Chapter
        ? QString("%1/%2/chapter-%3-%4.mp4").arg(AppConstants::ExportPrefix).arg(manifest.bookId)
              .arg(request.chapterNumber).arg(TimeUtil::epochMillis())
        : QString("%1/%2/full-book-%3.mp4").arg(AppConstants::ExportPrefix).arg(manifest.bookId)
              .arg(TimeUtil::epochMillis());

    QString url;
    if (!m_store->upload(key, data, "video/mp4", &url)) {
        return fail(ExportError::Upload, QString("Video upload failed: %1").arg(m_store->errorString()));
    }

    MediaProbe probe;
    double duration = manifest.totalDuration;
    if (probe.probe(outputPath) && probe.info().duration > 0.0) {
        duration = probe.info().duration;
    } else {
        qCDebug(lcExport) << "Using manifest duration:" << probe.errorString();
    }

    result.videoUrl = url;
    result.videoSize = data.size();
    result.videoDuration = duration;
    return true;
}

void VideoExporter::keepForRecovery(const QString& outputPath, qint64 bookId, ExportResult& result) {
    const QString dir = m_config.recoveryDir.isEmpty()
        ? QDir::current().filePath("bookreel-recovered")
        : m_config.recoveryDir;
    const QString target = QDir(dir).filePath(
        QString("book-%1-%2.mp4").arg(bookId).arg(TimeUtil::epochMillis()));

    if (!QDir().mkpath(dir) || !QFile::copy(outputPath, target)) {
        qCWarning(lcExport) << "Could not keep encoded video at" << target;
        return;
    }
    result.recoveredPath = target;
    m_error += QString(" (encoded video kept at %1)").arg(target);
}
