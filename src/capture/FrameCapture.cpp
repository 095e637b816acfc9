#include "FrameCapture.h"
#include "BrowserSession.h"
#include "LaunchStrategy.h"
#include "Log.h"
#include "ObjectStore.h"
#include "ResponseCache.h"
#include "TimeUtil.h"

#include <QBuffer>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QImageReader>
#include <QUrlQuery>
#include <algorithm>

namespace {

const char* NoAnimationCss =
    "*, *::before, *::after {"
    " animation: none !important;"
    " transition: none !important;"
    "}";

} // namespace

FrameCaptureService::FrameCaptureService(BrowserLauncher* launcher, ObjectStore* store, QObject* parent)
    : QObject(parent)
    , m_launcher(launcher)
    , m_store(store)
{
}

FrameCaptureService::~FrameCaptureService() = default;

void FrameCaptureService::setSettings(const CaptureSettings& settings) {
    m_settings = settings;
    m_settings.jpegQuality = std::clamp(settings.jpegQuality,
                                        AppConstants::MinJpegQuality,
                                        AppConstants::MaxJpegQuality);
}

int FrameCaptureService::cacheHits() const {
    return m_cache ? m_cache->hits() : 0;
}

bool FrameCaptureService::fail(CaptureError kind, const QString& message) {
    m_errorKind = kind;
    m_error = message;
    qCWarning(lcCapture) << message;
    return false;
}

bool FrameCaptureService::renderFrames(const VideoManifest& manifest,
                                       const ChapterTimestamps& timestamps,
                                       const RenderOptions& options) {
    m_frames.clear();
    m_errorKind = CaptureError::None;
    m_error.clear();
    m_cancelled = false;
    m_cache = std::make_unique<ResponseCache>(options.bookId);

    RenderProgress progress;
    progress.phase = RenderPhase::Initializing;
    progress.totalChapters = static_cast<int>(manifest.chapters.size());
    progress.totalFrames = manifest.totalFrames;
    emit renderProgress(progress);

    if (options.outputDir.isEmpty() && !options.uploadFrames) {
        return fail(CaptureError::Capture, "No frame destination: set an output directory or enable upload");
    }
    if (options.uploadFrames && !m_store) {
        return fail(CaptureError::Upload, "Frame upload requested without an object store");
    }
    if (!options.outputDir.isEmpty() && !QDir().mkpath(options.outputDir)) {
        return fail(CaptureError::Capture, QString("Cannot create frame directory: %1").arg(options.outputDir));
    }
    if (!m_launcher) {
        return fail(CaptureError::BrowserLaunch, "No browser launcher configured");
    }

    std::unique_ptr<BrowserSession> session = m_launcher->launch();
    if (!session) {
        return fail(CaptureError::BrowserLaunch, m_launcher->errorString());
    }

    const bool ok = renderWithSession(*session, manifest, timestamps, options);
    session->close();

    qCInfo(lcCapture) << "Captured" << m_frames.size() << "frames," << m_cache->hits()
                      << "book API responses served from cache";
    return ok;
}

void FrameCaptureService::prepareSession(BrowserSession& session) {
    if (!session.bypassServiceWorker()) {
        qCWarning(lcCapture) << "Failed to bypass service worker:" << session.errorString();
    }
    if (!session.setCacheEnabled(true)) {
        qCWarning(lcCapture) << "Failed to enable page cache:" << session.errorString();
    }
    if (!session.enableResponseCache(m_cache.get())) {
        qCWarning(lcCapture) << "Failed to enable request interception cache:" << session.errorString();
    }
    if (!session.addStyleToNewDocuments(NoAnimationCss)) {
        qCWarning(lcCapture) << "Failed to inject no-animation CSS:" << session.errorString();
    }
}

bool FrameCaptureService::renderWithSession(BrowserSession& session, const VideoManifest& manifest,
                                            const ChapterTimestamps& timestamps,
                                            const RenderOptions& options) {
    session.setCommandTimeout(m_settings.navigationTimeoutMs);
    if (!session.createPage(m_settings.frameWidth, m_settings.frameHeight)) {
        return fail(CaptureError::Capture, QString("Cannot open render page: %1").arg(session.errorString()));
    }
    prepareSession(session);

    // Plan everything up front so progress reports the real frame total
    static const std::vector<AudioTimestamp> noTimestamps;
    std::vector<std::vector<FrameRequest>> plans;
    int plannedFrames = 0;
    for (const ChapterTiming& chapter : manifest.chapters) {
        auto it = timestamps.find(chapter.chapterIndex);
        const auto& words = it != timestamps.end() ? it->second : noTimestamps;
        plans.push_back(FramePlan::planChapterFrames(chapter, words, m_settings.plan));
        plannedFrames += static_cast<int>(plans.back().size());
    }
    if (plannedFrames != manifest.totalFrames) {
        qCWarning(lcCapture) << "Frame plan has" << plannedFrames << "frames, manifest expects"
                             << manifest.totalFrames;
    }

    RenderProgress progress;
    progress.phase = RenderPhase::Rendering;
    progress.totalChapters = static_cast<int>(manifest.chapters.size());
    progress.totalFrames = plannedFrames;
    emit renderProgress(progress);

    int frameIndex = 0;
    for (size_t c = 0; c < plans.size(); ++c) {
        progress.currentChapter = static_cast<int>(c);
        emit renderProgress(progress);

        for (const FrameRequest& request : plans[c]) {
            if (m_cancelled) {
                return fail(CaptureError::Cancelled, "Export cancelled");
            }

            FrameInfo frame;
            if (!captureFrame(session, request, options, frameIndex, frame)) {
                return false;
            }
            m_frames.push_back(frame);
            ++frameIndex;

            progress.currentFrame = frameIndex;
            emit frameRendered(frame);
            emit renderProgress(progress);
        }
    }

    progress.phase = RenderPhase::Complete;
    emit renderProgress(progress);
    return true;
}

bool FrameCaptureService::waitForRenderReady(BrowserSession& session, const FrameRequest& request) {
    QElapsedTimer elapsed;
    elapsed.start();
    for (;;) {
        bool ready = false;
        if (!session.evaluateBool(AppConstants::ReadyFlagExpression, &ready)) {
            return fail(CaptureError::Capture, QString("Readiness check failed: %1").arg(session.errorString()));
        }
        if (ready) return true;

        if (elapsed.elapsed() >= m_settings.readyTimeoutMs) {
            return fail(CaptureError::RenderTimeout,
                        QString("Timeout waiting for render to be ready (chapter %1, page %2)")
                            .arg(request.chapterIndex).arg(request.pageIndex));
        }
        TimeUtil::wait(m_settings.readyPollMs);
    }
}

bool FrameCaptureService::captureFrame(BrowserSession& session, const FrameRequest& request,
                                       const RenderOptions& options, int frameIndex,
                                       FrameInfo& frame) {
    const QUrl url = buildRenderUrl(options.baseUrl, options.bookId, request,
                                    options.theme, options.fontSize);
    qCDebug(lcCapture) << "Frame" << frameIndex << url.toString();

    if (!session.navigate(url, m_settings.navigationTimeoutMs)) {
        return fail(CaptureError::Capture, session.errorString());
    }
    if (!waitForRenderReady(session, request)) {
        return false;
    }
    TimeUtil::wait(m_settings.settleDelayMs);

    QByteArray jpeg;
    switch (session.captureElement(AppConstants::RenderContainerSelector, m_settings.jpegQuality, &jpeg)) {
    case CaptureStatus::Ok:
        break;
    case CaptureStatus::ElementMissing:
        return fail(CaptureError::RenderTargetMissing, "Render container not found");
    case CaptureStatus::Failed:
        return fail(CaptureError::Capture, QString("Screenshot failed: %1").arg(session.errorString()));
    }

    const QString fileName = TimeUtil::frameFileName(frameIndex);

    if (!options.outputDir.isEmpty()) {
        frame.localPath = QDir(options.outputDir).filePath(fileName);
        QFile file(frame.localPath);
        if (!file.open(QIODevice::WriteOnly) || file.write(jpeg) != jpeg.size()) {
            return fail(CaptureError::Capture, QString("Cannot write frame: %1").arg(frame.localPath));
        }
    }

    if (options.uploadFrames) {
        const QString key = options.outputPrefix.isEmpty()
            ? fileName
            : options.outputPrefix + '/' + fileName;
        if (!m_store->upload(key, jpeg, "image/jpeg", &frame.url)) {
            return fail(CaptureError::Upload, QString("Frame upload failed: %1").arg(m_store->errorString()));
        }
    }

    QBuffer buffer(&jpeg);
    buffer.open(QIODevice::ReadOnly);
    QImageReader reader(&buffer, "jpeg");
    const QSize size = reader.size();
    frame.width = size.isValid() ? size.width() : m_settings.frameWidth;
    frame.height = size.isValid() ? size.height() : m_settings.frameHeight;

    frame.time = request.time;
    frame.type = request.type;
    frame.chapterIndex = request.chapterIndex;
    frame.pageIndex = request.pageIndex;
    frame.flipFrame = request.flipFrame;
    frame.wordIndex = request.wordIndex;
    return true;
}

QUrl FrameCaptureService::buildRenderUrl(const QString& baseUrl, qint64 bookId,
                                         const FrameRequest& request,
                                         ReadingTheme theme, FontSize fontSize) {
    QString base = baseUrl;
    while (base.endsWith('/')) base.chop(1);

    QUrl url(base + AppConstants::RenderPath + QString::number(bookId));
    QUrlQuery query;
    query.addQueryItem("chapter", QString::number(request.chapterIndex));
    query.addQueryItem("page", QString::number(request.pageIndex));
    query.addQueryItem("theme", themeName(theme));
    query.addQueryItem("fontSize", fontSizeName(fontSize));

    if (request.type == FrameType::Flip) {
        query.addQueryItem("flipFrame", QString::number(request.flipFrame));
        query.addQueryItem("flipDirection", FramePlan::flipDirectionName(request.flipDirection));
    } else if (request.wordIndex >= 0) {
        query.addQueryItem("wordIndex", QString::number(request.wordIndex));
    }

    url.setQuery(query);
    return url;
}

int FrameCaptureService::cleanupFrames(const std::vector<FrameInfo>& frames, ObjectStore* store) {
    if (!store) return 0;

    int removed = 0;
    for (const FrameInfo& frame : frames) {
        if (frame.url.isEmpty()) continue;
        if (store->remove(frame.url)) {
            ++removed;
        } else {
            qCWarning(lcCapture) << "Failed to delete frame:" << frame.url << store->errorString();
        }
    }
    return removed;
}

QString FrameCaptureService::phaseName(RenderPhase phase) {
    switch (phase) {
    case RenderPhase::Initializing: return "initializing";
    case RenderPhase::Rendering:    return "rendering";
    case RenderPhase::Complete:     return "complete";
    }
    return QString();
}

QString FrameCaptureService::errorName(CaptureError error) {
    switch (error) {
    case CaptureError::None:                return "none";
    case CaptureError::BrowserLaunch:       return "browser_launch";
    case CaptureError::RenderTimeout:       return "render_timeout";
    case CaptureError::RenderTargetMissing: return "render_target_missing";
    case CaptureError::Capture:             return "capture";
    case CaptureError::Upload:              return "upload";
    case CaptureError::Cancelled:           return "cancelled";
    }
    return QString();
}
