#pragma once

#include <QObject>
#include <QString>
#include <QUrl>
#include <memory>
#include <vector>
#include "AppConstants.h"
#include "FramePlan.h"
#include "SyncTypes.h"

class BrowserLauncher;
class BrowserSession;
class ObjectStore;
class ResponseCache;

// One captured still.
struct FrameInfo {
    QString localPath;      // empty when not persisted locally
    QString url;            // empty when not uploaded
    double time = 0.0;      // video time (seconds)
    FrameType type = FrameType::Static;
    int chapterIndex = 0;
    int pageIndex = 0;
    int flipFrame = -1;
    int wordIndex = -1;
    int width = 0;
    int height = 0;
};

enum class RenderPhase {
    Initializing,
    Rendering,
    Complete
};

struct RenderProgress {
    RenderPhase phase = RenderPhase::Initializing;
    int currentChapter = 0;
    int totalChapters = 0;
    int currentFrame = 0;
    int totalFrames = 0;
};

enum class CaptureError {
    None,
    BrowserLaunch,
    RenderTimeout,
    RenderTargetMissing,
    Capture,
    Upload,
    Cancelled
};

struct CaptureSettings {
    int navigationTimeoutMs = AppConstants::DefaultNavigationTimeoutMs;
    int readyTimeoutMs = AppConstants::DefaultReadyTimeoutMs;
    int readyPollMs = AppConstants::DefaultReadyPollMs;
    int settleDelayMs = AppConstants::DefaultSettleDelayMs;
    int jpegQuality = AppConstants::DefaultJpegQuality;
    int frameWidth = AppConstants::FrameWidth;
    int frameHeight = AppConstants::FrameHeight;
    FramePlanOptions plan;
};

struct RenderOptions {
    qint64 bookId = 0;
    QString baseUrl;
    ReadingTheme theme = ReadingTheme::Day;
    FontSize fontSize = FontSize::Base;
    QString outputPrefix;   // object store prefix for uploaded frames
    QString outputDir;      // local frame directory
    bool uploadFrames = false;
};

// Renders every frame a manifest needs through one browser session.
class FrameCaptureService : public QObject {
    Q_OBJECT
public:
    // Neither pointer is owned. store may be null when frames are not uploaded.
    FrameCaptureService(BrowserLauncher* launcher, ObjectStore* store, QObject* parent = nullptr);
    ~FrameCaptureService();

    void setSettings(const CaptureSettings& settings);
    const CaptureSettings& settings() const { return m_settings; }

    // Captures frames in plan order (statics, then flips, per chapter).
    // On failure frames() still lists what was captured so it can be cleaned up.
    bool renderFrames(const VideoManifest& manifest, const ChapterTimestamps& timestamps,
                      const RenderOptions& options);

    const std::vector<FrameInfo>& frames() const { return m_frames; }
    CaptureError errorKind() const { return m_errorKind; }
    QString errorString() const { return m_error; }

    // Stops before the next frame.
    void cancel() { m_cancelled = true; }

    int cacheHits() const;

    static QUrl buildRenderUrl(const QString& baseUrl, qint64 bookId, const FrameRequest& request,
                               ReadingTheme theme, FontSize fontSize);

    // Deletes uploaded frames. Returns how many were removed.
    static int cleanupFrames(const std::vector<FrameInfo>& frames, ObjectStore* store);

    static QString phaseName(RenderPhase phase);
    static QString errorName(CaptureError error);

signals:
    void renderProgress(const RenderProgress& progress);
    void frameRendered(const FrameInfo& frame);

private:
    bool renderWithSession(BrowserSession& session, const VideoManifest& manifest,
                           const ChapterTimestamps& timestamps, const RenderOptions& options);
    void prepareSession(BrowserSession& session);
    bool captureFrame(BrowserSession& session, const FrameRequest& request,
                      const RenderOptions& options, int frameIndex, FrameInfo& frame);
    bool waitForRenderReady(BrowserSession& session, const FrameRequest& request);
    bool fail(CaptureError kind, const QString& message);

    BrowserLauncher* m_launcher;
    ObjectStore* m_store;
    CaptureSettings m_settings;
    std::unique_ptr<ResponseCache> m_cache;

    std::vector<FrameInfo> m_frames;
    CaptureError m_errorKind = CaptureError::None;
    QString m_error;
    bool m_cancelled = false;
};
