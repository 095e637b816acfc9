#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <vector>
#include "BookData.h"
#include "ExportConfig.h"
#include "ExportTypes.h"
#include "FrameCapture.h"
#include "FramePlan.h"
#include "SyncTypes.h"

class AudioPreparer;
class BookSource;
class BrowserLauncher;
class FfmpegRunner;
class ObjectStore;
class Paginator;
class QTemporaryDir;
class VideoEncoder;

// Runs one export job end to end:
// initializing -> rendering_frames -> downloading -> stitching -> uploading
// -> complete, or error from any phase. The working directory and any
// uploaded frames are always cleaned up.
class VideoExporter : public QObject {
    Q_OBJECT
public:
    // None of the pointers is owned.
    VideoExporter(BookSource* books, ObjectStore* store, const Paginator* paginator,
                  const ExportConfig& config, QObject* parent = nullptr);
    ~VideoExporter();

    // Replaces the launcher built from the config's browser settings.
    void setBrowserLauncher(BrowserLauncher* launcher);

    ExportResult exportVideo(const ExportRequest& request);

    // Manifest only, nothing is rendered.
    bool generateManifest(const ExportRequest& request, VideoManifest& manifest);
    bool estimate(const ExportRequest& request, ExportEstimate& estimate);

    // Takes effect at the next frame or phase boundary.
    void cancel();

    const ExportConfig& config() const { return m_config; }
    QString errorString() const { return m_error; }
    ExportError errorKind() const { return m_errorKind; }

    // Working directory of the last job (already removed once it returns).
    QString lastWorkingDirectory() const { return m_lastWorkDir; }
    // Time-ordered frames of the last job as handed to the encoder.
    const std::vector<ConcatFrame>& lastFrameSequence() const { return m_lastSequence; }

signals:
    void progress(const ExportProgress& progress);

private:
    bool loadBook(const ExportRequest& request, BookData& book);
    bool buildManifest(const BookData& book, const ExportRequest& request, VideoManifest& manifest);
    ChapterTimestamps collectTimestamps(const BookData& book, const VideoManifest& manifest) const;

    bool renderPhase(const VideoManifest& manifest, const ChapterTimestamps& timestamps,
                     const ExportRequest& request, const QString& framesDir,
                     std::vector<FrameInfo>& frames);
    bool downloadPhase(const BookData& book, const ExportRequest& request, const QString& workDir,
                       std::vector<FrameInfo>& frames, std::vector<ConcatFrame>& ordered,
                       QString* audioPath);
    bool stitchPhase(const VideoManifest& manifest, const std::vector<ConcatFrame>& ordered,
                     const QString& audioPath, const QString& workDir, QString* outputPath);
    bool uploadPhase(const VideoManifest& manifest, const ExportRequest& request,
                     const QString& outputPath, ExportResult& result);

    void report(ExportPhase phase, double percent, const QString& message);
    void report(const ExportProgress& progress);
    bool fail(ExportError kind, const QString& message);
    bool checkCancelled();
    void keepForRecovery(const QString& outputPath, qint64 bookId, ExportResult& result);

    BookSource* m_books;
    ObjectStore* m_store;
    const Paginator* m_paginator;
    ExportConfig m_config;

    std::unique_ptr<BrowserLauncher> m_ownLauncher;
    BrowserLauncher* m_launcher = nullptr;
    std::unique_ptr<FfmpegRunner> m_ffmpeg;
    std::unique_ptr<VideoEncoder> m_encoder;
    std::unique_ptr<AudioPreparer> m_audio;
    FrameCaptureService* m_activeCapture = nullptr;

    double m_lastProgress = 0.0;
    bool m_cancelled = false;
    ExportError m_errorKind = ExportError::None;
    QString m_error;
    QString m_lastWorkDir;
    std::vector<ConcatFrame> m_lastSequence;
};
