#pragma once

#include <QString>
#include <QtGlobal>
#include "SyncTypes.h"

enum class ExportPhase {
    Initializing,
    RenderingFrames,
    Downloading,
    Stitching,
    Uploading,
    Complete,
    Error
};

enum class ExportError {
    None,
    Manifest,
    RenderTimeout,
    RenderTargetMissing,
    BrowserLaunch,
    AudioPreparation,
    Encode,
    Upload,
    Capture,
    Cancelled
};

enum class ExportScope {
    Full,
    Chapter
};

QString exportPhaseName(ExportPhase phase);
QString exportErrorName(ExportError error);
QString exportScopeName(ExportScope scope);
bool exportScopeFromName(const QString& name, ExportScope& scope);

// Counters are -1 when they do not apply to the phase.
struct ExportProgress {
    ExportPhase phase = ExportPhase::Initializing;
    double progress = 0.0;      // 0-100
    int currentChapter = -1;
    int totalChapters = -1;
    int currentFrame = -1;
    int totalFrames = -1;
    QString message;
    QString error;
};

struct ExportRequest {
    qint64 bookId = 0;
    ExportScope scope = ExportScope::Full;
    int chapterNumber = 0;      // chapter scope only
    ReadingTheme theme = ReadingTheme::Day;
    FontSize fontSize = FontSize::Base;
};

struct ExportResult {
    bool success = false;
    QString videoUrl;
    double videoDuration = 0.0;     // seconds
    qint64 videoSize = 0;           // bytes
    QString error;
    ExportError errorKind = ExportError::None;
    QString recoveredPath;          // encoded video kept after a failed upload
};
