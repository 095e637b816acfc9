#pragma once

#include <QObject>
#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>
#include "AppConstants.h"
#include "FrameCapture.h"
#include "VideoEncoder.h"

// Everything an export job needs besides the request itself.
struct ExportConfig {
    QString baseUrl;                    // render surface origin
    bool uploadFrames = false;          // also push every frame to the object store
    double flipDuration = AppConstants::DefaultFlipDuration;
    CaptureSettings capture;
    EncoderSettings encoder;

    QString ffmpegPath;                 // empty: discover
    QString browserEndpoint;            // running browser to attach to
    QString browserExecutable;          // Chromium binary to launch
    int browserLaunchTimeoutMs = 30000;

    QString tempRoot;                   // empty: system temp directory

    // Object store used by the command line tool
    QString storeDirectory;
    QString storeUrl;
    QString storeToken;

    bool keepOutputOnUploadFailure = false;
    QString recoveryDir;

    // Overlay from BOOKREEL_UPLOAD_FRAMES, BOOKREEL_JPEG_QUALITY, FFMPEG_PATH,
    // CHROME_EXECUTABLE_PATH and CHROME_WS_ENDPOINT. Unset variables keep
    // the current values.
    void applyEnvironment(const QProcessEnvironment& env);
};

class ExportConfigFile : public QObject {
    Q_OBJECT
public:
    explicit ExportConfigFile(QObject* parent = nullptr);
    ~ExportConfigFile();

    bool save(const QString& filePath, const ExportConfig& config);
    bool load(const QString& filePath, ExportConfig& config);

    static QJsonObject toJson(const ExportConfig& config);
    // Missing keys keep their defaults.
    static ExportConfig fromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
