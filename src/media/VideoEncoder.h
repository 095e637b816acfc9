#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <vector>
#include "AppConstants.h"

class FfmpegRunner;

// Fixed H.264/AAC MP4 profile.
struct EncoderSettings {
    int fps = AppConstants::DefaultFps;
    QString videoCodec = "libx264";
    QString preset = "medium";
    int crf = AppConstants::DefaultCrf;
    QString pixelFormat = "yuv420p";
    QString audioCodec = "aac";
    QString audioBitrate = "192k";
};

// A still shown from `time` until the next entry.
struct ConcatFrame {
    QString path;
    double time = 0.0;
};

class VideoEncoder : public QObject {
    Q_OBJECT
public:
    explicit VideoEncoder(FfmpegRunner* ffmpeg, QObject* parent = nullptr);
    ~VideoEncoder();

    void setSettings(const EncoderSettings& settings) { m_settings = settings; }
    const EncoderSettings& settings() const { return m_settings; }

    // ffconcat script: every frame with the time until the next one (the
    // last one runs to totalDuration), floored at 0.01 s. The last frame is
    // listed once more so its duration is honoured.
    static QString buildConcatList(const std::vector<ConcatFrame>& frames, double totalDuration);
    bool writeConcatFile(const QString& path, const std::vector<ConcatFrame>& frames,
                         double totalDuration);

    QStringList buildArguments(const QString& concatPath, const QString& audioPath,
                               const QString& outputPath) const;

    // audioPath may be empty for a silent video.
    bool encode(const QString& concatPath, const QString& audioPath, const QString& outputPath,
                double duration);

    void cancel();
    QString errorString() const { return m_error; }

    // Quotes a path for a concat script line: file '<path>'.
    static QString escapeConcatPath(const QString& path);

signals:
    void progress(double fraction);  // 0.0 to 1.0

private:
    FfmpegRunner* m_ffmpeg;
    EncoderSettings m_settings;
    QString m_error;
};
