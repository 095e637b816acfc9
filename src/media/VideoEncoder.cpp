#include "VideoEncoder.h"
#include "FfmpegRunner.h"
#include "Log.h"

#include <QFileInfo>
#include <QSaveFile>
#include <algorithm>

namespace {

constexpr double MinFrameDuration = 0.01;

} // namespace

VideoEncoder::VideoEncoder(FfmpegRunner* ffmpeg, QObject* parent)
    : QObject(parent), m_ffmpeg(ffmpeg) {}

VideoEncoder::~VideoEncoder() = default;

QString VideoEncoder::escapeConcatPath(const QString& path) {
    QString escaped = path;
    escaped.replace('\\', '/');
    escaped.replace("'", "'\\''");
    return escaped;
}

QString VideoEncoder::buildConcatList(const std::vector<ConcatFrame>& frames, double totalDuration) {
    QString list;
    for (size_t i = 0; i < frames.size(); ++i) {
        const double next = i + 1 < frames.size() ? frames[i + 1].time : totalDuration;
        const double duration = std::max(MinFrameDuration, next - frames[i].time);
        list += QString("file '%1'\n").arg(escapeConcatPath(frames[i].path));
        list += QString("duration %1\n").arg(duration, 0, 'f', 4);
    }
    if (!frames.empty()) {
        list += QString("file '%1'\n").arg(escapeConcatPath(frames.back().path));
    }
    return list;
}

bool VideoEncoder::writeConcatFile(const QString& path, const std::vector<ConcatFrame>& frames,
                                   double totalDuration) {
    QSaveFile file(path);
    const QByteArray data = buildConcatList(frames, totalDuration).toUtf8();
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size() || !file.commit()) {
        m_error = QString("Cannot write concat file: %1").arg(path);
        return false;
    }
    return true;
}

QStringList VideoEncoder::buildArguments(const QString& concatPath, const QString& audioPath,
                                         const QString& outputPath) const {
    QStringList args;
    args << "-y" << "-f" << "concat" << "-safe" << "0" << "-i" << concatPath;
    if (!audioPath.isEmpty()) {
        args << "-i" << audioPath;
    }

    // libx264 with yuv420p needs even dimensions
    args << "-vf" << "scale=trunc(iw/2)*2:trunc(ih/2)*2"
         << "-c:v" << m_settings.videoCodec
         << "-preset" << m_settings.preset
         << "-crf" << QString::number(m_settings.crf)
         << "-pix_fmt" << m_settings.pixelFormat
         << "-movflags" << "+faststart"
         << "-r" << QString::number(m_settings.fps);

    if (!audioPath.isEmpty()) {
        args << "-c:a" << m_settings.audioCodec
             << "-b:a" << m_settings.audioBitrate
             << "-shortest";
    }

    args << "-progress" << "pipe:1" << "-nostats" << "-loglevel" << "error"
         << outputPath;
    return args;
}

bool VideoEncoder::encode(const QString& concatPath, const QString& audioPath,
                          const QString& outputPath, double duration) {
    m_error.clear();
    const QStringList args = buildArguments(concatPath, audioPath, outputPath);

    qCInfo(lcMedia) << "Encoding" << outputPath << (audioPath.isEmpty() ? "(silent)" : "with audio");
    const bool ok = m_ffmpeg->run(args, duration, [this](double fraction) {
        emit progress(fraction);
    });
    if (!ok) {
        m_error = QString("Video encoding failed: %1").arg(m_ffmpeg->errorString());
        return false;
    }
    if (!QFileInfo::exists(outputPath)) {
        m_error = QString("Encoder produced no output: %1").arg(outputPath);
        return false;
    }
    return true;
}

void VideoEncoder::cancel() {
    m_ffmpeg->cancel();
}
