#include "FfmpegRunner.h"
#include "Log.h"

#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <algorithm>

namespace {

const QStringList CommonPaths = {
    "/nix/var/nix/profiles/default/bin/ffmpeg",
    "/usr/bin/ffmpeg",
    "/usr/local/bin/ffmpeg",
    "/opt/homebrew/bin/ffmpeg",
};

constexpr int StartTimeoutMs = 10000;
constexpr int PollIntervalMs = 200;
constexpr int StderrTailBytes = 2000;

bool isExecutableFile(const QString& path) {
    QFileInfo info(path);
    return info.isFile() && info.isExecutable();
}

} // namespace

FfmpegRunner::FfmpegRunner(const QString& configuredPath, QObject* parent)
    : QObject(parent)
    , m_program(locate(configuredPath))
    , m_configuredPath(configuredPath)
{
    if (m_program.isEmpty()) {
        qCWarning(lcMedia) << "FFmpeg not found"
                           << (configuredPath.isEmpty() ? QString() : "at " + configuredPath);
    } else {
        qCDebug(lcMedia) << "Using FFmpeg at" << m_program;
    }
}

FfmpegRunner::~FfmpegRunner() = default;

QString FfmpegRunner::locate(const QString& configuredPath) {
    if (!configuredPath.isEmpty()) {
        if (isExecutableFile(configuredPath)) return configuredPath;
        // A bare program name is looked up on PATH
        if (!configuredPath.contains('/')) return QStandardPaths::findExecutable(configuredPath);
        return QString();
    }

    const QString onPath = QStandardPaths::findExecutable("ffmpeg");
    if (!onPath.isEmpty()) return onPath;

    for (const QString& path : CommonPaths) {
        if (isExecutableFile(path)) return path;
    }
    return QString();
}

bool FfmpegRunner::parseProgressTime(const QByteArray& line, double* seconds) {
    const QByteArray trimmed = line.trimmed();
    QByteArray value;
    if (trimmed.startsWith("out_time_us=")) {
        value = trimmed.mid(12);
    } else if (trimmed.startsWith("out_time_ms=")) {
        value = trimmed.mid(12);
    } else {
        return false;
    }

    bool ok = false;
    const qint64 micros = value.toLongLong(&ok);
    if (!ok || micros < 0) return false;
    *seconds = micros / 1000000.0;
    return true;
}

bool FfmpegRunner::run(const QStringList& arguments, double expectedDuration,
                       const ProgressCallback& onProgress) {
    m_error.clear();
    m_cancelled = false;

    if (m_program.isEmpty()) {
        m_error = m_configuredPath.isEmpty()
            ? QString("FFmpeg not found on PATH or in common install locations")
            : QString("FFmpeg not found at %1").arg(m_configuredPath);
        return false;
    }

    QProcess process;
    process.setProgram(m_program);
    process.setArguments(arguments);
    qCDebug(lcMedia) << "ffmpeg" << arguments.join(' ');
    process.start();
    if (!process.waitForStarted(StartTimeoutMs)) {
        m_error = QString("Cannot start FFmpeg: %1").arg(process.errorString());
        return false;
    }

    QByteArray pending;
    QByteArray stderrData;
    auto drain = [&] {
        pending += process.readAllStandardOutput();
        stderrData += process.readAllStandardError();
        if (stderrData.size() > StderrTailBytes * 2) {
            stderrData = stderrData.right(StderrTailBytes);
        }

        int newline;
        while ((newline = pending.indexOf('\n')) >= 0) {
            const QByteArray line = pending.left(newline);
            pending.remove(0, newline + 1);
            double seconds = 0.0;
            if (onProgress && expectedDuration > 0.0 && parseProgressTime(line, &seconds)) {
                onProgress(std::clamp(seconds / expectedDuration, 0.0, 1.0));
            }
        }
    };

    while (!process.waitForFinished(PollIntervalMs)) {
        drain();
        if (m_cancelled) {
            process.kill();
            process.waitForFinished();
            m_error = "FFmpeg cancelled";
            return false;
        }
        if (process.state() == QProcess::NotRunning) break;
    }
    drain();

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString tail = QString::fromUtf8(stderrData.right(StderrTailBytes)).trimmed();
        m_error = QString("FFmpeg failed (exit code %1)%2")
            .arg(process.exitCode())
            .arg(tail.isEmpty() ? QString() : ": " + tail);
        return false;
    }

    if (onProgress && expectedDuration > 0.0) onProgress(1.0);
    return true;
}
