#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>

// Runs the ffmpeg executable and reports encode progress from its
// "-progress pipe:1" key=value stream.
class FfmpegRunner : public QObject {
    Q_OBJECT
public:
    // configuredPath overrides discovery; it must name an executable.
    explicit FfmpegRunner(const QString& configuredPath = QString(), QObject* parent = nullptr);
    ~FfmpegRunner();

    QString program() const { return m_program; }
    bool isAvailable() const { return !m_program.isEmpty(); }

    // Configured path, then PATH, then common install locations.
    static QString locate(const QString& configuredPath);

    using ProgressCallback = std::function<void(double fraction)>;

    // expectedDuration (seconds) scales progress; <= 0 disables reporting.
    bool run(const QStringList& arguments, double expectedDuration = 0.0,
             const ProgressCallback& onProgress = nullptr);

    void cancel() { m_cancelled = true; }
    bool wasCancelled() const { return m_cancelled; }
    QString errorString() const { return m_error; }

    // Seconds from an "out_time_us=" / "out_time_ms=" line (both microseconds).
    static bool parseProgressTime(const QByteArray& line, double* seconds);

private:
    QString m_program;
    QString m_configuredPath;
    QString m_error;
    bool m_cancelled = false;
};
