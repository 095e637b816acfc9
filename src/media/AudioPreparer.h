#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <vector>

class FfmpegRunner;

struct AudioSource {
    int chapterNumber = 0;
    QString url;        // http(s)://, file:// or a local path
};

// Fetches chapter narration into a working directory and joins it into one
// track in chapter order.
class AudioPreparer : public QObject {
    Q_OBJECT
public:
    explicit AudioPreparer(FfmpegRunner* ffmpeg, QObject* parent = nullptr);
    ~AudioPreparer();

    // *audioPath is left empty when there is no narration at all.
    bool prepare(const std::vector<AudioSource>& sources, const QString& workDir, QString* audioPath);

    // Copies or downloads one source to localPath.
    bool fetch(const QString& url, const QString& localPath);

    void setDownloadTimeout(int ms) { m_downloadTimeoutMs = ms; }
    QString errorString() const { return m_error; }

    static QStringList copyConcatArguments(const QString& listPath, const QString& outputPath);
    static QStringList reencodeConcatArguments(const QStringList& inputs, const QString& outputPath);

private:
    bool concatenate(const QStringList& files, const QString& workDir, QString* audioPath);

    FfmpegRunner* m_ffmpeg;
    int m_downloadTimeoutMs = 300000;
    QString m_error;
};
