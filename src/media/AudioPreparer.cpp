#include "AudioPreparer.h"
#include "FfmpegRunner.h"
#include "HttpTransfer.h"
#include "Log.h"
#include "MediaProbe.h"
#include "VideoEncoder.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QUrl>

namespace {

// Extension of the source, used so ffmpeg can pick a demuxer.
QString sourceSuffix(const QString& url) {
    const QString path = QUrl(url).path();
    const QString suffix = QFileInfo(path.isEmpty() ? url : path).suffix().toLower();
    return suffix.isEmpty() ? QString("wav") : suffix;
}

} // namespace

AudioPreparer::AudioPreparer(FfmpegRunner* ffmpeg, QObject* parent)
    : QObject(parent), m_ffmpeg(ffmpeg) {}

AudioPreparer::~AudioPreparer() = default;

bool AudioPreparer::fetch(const QString& url, const QString& localPath) {
    const QUrl parsed(url);
    const QString scheme = parsed.scheme().toLower();

    if (scheme == "http" || scheme == "https") {
        HttpResponse response = HttpTransfer::get(parsed, m_downloadTimeoutMs);
        if (!response.ok()) {
            m_error = QString("Failed to download %1: %2").arg(url, HttpTransfer::describe(response));
            return false;
        }
        QSaveFile file(localPath);
        if (!file.open(QIODevice::WriteOnly) || file.write(response.body) != response.body.size()
            || !file.commit()) {
            m_error = QString("Cannot write audio file: %1").arg(localPath);
            return false;
        }
        return true;
    }

    const QString source = parsed.isLocalFile() ? parsed.toLocalFile() : url;
    if (!QFileInfo::exists(source)) {
        m_error = QString("Audio file not found: %1").arg(source);
        return false;
    }
    QFile::remove(localPath);
    if (!QFile::copy(source, localPath)) {
        m_error = QString("Cannot copy audio file %1 to %2").arg(source, localPath);
        return false;
    }
    return true;
}

bool AudioPreparer::prepare(const std::vector<AudioSource>& sources, const QString& workDir,
                            QString* audioPath) {
    audioPath->clear();
    m_error.clear();

    QStringList files;
    for (const AudioSource& source : sources) {
        if (source.url.isEmpty()) continue;
        const QString localPath = QDir(workDir).filePath(
            QString("audio-ch%1.%2").arg(source.chapterNumber).arg(sourceSuffix(source.url)));
        qCDebug(lcMedia) << "Fetching narration for chapter" << source.chapterNumber << source.url;
        if (!fetch(source.url, localPath)) {
            return false;
        }
        files.append(localPath);
    }

    if (files.isEmpty()) {
        qCInfo(lcMedia) << "No narration audio, exporting a silent video";
        return true;
    }
    if (files.size() == 1) {
        *audioPath = files.first();
        return true;
    }
    return concatenate(files, workDir, audioPath);
}

bool AudioPreparer::concatenate(const QStringList& files, const QString& workDir, QString* audioPath) {
    bool sameFormat = true;
    MediaInfo first;
    for (int i = 0; i < files.size() && sameFormat; ++i) {
        MediaProbe probe;
        if (!probe.probe(files[i])) {
            qCWarning(lcMedia) << "Cannot probe narration:" << probe.errorString();
            sameFormat = false;
            break;
        }
        if (i == 0) {
            first = probe.info();
            if (!first.hasAudio) {
                m_error = QString("No audio stream in %1").arg(files[i]);
                return false;
            }
        } else {
            sameFormat = MediaProbe::sameAudioFormat(first, probe.info());
        }
    }

    QString outputPath;
    QStringList args;
    if (sameFormat) {
        const QString listPath = QDir(workDir).filePath("audio-concat.txt");
        QString list;
        for (const QString& file : files) {
            list += QString("file '%1'\n").arg(VideoEncoder::escapeConcatPath(file));
        }
        QSaveFile listFile(listPath);
        if (!listFile.open(QIODevice::WriteOnly) || listFile.write(list.toUtf8()) < 0 || !listFile.commit()) {
            m_error = QString("Cannot write %1").arg(listPath);
            return false;
        }
        outputPath = QDir(workDir).filePath("audio-combined." + QFileInfo(files.first()).suffix());
        args = copyConcatArguments(listPath, outputPath);
    } else {
        qCInfo(lcMedia) << "Narration files differ in format, re-encoding to AAC";
        outputPath = QDir(workDir).filePath("audio-combined.m4a");
        args = reencodeConcatArguments(files, outputPath);
    }

    if (!m_ffmpeg->run(args)) {
        m_error = QString("Audio concatenation failed: %1").arg(m_ffmpeg->errorString());
        return false;
    }
    *audioPath = outputPath;
    return true;
}

QStringList AudioPreparer::copyConcatArguments(const QString& listPath, const QString& outputPath) {
    return { "-y", "-f", "concat", "-safe", "0", "-i", listPath,
             "-c", "copy", "-loglevel", "error", outputPath };
}

QStringList AudioPreparer::reencodeConcatArguments(const QStringList& inputs, const QString& outputPath) {
    QStringList args{ "-y" };
    QString filter;
    for (int i = 0; i < inputs.size(); ++i) {
        args << "-i" << inputs[i];
        filter += QString("[%1:a]").arg(i);
    }
    filter += QString("concat=n=%1:v=0:a=1[a]").arg(inputs.size());
    args << "-filter_complex" << filter
         << "-map" << "[a]"
         << "-c:a" << "aac" << "-b:a" << "192k"
         << "-loglevel" << "error"
         << outputPath;
    return args;
}
