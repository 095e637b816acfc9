#pragma once

#include <QObject>
#include <QString>

// What the pipeline needs to know about a narration file or an encoded video.
struct MediaInfo {
    QString filePath;
    qint64 fileSize = 0;
    double duration = 0.0;     // seconds; stream duration when the container has none

    bool hasVideo = false;
    int width = 0;
    int height = 0;

    bool hasAudio = false;
    QString audioCodec;
    int sampleRate = 0;
    int channels = 0;
};

class MediaProbe : public QObject {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe();

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

    // Same codec, sample rate and channel count: streams can be joined
    // without re-encoding.
    static bool sameAudioFormat(const MediaInfo& a, const MediaInfo& b);

private:
    MediaInfo m_info;
    QString m_error;
};
