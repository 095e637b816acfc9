#include "MediaProbe.h"
#include "Log.h"

#include <QFileInfo>
#include <memory>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

namespace {

struct FormatContextCloser {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;

QString avError(int code) {
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(code, buffer, sizeof(buffer));
    return QString::fromUtf8(buffer);
}

double streamSeconds(const AVStream* stream) {
    if (stream->duration <= 0) return 0.0;
    return stream->duration * av_q2d(stream->time_base);
}

} // namespace

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_error.clear();
    m_info.filePath = filePath;
    m_info.fileSize = QFileInfo(filePath).size();

    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot open %1: %2").arg(filePath, avError(ret));
        return false;
    }
    FormatContextPtr ctx(raw);

    ret = avformat_find_stream_info(ctx.get(), nullptr);
    if (ret < 0) {
        m_error = QString("Cannot read streams of %1: %2").arg(filePath, avError(ret));
        return false;
    }

    if (ctx->duration > 0) {
        m_info.duration = static_cast<double>(ctx->duration) / AV_TIME_BASE;
    }

    const int videoIndex = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (videoIndex >= 0) {
        const AVCodecParameters* par = ctx->streams[videoIndex]->codecpar;
        m_info.hasVideo = true;
        m_info.width = par->width;
        m_info.height = par->height;
    }

    const int audioIndex = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audioIndex >= 0) {
        const AVStream* stream = ctx->streams[audioIndex];
        const AVCodecDescriptor* desc = avcodec_descriptor_get(stream->codecpar->codec_id);
        m_info.hasAudio = true;
        m_info.audioCodec = desc ? QString(desc->name) : QString("unknown");
        m_info.sampleRate = stream->codecpar->sample_rate;
        m_info.channels = stream->codecpar->ch_layout.nb_channels;

        // Raw audio streams carry no container duration
        if (m_info.duration <= 0.0) {
            m_info.duration = streamSeconds(stream);
        }
    }

    qCDebug(lcMedia) << "Probed" << filePath << "duration" << m_info.duration
                     << "video" << m_info.width << "x" << m_info.height
                     << "audio" << m_info.audioCodec << m_info.sampleRate << m_info.channels;
    return true;
}

bool MediaProbe::sameAudioFormat(const MediaInfo& a, const MediaInfo& b) {
    return a.hasAudio && b.hasAudio
        && a.audioCodec == b.audioCodec
        && a.sampleRate == b.sampleRate
        && a.channels == b.channels;
}
