#include "MediaProbe.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, errBuf);
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot find stream info: %1").arg(filePath);
        avformat_close_input(&fmtCtx);
        return false;
    }

    if (fmtCtx->duration != AV_NOPTS_VALUE && fmtCtx->duration >= 0) {
        m_info.duration = static_cast<double>(fmtCtx->duration) / AV_TIME_BASE;
        m_info.hasDuration = true;
    }

    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;

        if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
            m_info.hasVideo = true;
        }
        else if (par->codec_type == AVMEDIA_TYPE_AUDIO && !m_info.hasAudio) {
            m_info.hasAudio = true;
            m_info.audioSampleRate = par->sample_rate;
            m_info.audioChannels = par->ch_layout.nb_channels;

            // Raw streams without a container duration still carry one per stream
            if (!m_info.hasDuration && stream->duration != AV_NOPTS_VALUE && stream->duration >= 0) {
                m_info.duration = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
                m_info.hasDuration = true;
            }
        }
    }

    avformat_close_input(&fmtCtx);
    return true;
}

bool MediaProbe::probeDuration(const QString& filePath, double& seconds) {
    if (!probe(filePath))
        return false;

    if (!m_info.hasDuration) {
        m_error = QString("No duration reported for: %1").arg(filePath);
        return false;
    }

    seconds = m_info.duration;
    return true;
}
