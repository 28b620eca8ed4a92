#include "MediaProbe.h"
#include "Logging.h"

#ifdef HAS_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/pixdesc.h>
}
#endif

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

#ifdef HAS_FFMPEG
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

    m_info.containerFormat = QString(fmtCtx->iformat->name);
    m_info.duration = (fmtCtx->duration > 0)
        ? static_cast<double>(fmtCtx->duration) / AV_TIME_BASE
        : 0.0;

    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;

        if (par->codec_type == AVMEDIA_TYPE_VIDEO && !m_info.hasVideo) {
            // Attached cover art is not a video stream for our purposes
            if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC)
                continue;

            m_info.hasVideo = true;
            m_info.videoWidth = par->width;
            m_info.videoHeight = par->height;
            const char* pixName = av_get_pix_fmt_name(static_cast<AVPixelFormat>(par->format));
            m_info.videoPixelFormat = pixName ? QString(pixName) : QString();

            const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
            m_info.videoCodec = desc ? QString(desc->name) : "unknown";

            if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0) {
                m_info.videoFps = av_q2d(stream->avg_frame_rate);
            } else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0) {
                m_info.videoFps = av_q2d(stream->r_frame_rate);
            }
        }
        else if (par->codec_type == AVMEDIA_TYPE_AUDIO && !m_info.hasAudio) {
            m_info.hasAudio = true;
            m_info.audioSampleRate = par->sample_rate;
            m_info.audioChannels = par->ch_layout.nb_channels;

            const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
            m_info.audioCodec = desc ? QString(desc->name) : "unknown";
        }
    }

    avformat_close_input(&fmtCtx);

    if (!m_info.hasVideo) {
        m_error = QString("No video stream found in %1").arg(filePath);
        return false;
    }

    qCDebug(lcProbe) << "Probed" << filePath << m_info.videoWidth << "x" << m_info.videoHeight
                     << "@" << m_info.videoFps << "fps, audio:" << m_info.hasAudio;
    return true;
#else
    m_error = "FFmpeg not available";
    return false;
#endif
}

bool ProbeCache::lookup(const QString& filePath, MediaInfo& info) {
    auto hit = m_results.constFind(filePath);
    if (hit != m_results.constEnd()) {
        info = hit.value();
        return true;
    }

    auto failed = m_failures.constFind(filePath);
    if (failed != m_failures.constEnd()) {
        m_lastError = failed.value();
        return false;
    }

    if (!m_probe || !m_probe->probe(filePath)) {
        m_lastError = m_probe ? m_probe->errorString() : QString("No media probe available");
        qCWarning(lcProbe) << "Probe failed for" << filePath << ":" << m_lastError;
        m_failures.insert(filePath, m_lastError);
        return false;
    }

    info = m_probe->info();
    m_results.insert(filePath, info);
    return true;
}
