#include "FfmpegUtil.hpp"

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

namespace vd {
namespace ffmpeg {

std::string error_string(int errnum) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, errbuf, sizeof(errbuf));
    return errbuf;
}

bool append_resampled(SwrContext* swr, const AVFrame* frame,
                      int in_rate, int out_rate,
                      std::vector<float>& out) {
    int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr, in_rate) + frame->nb_samples,
        out_rate, in_rate, AV_ROUND_UP));
    if (out_samples <= 0) return true;

    std::vector<float> buf(static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    int converted = swr_convert(swr, &out_buf, out_samples,
                                const_cast<const uint8_t**>(frame->extended_data),
                                frame->nb_samples);
    if (converted < 0) return false;

    out.insert(out.end(), buf.begin(), buf.begin() + converted);
    return true;
}

void flush_resampler(SwrContext* swr, int out_rate, std::vector<float>& out) {
    int out_samples = static_cast<int>(swr_get_delay(swr, out_rate));
    if (out_samples <= 0) return;

    std::vector<float> buf(static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    int converted = swr_convert(swr, &out_buf, out_samples, nullptr, 0);
    if (converted > 0) {
        out.insert(out.end(), buf.begin(), buf.begin() + converted);
    }
}

AVCodecContext* open_audio_decoder(AVFormatContext* fmt_ctx,
                                   int& stream_index,
                                   std::string& error) {
    stream_index = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream_index < 0) {
        error = "no audio stream";
        return nullptr;
    }

    AVStream* stream = fmt_ctx->streams[stream_index];
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        error = "no decoder for audio codec";
        return nullptr;
    }

    AVCodecContext* dec_ctx = avcodec_alloc_context3(decoder);
    if (!dec_ctx) {
        error = "out of memory";
        return nullptr;
    }
    avcodec_parameters_to_context(dec_ctx, stream->codecpar);

    int ret = avcodec_open2(dec_ctx, decoder, nullptr);
    if (ret < 0) {
        error = "cannot open decoder: " + error_string(ret);
        avcodec_free_context(&dec_ctx);
        return nullptr;
    }
    return dec_ctx;
}

SwrContext* make_mono_float_resampler(const AVCodecContext* dec_ctx, int out_rate) {
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    SwrContext* swr = nullptr;
    int ret = swr_alloc_set_opts2(&swr,
        &out_layout, AV_SAMPLE_FMT_FLT, out_rate,
        &dec_ctx->ch_layout, dec_ctx->sample_fmt, dec_ctx->sample_rate,
        0, nullptr);
    if (ret < 0 || swr_init(swr) < 0) {
        if (swr) swr_free(&swr);
        return nullptr;
    }
    return swr;
}

} // namespace ffmpeg
} // namespace vd
