#include "CaptureSource.hpp"

#include "FfmpegUtil.hpp"
#include "Log.hpp"

#include <chrono>
#include <thread>

extern "C" {
#include <libavdevice/avdevice.h>
}

namespace vd {

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

FfmpegCaptureSource::FfmpegCaptureSource(std::string input_format,
                                         std::string device,
                                         int sample_rate)
    : input_format_(std::move(input_format)),
      device_(std::move(device)),
      sample_rate_(sample_rate) {
    avdevice_register_all();
}

FfmpegCaptureSource::~FfmpegCaptureSource() {
    close();
}

// ---------------------------------------------------------------------------
// open
// ---------------------------------------------------------------------------

bool FfmpegCaptureSource::open() {
    if (fmt_ctx_) return true;

    const AVInputFormat* input = av_find_input_format(input_format_.c_str());
    if (!input) {
        Logger::error("capture: input format '" + input_format_ + "' not available");
        return false;
    }

    AVDictionary* options = nullptr;
    av_dict_set(&options, "sample_rate", std::to_string(sample_rate_).c_str(), 0);
    av_dict_set(&options, "channels", "1", 0);

    AVFormatContext* ifmt_ctx = nullptr;
    int ret = avformat_open_input(&ifmt_ctx, device_.c_str(), input, &options);
    av_dict_free(&options);
    if (ret < 0) {
        Logger::error("capture: cannot open '" + device_ + "': " + ffmpeg::error_string(ret));
        return false;
    }

    ret = avformat_find_stream_info(ifmt_ctx, nullptr);
    if (ret < 0) {
        Logger::error("capture: no stream info: " + ffmpeg::error_string(ret));
        avformat_close_input(&ifmt_ctx);
        return false;
    }

    std::string error;
    AVCodecContext* dec_ctx = ffmpeg::open_audio_decoder(ifmt_ctx, stream_index_, error);
    if (!dec_ctx) {
        Logger::error("capture: " + error);
        avformat_close_input(&ifmt_ctx);
        return false;
    }

    SwrContext* swr = ffmpeg::make_mono_float_resampler(dec_ctx, sample_rate_);
    if (!swr) {
        Logger::error("capture: cannot initialize resampler");
        avcodec_free_context(&dec_ctx);
        avformat_close_input(&ifmt_ctx);
        return false;
    }

    fmt_ctx_ = ifmt_ctx;
    dec_ctx_ = dec_ctx;
    swr_ctx_ = swr;
    packet_  = av_packet_alloc();
    frame_   = av_frame_alloc();

    Logger::info("capture: opened " + input_format_ + ":" + device_);
    return true;
}

// ---------------------------------------------------------------------------
// read
// ---------------------------------------------------------------------------

bool FfmpegCaptureSource::read(std::vector<float>& out) {
    if (!fmt_ctx_) return false;

    auto* ifmt  = static_cast<AVFormatContext*>(fmt_ctx_);
    auto* dec   = static_cast<AVCodecContext*>(dec_ctx_);
    auto* swr   = static_cast<SwrContext*>(swr_ctx_);
    auto* pkt   = static_cast<AVPacket*>(packet_);
    auto* frame = static_cast<AVFrame*>(frame_);

    const size_t before = out.size();

    while (out.size() == before) {
        int ret = av_read_frame(ifmt, pkt);
        if (ret == AVERROR(EAGAIN)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            continue;
        }
        if (ret < 0) {
            if (ret != AVERROR_EOF) {
                Logger::error("capture: read failed: " + ffmpeg::error_string(ret));
            }
            return false;
        }

        if (pkt->stream_index == stream_index_) {
            ret = avcodec_send_packet(dec, pkt);
            if (ret < 0) {
                Logger::warn("capture: dropped packet: " + ffmpeg::error_string(ret));
            }
            while (avcodec_receive_frame(dec, frame) == 0) {
                if (!ffmpeg::append_resampled(swr, frame, dec->sample_rate, sample_rate_, out)) {
                    Logger::error("capture: resampling failed");
                    av_packet_unref(pkt);
                    return false;
                }
            }
        }
        av_packet_unref(pkt);
    }
    return true;
}

// ---------------------------------------------------------------------------
// close
// ---------------------------------------------------------------------------

void FfmpegCaptureSource::close() {
    if (frame_) {
        auto* frame = static_cast<AVFrame*>(frame_);
        av_frame_free(&frame);
        frame_ = nullptr;
    }
    if (packet_) {
        auto* pkt = static_cast<AVPacket*>(packet_);
        av_packet_free(&pkt);
        packet_ = nullptr;
    }
    if (swr_ctx_) {
        auto* swr = static_cast<SwrContext*>(swr_ctx_);
        swr_free(&swr);
        swr_ctx_ = nullptr;
    }
    if (dec_ctx_) {
        auto* dec = static_cast<AVCodecContext*>(dec_ctx_);
        avcodec_free_context(&dec);
        dec_ctx_ = nullptr;
    }
    if (fmt_ctx_) {
        auto* ifmt = static_cast<AVFormatContext*>(fmt_ctx_);
        avformat_close_input(&ifmt);
        fmt_ctx_ = nullptr;
    }
    stream_index_ = -1;
}

} // namespace vd
