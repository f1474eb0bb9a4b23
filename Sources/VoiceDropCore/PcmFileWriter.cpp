#include "PcmFileWriter.hpp"

#include "FfmpegUtil.hpp"
#include "Log.hpp"

#include <filesystem>

namespace vd {

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

PcmFileWriter::PcmFileWriter() = default;

PcmFileWriter::~PcmFileWriter() {
    if (is_open()) {
        finalize();
    }
}

// ---------------------------------------------------------------------------
// open
// ---------------------------------------------------------------------------

bool PcmFileWriter::open(const std::string& path, int sample_rate) {
    if (is_open()) return false;

    path_           = path;
    sample_rate_    = sample_rate;
    frames_written_ = 0;

    AVFormatContext* ofmt_ctx = nullptr;
    int ret = avformat_alloc_output_context2(&ofmt_ctx, nullptr, "wav", path_.c_str());
    if (ret < 0 || !ofmt_ctx) {
        Logger::error("writer: no wav muxer: " + ffmpeg::error_string(ret));
        return false;
    }

    const AVCodec* pcm_codec = avcodec_find_encoder(AV_CODEC_ID_PCM_S16LE);
    if (!pcm_codec) { avformat_free_context(ofmt_ctx); return false; }

    AVStream* out_stream = avformat_new_stream(ofmt_ctx, pcm_codec);
    AVCodecContext* enc_ctx = avcodec_alloc_context3(pcm_codec);
    if (!out_stream || !enc_ctx) {
        avcodec_free_context(&enc_ctx);
        avformat_free_context(ofmt_ctx);
        return false;
    }
    enc_ctx->sample_rate = sample_rate_;
    enc_ctx->ch_layout   = (AVChannelLayout)AV_CHANNEL_LAYOUT_MONO;
    enc_ctx->sample_fmt  = AV_SAMPLE_FMT_S16;
    enc_ctx->time_base   = AVRational{1, sample_rate_};

    ret = avcodec_open2(enc_ctx, pcm_codec, nullptr);
    if (ret < 0) {
        Logger::error("writer: cannot open encoder: " + ffmpeg::error_string(ret));
        avcodec_free_context(&enc_ctx);
        avformat_free_context(ofmt_ctx);
        return false;
    }
    avcodec_parameters_from_context(out_stream->codecpar, enc_ctx);
    out_stream->time_base = AVRational{1, sample_rate_};

    ret = avio_open(&ofmt_ctx->pb, path_.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
        Logger::error("writer: cannot create " + path_ + ": " + ffmpeg::error_string(ret));
        avcodec_free_context(&enc_ctx);
        avformat_free_context(ofmt_ctx);
        return false;
    }

    ret = avformat_write_header(ofmt_ctx, nullptr);
    if (ret < 0) {
        Logger::error("writer: cannot write header: " + ffmpeg::error_string(ret));
        avio_closep(&ofmt_ctx->pb);
        avcodec_free_context(&enc_ctx);
        avformat_free_context(ofmt_ctx);
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        return false;
    }

    AVChannelLayout mono = AV_CHANNEL_LAYOUT_MONO;
    SwrContext* swr = nullptr;
    ret = swr_alloc_set_opts2(&swr,
        &mono, AV_SAMPLE_FMT_S16, sample_rate_,
        &mono, AV_SAMPLE_FMT_FLT, sample_rate_,
        0, nullptr);
    if (ret < 0 || swr_init(swr) < 0) {
        if (swr) swr_free(&swr);
        fmt_ctx_   = ofmt_ctx;
        codec_ctx_ = enc_ctx;
        abort();
        return false;
    }

    fmt_ctx_   = ofmt_ctx;
    codec_ctx_ = enc_ctx;
    swr_ctx_   = swr;
    stream_    = out_stream;
    return true;
}

// ---------------------------------------------------------------------------
// write
// ---------------------------------------------------------------------------

bool PcmFileWriter::write(const float* samples, size_t count) {
    if (!is_open()) return false;
    if (!samples || count == 0) return true;

    auto* enc = static_cast<AVCodecContext*>(codec_ctx_);
    auto* swr = static_cast<SwrContext*>(swr_ctx_);

    AVFrame* frame = av_frame_alloc();
    if (!frame) return false;
    frame->nb_samples  = static_cast<int>(count);
    frame->format      = AV_SAMPLE_FMT_S16;
    frame->ch_layout   = enc->ch_layout;
    frame->sample_rate = sample_rate_;
    if (av_frame_get_buffer(frame, 0) < 0) {
        av_frame_free(&frame);
        return false;
    }

    const uint8_t* in_buf = reinterpret_cast<const uint8_t*>(samples);
    int converted = swr_convert(swr, frame->extended_data, frame->nb_samples,
                                &in_buf, static_cast<int>(count));
    if (converted < 0) {
        av_frame_free(&frame);
        return false;
    }
    frame->nb_samples = converted;
    frame->pts        = frames_written_;

    bool ok = encode(frame);
    if (ok) frames_written_ += converted;
    av_frame_free(&frame);
    return ok;
}

bool PcmFileWriter::encode(void* frame_ptr) {
    auto* enc   = static_cast<AVCodecContext*>(codec_ctx_);
    auto* ofmt  = static_cast<AVFormatContext*>(fmt_ctx_);
    auto* st    = static_cast<AVStream*>(stream_);
    auto* frame = static_cast<AVFrame*>(frame_ptr);

    int ret = avcodec_send_frame(enc, frame);
    if (ret < 0 && ret != AVERROR_EOF) {
        Logger::error("writer: encode failed: " + ffmpeg::error_string(ret));
        return false;
    }

    AVPacket* pkt = av_packet_alloc();
    if (!pkt) return false;
    bool ok = true;
    while (avcodec_receive_packet(enc, pkt) == 0) {
        pkt->stream_index = 0;
        av_packet_rescale_ts(pkt, enc->time_base, st->time_base);
        if (av_interleaved_write_frame(ofmt, pkt) < 0) {
            ok = false;
        }
    }
    av_packet_free(&pkt);
    return ok;
}

// ---------------------------------------------------------------------------
// finalize / abort
// ---------------------------------------------------------------------------

bool PcmFileWriter::finalize() {
    if (!is_open()) return false;

    bool ok = encode(nullptr);

    auto* ofmt = static_cast<AVFormatContext*>(fmt_ctx_);
    if (av_write_trailer(ofmt) < 0) ok = false;

    release();
    return ok;
}

void PcmFileWriter::abort() {
    if (!is_open()) return;
    release();
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

void PcmFileWriter::release() {
    if (fmt_ctx_) {
        auto* ofmt = static_cast<AVFormatContext*>(fmt_ctx_);
        if (ofmt->pb) avio_closep(&ofmt->pb);
        avformat_free_context(ofmt);
        fmt_ctx_ = nullptr;
    }
    if (codec_ctx_) {
        auto* enc = static_cast<AVCodecContext*>(codec_ctx_);
        avcodec_free_context(&enc);
        codec_ctx_ = nullptr;
    }
    if (swr_ctx_) {
        auto* swr = static_cast<SwrContext*>(swr_ctx_);
        swr_free(&swr);
        swr_ctx_ = nullptr;
    }
    stream_ = nullptr;
}

} // namespace vd
