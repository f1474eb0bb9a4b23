#include "AudioConverter.hpp"

#include "FfmpegUtil.hpp"
#include "Log.hpp"
#include "Waveform.hpp"

#include <algorithm>
#include <filesystem>

extern "C" {
#include <libavutil/opt.h>
}

namespace vd {

namespace {

// Owns everything the Opus encode path allocates so every exit frees it.
struct EncoderState {
    AVFormatContext* ofmt  = nullptr;
    AVCodecContext*  enc   = nullptr;
    SwrContext*      swr   = nullptr;
    AVFrame*         frame = nullptr;
    AVPacket*        pkt   = nullptr;

    ~EncoderState() {
        if (pkt) av_packet_free(&pkt);
        if (frame) av_frame_free(&frame);
        if (swr) swr_free(&swr);
        if (enc) avcodec_free_context(&enc);
        if (ofmt) {
            if (ofmt->pb) avio_closep(&ofmt->pb);
            avformat_free_context(ofmt);
        }
    }
};

[[noreturn]] void fail_encode(const std::string& output_path, const std::string& what) {
    std::error_code ec;
    std::filesystem::remove(output_path, ec);
    throw ConversionError(ConversionError::Kind::encoder_failed, what);
}

bool drain_packets(EncoderState& s, AVStream* stream) {
    while (avcodec_receive_packet(s.enc, s.pkt) == 0) {
        s.pkt->stream_index = stream->index;
        av_packet_rescale_ts(s.pkt, s.enc->time_base, stream->time_base);
        if (av_interleaved_write_frame(s.ofmt, s.pkt) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioConverter::AudioConverter() = default;
AudioConverter::~AudioConverter() = default;

// ---------------------------------------------------------------------------
// convert
// ---------------------------------------------------------------------------

ConvertedArtifact AudioConverter::convert(const Take& take) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (take.raw_path.empty() || !fs::exists(take.raw_path, ec)) {
        throw ConversionError(ConversionError::Kind::source_unreadable,
                              "raw take not found: " + take.raw_path);
    }
    auto size = fs::file_size(take.raw_path, ec);
    if (ec || size == 0) {
        throw ConversionError(ConversionError::Kind::source_unreadable,
                              "raw take is empty: " + take.raw_path);
    }
    if (take.duration_ms <= 0) {
        throw ConversionError(ConversionError::Kind::zero_duration,
                              "take " + take.id + " has zero duration");
    }

    std::vector<float> pcm = decode_to_pcm(take.raw_path, kOpusSampleRate);
    if (pcm.empty()) {
        throw ConversionError(ConversionError::Kind::zero_duration,
                              "take " + take.id + " decoded to no samples");
    }

    ConvertedArtifact artifact;
    artifact.path    = output_path_for(take.raw_path);
    artifact.take_id = take.id;

    encode_opus(pcm, artifact.path);

    int64_t duration_ms   = static_cast<int64_t>(pcm.size()) * 1000 / kOpusSampleRate;
    artifact.duration_sec = static_cast<int32_t>((duration_ms + 500) / 1000);
    artifact.waveform     = compute_waveform(pcm, kWaveformBuckets);

    Logger::info("converter: " + fs::path(take.raw_path).filename().string()
                 + " -> " + fs::path(artifact.path).filename().string()
                 + " (" + std::to_string(artifact.duration_sec) + " s)");
    return artifact;
}

std::string AudioConverter::output_path_for(const std::string& raw_path) {
    return std::filesystem::path(raw_path).replace_extension(".ogg").string();
}

// ---------------------------------------------------------------------------
// decode_to_pcm
// ---------------------------------------------------------------------------

std::vector<float> AudioConverter::decode_to_pcm(const std::string& input_path,
                                                 int target_sample_rate) const {
    using Kind = ConversionError::Kind;
    std::vector<float> pcm_out;

    // 1. Open input file
    AVFormatContext* fmt_ctx = nullptr;
    int ret = avformat_open_input(&fmt_ctx, input_path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw ConversionError(Kind::source_unreadable,
            "cannot open '" + input_path + "': " + ffmpeg::error_string(ret));
    }

    ret = avformat_find_stream_info(fmt_ctx, nullptr);
    if (ret < 0) {
        avformat_close_input(&fmt_ctx);
        throw ConversionError(Kind::source_unreadable, "no stream info in '" + input_path + "'");
    }

    // 2. Find the audio stream and open its decoder
    int audio_idx = -1;
    std::string error;
    AVCodecContext* dec_ctx = ffmpeg::open_audio_decoder(fmt_ctx, audio_idx, error);
    if (!dec_ctx) {
        avformat_close_input(&fmt_ctx);
        throw ConversionError(Kind::source_unreadable, error + " in '" + input_path + "'");
    }

    // 3. Set up resampler
    SwrContext* swr = ffmpeg::make_mono_float_resampler(dec_ctx, target_sample_rate);
    if (!swr) {
        avcodec_free_context(&dec_ctx);
        avformat_close_input(&fmt_ctx);
        throw ConversionError(Kind::source_unreadable, "cannot initialize resampler");
    }

    // 4. Read packets, decode frames, resample
    AVPacket* pkt = av_packet_alloc();
    AVFrame* frame = av_frame_alloc();
    bool resample_ok = true;
    while (resample_ok && av_read_frame(fmt_ctx, pkt) >= 0) {
        if (pkt->stream_index == audio_idx && avcodec_send_packet(dec_ctx, pkt) >= 0) {
            while (avcodec_receive_frame(dec_ctx, frame) == 0) {
                resample_ok = ffmpeg::append_resampled(swr, frame, dec_ctx->sample_rate,
                                                       target_sample_rate, pcm_out)
                              && resample_ok;
            }
        }
        av_packet_unref(pkt);
    }

    // 5. Flush decoder and resampler
    avcodec_send_packet(dec_ctx, nullptr);
    while (resample_ok && avcodec_receive_frame(dec_ctx, frame) == 0) {
        resample_ok = ffmpeg::append_resampled(swr, frame, dec_ctx->sample_rate,
                                               target_sample_rate, pcm_out);
    }
    if (resample_ok) {
        ffmpeg::flush_resampler(swr, target_sample_rate, pcm_out);
    }

    // 6. Cleanup
    av_frame_free(&frame);
    av_packet_free(&pkt);
    swr_free(&swr);
    avcodec_free_context(&dec_ctx);
    avformat_close_input(&fmt_ctx);

    if (!resample_ok) {
        throw ConversionError(Kind::source_unreadable, "resampling failed for '" + input_path + "'");
    }
    return pcm_out;
}

// ---------------------------------------------------------------------------
// encode_opus
// ---------------------------------------------------------------------------

void AudioConverter::encode_opus(const std::vector<float>& pcm,
                                 const std::string& output_path) const {
    EncoderState s;

    int ret = avformat_alloc_output_context2(&s.ofmt, nullptr, "ogg", output_path.c_str());
    if (ret < 0 || !s.ofmt) {
        throw ConversionError(ConversionError::Kind::encoder_failed, "no ogg muxer available");
    }

    // Prefer libopus; fall back to FFmpeg's native encoder.
    const AVCodec* codec = avcodec_find_encoder_by_name("libopus");
    if (!codec) codec = avcodec_find_encoder(AV_CODEC_ID_OPUS);
    if (!codec) {
        throw ConversionError(ConversionError::Kind::encoder_failed, "no opus encoder available");
    }

    AVStream* stream = avformat_new_stream(s.ofmt, nullptr);
    s.enc = avcodec_alloc_context3(codec);
    if (!stream || !s.enc) {
        throw ConversionError(ConversionError::Kind::encoder_failed, "out of memory");
    }

    s.enc->sample_rate = kOpusSampleRate;
    s.enc->ch_layout   = (AVChannelLayout)AV_CHANNEL_LAYOUT_MONO;
    s.enc->sample_fmt  = codec->sample_fmts ? codec->sample_fmts[0] : AV_SAMPLE_FMT_FLT;
    s.enc->bit_rate    = kOpusBitRate;
    s.enc->time_base   = AVRational{1, kOpusSampleRate};
    s.enc->strict_std_compliance = FF_COMPLIANCE_EXPERIMENTAL;
    if (s.ofmt->oformat->flags & AVFMT_GLOBALHEADER)
        s.enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "application", "voip", 0);
    ret = avcodec_open2(s.enc, codec, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        throw ConversionError(ConversionError::Kind::encoder_failed,
                              "cannot open opus encoder: " + ffmpeg::error_string(ret));
    }
    avcodec_parameters_from_context(stream->codecpar, s.enc);
    stream->time_base = s.enc->time_base;

    ret = avio_open(&s.ofmt->pb, output_path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
        throw ConversionError(ConversionError::Kind::encoder_failed,
                              "cannot create '" + output_path + "': " + ffmpeg::error_string(ret));
    }
    ret = avformat_write_header(s.ofmt, nullptr);
    if (ret < 0) {
        fail_encode(output_path, "cannot write ogg header: " + ffmpeg::error_string(ret));
    }

    // Sample format converter (float interleaved -> encoder format)
    AVChannelLayout mono = AV_CHANNEL_LAYOUT_MONO;
    ret = swr_alloc_set_opts2(&s.swr,
        &mono, s.enc->sample_fmt, kOpusSampleRate,
        &mono, AV_SAMPLE_FMT_FLT, kOpusSampleRate,
        0, nullptr);
    if (ret < 0 || swr_init(s.swr) < 0) {
        fail_encode(output_path, "cannot initialize sample format converter");
    }

    s.frame = av_frame_alloc();
    s.pkt   = av_packet_alloc();
    if (!s.frame || !s.pkt) {
        fail_encode(output_path, "out of memory");
    }

    // Feed fixed-size frames; the last one is padded with silence.
    const int frame_size = s.enc->frame_size > 0 ? s.enc->frame_size : 960;
    std::vector<float> block(static_cast<size_t>(frame_size));

    for (size_t offset = 0; offset < pcm.size(); offset += static_cast<size_t>(frame_size)) {
        size_t n = std::min(pcm.size() - offset, static_cast<size_t>(frame_size));
        std::fill(block.begin(), block.end(), 0.0f);
        std::copy(pcm.begin() + static_cast<std::ptrdiff_t>(offset),
                  pcm.begin() + static_cast<std::ptrdiff_t>(offset + n),
                  block.begin());

        av_frame_unref(s.frame);
        s.frame->nb_samples  = frame_size;
        s.frame->format      = s.enc->sample_fmt;
        s.frame->ch_layout   = s.enc->ch_layout;
        s.frame->sample_rate = kOpusSampleRate;
        if (av_frame_get_buffer(s.frame, 0) < 0) {
            fail_encode(output_path, "cannot allocate audio frame");
        }

        const uint8_t* in_buf = reinterpret_cast<const uint8_t*>(block.data());
        if (swr_convert(s.swr, s.frame->extended_data, frame_size, &in_buf, frame_size) < 0) {
            fail_encode(output_path, "sample format conversion failed");
        }
        s.frame->pts = static_cast<int64_t>(offset);

        ret = avcodec_send_frame(s.enc, s.frame);
        if (ret < 0) {
            fail_encode(output_path, "opus encode failed: " + ffmpeg::error_string(ret));
        }
        if (!drain_packets(s, stream)) {
            fail_encode(output_path, "cannot write ogg packet");
        }
    }

    // Flush encoder
    avcodec_send_frame(s.enc, nullptr);
    if (!drain_packets(s, stream)) {
        fail_encode(output_path, "cannot write ogg packet");
    }

    ret = av_write_trailer(s.ofmt);
    if (ret < 0) {
        fail_encode(output_path, "cannot write ogg trailer: " + ffmpeg::error_string(ret));
    }
}

} // namespace vd
