#pragma once

// Internal helpers shared by the FFmpeg-backed classes.  Not part of the
// public interface: this header pulls in FFmpeg.

#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

namespace vd {
namespace ffmpeg {

/// Human-readable text for an FFmpeg error code.
std::string error_string(int errnum);

/// Convert one decoded frame to mono float at `out_rate` and append it.
/// Returns false if the resampler reported an error.
bool append_resampled(SwrContext* swr, const AVFrame* frame,
                      int in_rate, int out_rate,
                      std::vector<float>& out);

/// Drain samples still buffered inside the resampler.
void flush_resampler(SwrContext* swr, int out_rate, std::vector<float>& out);

/// Open a decoder for the best audio stream of `fmt_ctx`.
/// Returns nullptr (and sets `error`) on failure.
AVCodecContext* open_audio_decoder(AVFormatContext* fmt_ctx,
                                   int& stream_index,
                                   std::string& error);

/// Build a resampler from the decoder's layout/format to mono float.
SwrContext* make_mono_float_resampler(const AVCodecContext* dec_ctx, int out_rate);

} // namespace ffmpeg
} // namespace vd
