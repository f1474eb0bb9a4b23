#pragma once

#include <string>
#include <vector>

namespace vd {

/// A stream of mono float samples from a microphone (or a stand-in).
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    /// Acquire the device.  Returns false if it cannot be acquired.
    virtual bool open() = 0;

    /// Sample rate of the samples produced by read().
    virtual int sample_rate() const = 0;

    /// Block until the next block of samples is available and append it to
    /// `out`.  Returns false when the stream ended or the device was lost.
    virtual bool read(std::vector<float>& out) = 0;

    /// Release the device.  Safe to call when not open.
    virtual void close() = 0;
};

/// Captures from a libavdevice input (e.g. "pulse"/"default",
/// "alsa"/"hw:0", "avfoundation"/":default") and resamples to mono float.
class FfmpegCaptureSource : public CaptureSource {
public:
    FfmpegCaptureSource(std::string input_format,
                        std::string device,
                        int sample_rate = 48000);
    ~FfmpegCaptureSource() override;

    // Non-copyable.
    FfmpegCaptureSource(const FfmpegCaptureSource&) = delete;
    FfmpegCaptureSource& operator=(const FfmpegCaptureSource&) = delete;

    bool open() override;
    int sample_rate() const override { return sample_rate_; }
    bool read(std::vector<float>& out) override;
    void close() override;

private:
    std::string input_format_;
    std::string device_;
    int         sample_rate_;
    int         stream_index_ = -1;

    // FFmpeg opaque handles, typed as void* to keep FFmpeg headers out of
    // the public interface.
    void* fmt_ctx_ = nullptr;   // AVFormatContext*
    void* dec_ctx_ = nullptr;   // AVCodecContext*
    void* swr_ctx_ = nullptr;   // SwrContext*
    void* packet_  = nullptr;   // AVPacket*
    void* frame_   = nullptr;   // AVFrame*
};

} // namespace vd
