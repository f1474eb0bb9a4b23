#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace vd {

/// Writes mono float samples to a 16-bit PCM WAV file through FFmpeg's
/// wav muxer.  This is the recorder's raw take artifact.
class PcmFileWriter {
public:
    PcmFileWriter();
    ~PcmFileWriter();

    // Non-copyable.
    PcmFileWriter(const PcmFileWriter&) = delete;
    PcmFileWriter& operator=(const PcmFileWriter&) = delete;

    /// Create `path` and write the header.  Returns false on failure.
    bool open(const std::string& path, int sample_rate);

    /// Append samples.  Returns false on a write error.
    bool write(const float* samples, size_t count);

    /// Flush, write the trailer and close.  Returns false on failure.
    bool finalize();

    /// Close without finalizing and delete the file.
    void abort();

    bool is_open() const { return fmt_ctx_ != nullptr; }
    int64_t frames_written() const { return frames_written_; }
    const std::string& path() const { return path_; }

private:
    bool encode(void* frame);   // AVFrame*, nullptr flushes
    void release();

    std::string path_;
    int         sample_rate_    = 0;
    int64_t     frames_written_ = 0;

    void* fmt_ctx_   = nullptr;   // AVFormatContext*
    void* codec_ctx_ = nullptr;   // AVCodecContext*  (pcm_s16le)
    void* swr_ctx_   = nullptr;   // SwrContext*      (flt -> s16)
    void* stream_    = nullptr;   // AVStream*
};

} // namespace vd
