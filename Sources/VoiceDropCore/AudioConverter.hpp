#pragma once

#include "Types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace vd {

/// Raised when a take cannot be converted.  Recoverable: the raw take file
/// is untouched and can be sent as is.
class ConversionError : public std::runtime_error {
public:
    enum class Kind {
        source_unreadable,
        zero_duration,
        encoder_failed
    };

    ConversionError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/// Turns a raw take into the transport codec plus a waveform.
class VoiceConverter {
public:
    virtual ~VoiceConverter() = default;

    /// Writes exactly one new file and never touches the input.
    /// Throws ConversionError.
    virtual ConvertedArtifact convert(const Take& take) = 0;
};

/// Converts takes to OGG/Opus with FFmpeg's libavcodec / libswresample.
///
/// The take is decoded once to 48 kHz mono float PCM; those samples feed both
/// the Opus encoder and the waveform.  Output goes next to the input with an
/// `.ogg` extension.
class AudioConverter : public VoiceConverter {
public:
    static constexpr int kOpusSampleRate = 48000;
    static constexpr int kOpusBitRate    = 32000;

    AudioConverter();
    ~AudioConverter() override;

    // Non-copyable.
    AudioConverter(const AudioConverter&) = delete;
    AudioConverter& operator=(const AudioConverter&) = delete;

    ConvertedArtifact convert(const Take& take) override;

    /// Decode any FFmpeg-readable audio file to mono float32 PCM at the given
    /// sample rate.  Throws ConversionError(source_unreadable) on failure.
    std::vector<float> decode_to_pcm(const std::string& input_path,
                                     int target_sample_rate = kOpusSampleRate) const;

    /// Encode mono float32 PCM at kOpusSampleRate into an OGG/Opus file.
    /// Throws ConversionError(encoder_failed); a partial file is removed.
    void encode_opus(const std::vector<float>& pcm,
                     const std::string& output_path) const;

    /// Path the converted artifact of `raw_path` is written to.
    static std::string output_path_for(const std::string& raw_path);
};

} // namespace vd
