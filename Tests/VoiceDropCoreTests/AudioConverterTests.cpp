#include <catch2/catch.hpp>

#include "AudioConverter.hpp"
#include "Fakes.hpp"
#include "PcmFileWriter.hpp"

#include <cmath>

using namespace vd;
using namespace vd::test;

namespace {

constexpr double kPi = 3.14159265358979323846;

/// Write `seconds` of a 300 Hz tone as a WAV take and describe it.
Take write_tone_take(const TempDir& dir, int sample_rate, double seconds, float amplitude) {
    Take take;
    take.id       = generate_uuid();
    take.raw_path = dir.file("take_" + take.id + ".wav");

    std::vector<float> samples(static_cast<size_t>(seconds * sample_rate));
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = amplitude * static_cast<float>(
            std::sin(2.0 * kPi * 300.0 * static_cast<double>(i) / sample_rate));
    }

    PcmFileWriter writer;
    REQUIRE(writer.open(take.raw_path, sample_rate));
    REQUIRE(writer.write(samples.data(), samples.size()));
    REQUIRE(writer.finalize());

    take.duration_ms  = static_cast<int64_t>(samples.size()) * 1000 / sample_rate;
    take.duration_sec = static_cast<int32_t>((take.duration_ms + 500) / 1000);
    return take;
}

ConversionError::Kind kind_of(AudioConverter& converter, const Take& take) {
    try {
        converter.convert(take);
    } catch (const ConversionError& e) {
        return e.kind();
    }
    FAIL("conversion was expected to fail");
    return ConversionError::Kind::encoder_failed;
}

} // namespace

TEST_CASE("AudioConverter produces a voice note", "[converter]") {
    TempDir dir;
    AudioConverter converter;

    SECTION("FiveSecondTakeBecomesOggWithWaveform") {
        Take take = write_tone_take(dir, 16000, 5.0, 0.5f);
        std::string before = read_file(take.raw_path);

        ConvertedArtifact a = converter.convert(take);

        REQUIRE(a.path == AudioConverter::output_path_for(take.raw_path));
        REQUIRE(exists(a.path));
        REQUIRE(a.duration_sec == 5);
        REQUIRE(a.take_id == take.id);
        REQUIRE(a.waveform.size() == 63);
        for (auto v : a.waveform) {
            REQUIRE(v <= 31);
            REQUIRE(v > 0);
        }

        // The input is left alone.
        REQUIRE(read_file(take.raw_path) == before);

        // The output decodes back to roughly the same length.
        auto pcm = converter.decode_to_pcm(a.path);
        REQUIRE(static_cast<double>(pcm.size()) / AudioConverter::kOpusSampleRate
                == Approx(5.0).margin(0.1));
    }

    SECTION("DecodeResamplesToRequestedRate") {
        Take take = write_tone_take(dir, 8000, 2.0, 0.3f);
        auto pcm = converter.decode_to_pcm(take.raw_path, 48000);
        REQUIRE(static_cast<double>(pcm.size()) == Approx(96000.0).margin(480.0));
    }

    SECTION("OutputPathSwapsExtension") {
        REQUIRE(AudioConverter::output_path_for("/tmp/a/take_1.wav") == "/tmp/a/take_1.ogg");
        REQUIRE(AudioConverter::output_path_for("/tmp/a/take_2.m4a") == "/tmp/a/take_2.ogg");
    }
}

TEST_CASE("AudioConverter failures", "[converter]") {
    TempDir dir;
    AudioConverter converter;

    SECTION("MissingFileIsUnreadable") {
        Take take;
        take.id          = "missing";
        take.raw_path    = dir.file("nope.wav");
        take.duration_ms = 1000;
        REQUIRE(kind_of(converter, take) == ConversionError::Kind::source_unreadable);
    }

    SECTION("ZeroByteFileIsUnreadable") {
        Take take;
        take.id          = "empty";
        take.raw_path    = dir.file("empty.wav");
        take.duration_ms = 1000;
        write_file(take.raw_path, "");
        REQUIRE(kind_of(converter, take) == ConversionError::Kind::source_unreadable);
        REQUIRE_FALSE(exists(AudioConverter::output_path_for(take.raw_path)));
    }

    SECTION("ZeroDurationIsRejected") {
        Take take = write_tone_take(dir, 8000, 1.0, 0.3f);
        take.duration_ms  = 0;
        take.duration_sec = 0;
        REQUIRE(kind_of(converter, take) == ConversionError::Kind::zero_duration);
        REQUIRE(exists(take.raw_path));
    }

    SECTION("GarbageIsAConversionError") {
        Take take;
        take.id          = "garbage";
        take.raw_path    = dir.file("garbage.wav");
        take.duration_ms = 1000;
        write_file(take.raw_path, std::string(64, '\x01'));
        REQUIRE_THROWS_AS(converter.convert(take), ConversionError);
        REQUIRE(exists(take.raw_path));
    }
}
