#include <catch2/catch.hpp>

#include "SilenceDetector.hpp"

#include <limits>

using namespace vd;

namespace {

constexpr int     kRate   = 1000;   // 1 frame per millisecond keeps the math readable
constexpr int64_t kWindow = 50;

/// Feed `ms` milliseconds at `level`.  Returns the first stop reason.
std::optional<StopReason> feed(SilenceDetector& d, int64_t ms, float level) {
    for (int64_t t = 0; t < ms; t += kWindow) {
        auto r = d.observe(level, kWindow);
        if (r) return r;
    }
    return std::nullopt;
}

} // namespace

TEST_CASE("Silence detection", "[silence]") {
    SilenceSettings settings;
    settings.threshold        = 0.0056f;
    settings.silence_duration = 2.0;
    settings.max_duration     = 60.0;

    SECTION("StopsAfterSustainedSilence") {
        // Speech for 6 s, then silence: auto-stop at second 8.
        SilenceDetector d(settings, kRate);
        REQUIRE_FALSE(feed(d, 6000, 0.1f));
        auto r = feed(d, 4000, 0.001f);
        REQUIRE(r);
        REQUIRE(*r == StopReason::silence);
        REQUIRE(d.elapsed_frames() == 8000);
    }

    SECTION("LoudWindowResetsTheCounter") {
        SilenceDetector d(settings, kRate);
        REQUIRE_FALSE(feed(d, 1950, 0.0f));
        REQUIRE_FALSE(d.observe(0.5f, kWindow));
        REQUIRE(d.silent_frames() == 0);
        REQUIRE_FALSE(feed(d, 1950, 0.0f));
        REQUIRE(d.observe(0.0f, kWindow) == StopReason::silence);
    }

    SECTION("LevelAtThresholdIsNotSilence") {
        SilenceDetector d(settings, kRate);
        REQUIRE_FALSE(feed(d, 5000, settings.threshold));
    }

    SECTION("DisabledDetectionOnlyHitsTheCeiling") {
        settings.enabled      = false;
        settings.max_duration = 5.0;
        SilenceDetector d(settings, kRate);
        auto r = feed(d, 10000, 0.0f);
        REQUIRE(r);
        REQUIRE(*r == StopReason::max_duration);
        REQUIRE(d.elapsed_frames() == 5000);
    }
}

TEST_CASE("Max duration ceiling", "[silence]") {
    SilenceSettings settings;
    settings.max_duration = 3.0;

    SECTION("ContinuousSpeechStopsExactlyAtCeiling") {
        SilenceDetector d(settings, kRate);
        auto r = feed(d, 10000, 0.3f);
        REQUIRE(r);
        REQUIRE(*r == StopReason::max_duration);
        REQUIRE(d.elapsed_frames() == 3000);
        REQUIRE(d.frames_until_ceiling() == 0);
    }

    SECTION("FramesUntilCeilingCountsDown") {
        SilenceDetector d(settings, kRate);
        REQUIRE(d.frames_until_ceiling() == 3000);
        d.observe(0.3f, 1200);
        REQUIRE(d.frames_until_ceiling() == 1800);
        d.reset();
        REQUIRE(d.frames_until_ceiling() == 3000);
        REQUIRE(d.silent_frames() == 0);
    }

    SECTION("SilenceWinsWhenBothLandOnTheSameWindow") {
        settings.silence_duration = 3.0;
        SilenceDetector d(settings, kRate);
        REQUIRE(feed(d, 3000, 0.0f) == StopReason::silence);
    }

    SECTION("HugeDurationsAreTruncated") {
        settings.max_duration     = 1e300;
        settings.silence_duration = 1e300;
        SilenceDetector d(settings, 48000);
        REQUIRE(d.frames_until_ceiling() == static_cast<int64_t>(kMaxTakeSec) * 48000);
        REQUIRE_FALSE(d.observe(0.0f, 48000));
    }

    SECTION("NonFiniteCeilingStopsAtOnce") {
        settings.max_duration = std::numeric_limits<double>::quiet_NaN();
        SilenceDetector d(settings, kRate);
        REQUIRE(d.frames_until_ceiling() == 0);
    }
}
