#pragma once

#include "Types.hpp"

#include <cstdint>
#include <optional>

namespace vd {

/// Longest take the detector will count, in seconds.  Longer durations
/// are truncated to it.
constexpr double kMaxTakeSec = 3600.0;

struct SilenceSettings {
    bool   enabled          = true;
    float  threshold        = 0.0056f;  // normalized RMS level
    double silence_duration = 2.0;      // seconds below threshold before auto-stop
    double max_duration     = 60.0;     // hard ceiling, seconds
};

/// Decides when a take ends.  Fed one metering window at a time; counts time
/// in sample frames so the result does not depend on wall-clock jitter.
///
/// The below-threshold counter resets on every window at or above the
/// threshold.  Silence is checked before the ceiling, so a take whose silence
/// and ceiling land on the same window is reported as auto-stopped.
class SilenceDetector {
public:
    SilenceDetector(const SilenceSettings& settings, int sample_rate);

    /// Account for `frame_count` frames whose level was `level`.
    /// Returns the stop reason once the take should end.
    std::optional<StopReason> observe(float level, int64_t frame_count);

    /// Frames that may still be captured before the ceiling.
    int64_t frames_until_ceiling() const;

    void reset();

    int64_t elapsed_frames() const { return elapsed_frames_; }
    int64_t silent_frames() const { return silent_frames_; }
    int sample_rate() const { return sample_rate_; }

private:
    SilenceSettings settings_;
    int             sample_rate_;
    int64_t         silence_limit_frames_;
    int64_t         max_frames_;
    int64_t         elapsed_frames_ = 0;
    int64_t         silent_frames_  = 0;
};

} // namespace vd
