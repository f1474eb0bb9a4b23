#include "SilenceDetector.hpp"

#include <algorithm>
#include <cmath>

namespace vd {

namespace {

// NaN and negative durations count as zero.
int64_t to_frames(double seconds, int sample_rate) {
    if (!(seconds > 0.0)) return 0;
    return static_cast<int64_t>(std::llround(std::min(seconds, kMaxTakeSec) * sample_rate));
}

} // namespace

SilenceDetector::SilenceDetector(const SilenceSettings& settings, int sample_rate)
    : settings_(settings),
      sample_rate_(sample_rate > 0 ? sample_rate : 1),
      silence_limit_frames_(to_frames(settings.silence_duration, sample_rate_)),
      max_frames_(to_frames(settings.max_duration, sample_rate_)) {}

std::optional<StopReason> SilenceDetector::observe(float level, int64_t frame_count) {
    if (frame_count <= 0) return std::nullopt;

    elapsed_frames_ += frame_count;

    if (level < settings_.threshold) {
        silent_frames_ += frame_count;
    } else {
        silent_frames_ = 0;
    }

    if (settings_.enabled && silent_frames_ >= silence_limit_frames_) {
        return StopReason::silence;
    }
    if (elapsed_frames_ >= max_frames_) {
        return StopReason::max_duration;
    }
    return std::nullopt;
}

int64_t SilenceDetector::frames_until_ceiling() const {
    return std::max<int64_t>(0, max_frames_ - elapsed_frames_);
}

void SilenceDetector::reset() {
    elapsed_frames_ = 0;
    silent_frames_  = 0;
}

} // namespace vd
