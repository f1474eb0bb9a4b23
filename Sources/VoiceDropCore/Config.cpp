#include "Config.hpp"

#include "PreferencesStore.hpp"
#include "SilenceDetector.hpp"

#include <algorithm>
#include <cmath>
#include <locale>
#include <map>
#include <sstream>

namespace vd {

namespace {

constexpr double kMaxSilenceDurationSec = 60.0;

// Non-finite values fall back to the default before clamping.
double read_seconds(const PreferencesStore& store, const char* key, double fallback,
                    double lo, double hi) {
    double v = store.get_double(key, fallback);
    if (!std::isfinite(v)) v = fallback;
    return std::clamp(v, lo, hi);
}

std::string format_double(double v) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << v;
    return out.str();
}

} // namespace

Config load_config(const PreferencesStore& store) {
    Config defaults;
    Config c;

    c.auto_play         = store.get_bool(pref::kAutoPlay, defaults.auto_play);
    c.haptic_feedback   = store.get_bool(pref::kHapticFeedback, defaults.haptic_feedback);
    c.silence_detection = store.get_bool(pref::kSilenceDetection, defaults.silence_detection);

    c.silence_duration_sec = read_seconds(store, pref::kSilenceDurationSec,
        defaults.silence_duration_sec, 0.1, kMaxSilenceDurationSec);
    c.silence_threshold = static_cast<float>(std::clamp(store.get_double(
        pref::kSilenceThreshold, defaults.silence_threshold), 0.0, 1.0));
    c.max_recording_sec = read_seconds(store, pref::kMaxRecordingSec,
        defaults.max_recording_sec, 1.0, kMaxTakeSec);

    c.target_chat_id = store.get_int64(pref::kTargetChatId, defaults.target_chat_id);

    c.failed_attempt_policy = failed_attempt_policy_from_string(store.get_string(
        pref::kFailedAttemptPolicy,
        failed_attempt_policy_to_string(defaults.failed_attempt_policy)));

    c.capture_format = store.get_string(pref::kCaptureFormat, defaults.capture_format);
    c.capture_device = store.get_string(pref::kCaptureDevice, defaults.capture_device);

    c.sample_interval_ms = static_cast<int>(std::clamp<int64_t>(store.get_int64(
        pref::kSampleIntervalMs, defaults.sample_interval_ms), 10, 500));
    c.temp_max_age_sec = std::max<int64_t>(0, store.get_int64(
        pref::kTempMaxAgeSec, defaults.temp_max_age_sec));

    return c;
}

bool save_config(PreferencesStore& store, const Config& c) {
    std::map<std::string, std::string> values = {
        {pref::kAutoPlay,            c.auto_play ? "true" : "false"},
        {pref::kHapticFeedback,      c.haptic_feedback ? "true" : "false"},
        {pref::kSilenceDetection,    c.silence_detection ? "true" : "false"},
        {pref::kSilenceDurationSec,  format_double(c.silence_duration_sec)},
        {pref::kSilenceThreshold,    format_double(c.silence_threshold)},
        {pref::kMaxRecordingSec,     format_double(c.max_recording_sec)},
        {pref::kTargetChatId,        std::to_string(c.target_chat_id)},
        {pref::kFailedAttemptPolicy, failed_attempt_policy_to_string(c.failed_attempt_policy)},
        {pref::kCaptureFormat,       c.capture_format},
        {pref::kCaptureDevice,       c.capture_device},
        {pref::kSampleIntervalMs,    std::to_string(c.sample_interval_ms)},
        {pref::kTempMaxAgeSec,       std::to_string(c.temp_max_age_sec)},
    };
    return store.set_many(values);
}

} // namespace vd
