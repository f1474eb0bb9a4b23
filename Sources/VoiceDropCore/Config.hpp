#pragma once

#include "Types.hpp"

#include <string>

namespace vd {

class PreferencesStore;

/// User preferences read at startup.  Defaults apply to every key that is
/// missing from the store.
struct Config {
    bool   auto_play            = true;
    bool   haptic_feedback      = true;
    bool   silence_detection    = true;
    double silence_duration_sec = 2.0;
    float  silence_threshold    = 0.0056f;  // normalized RMS, about -45 dBFS
    double max_recording_sec    = 60.0;
    ChatId target_chat_id       = 0;        // 0 = no target selected

    FailedAttemptPolicy failed_attempt_policy = FailedAttemptPolicy::keep_for_retry;

    // Capture device, as understood by libavdevice.
    std::string capture_format = "pulse";
    std::string capture_device = "default";

    int     sample_interval_ms = 50;
    int64_t temp_max_age_sec   = 3600;
};

// Preference keys.
namespace pref {
constexpr const char* kAutoPlay            = "auto_play";
constexpr const char* kHapticFeedback      = "haptic_feedback";
constexpr const char* kSilenceDetection    = "silence_detection";
constexpr const char* kSilenceDurationSec  = "silence_duration_sec";
constexpr const char* kSilenceThreshold    = "silence_threshold";
constexpr const char* kMaxRecordingSec     = "max_recording_sec";
constexpr const char* kTargetChatId        = "target_chat_id";
constexpr const char* kFailedAttemptPolicy = "failed_attempt_policy";
constexpr const char* kCaptureFormat       = "capture_format";
constexpr const char* kCaptureDevice       = "capture_device";
constexpr const char* kSampleIntervalMs    = "sample_interval_ms";
constexpr const char* kTempMaxAgeSec       = "temp_max_age_sec";
} // namespace pref

/// Build a Config from the store.  Out-of-range numbers are clamped.
Config load_config(const PreferencesStore& store);

/// Write every field of `config` in one transaction.
bool save_config(PreferencesStore& store, const Config& config);

} // namespace vd
