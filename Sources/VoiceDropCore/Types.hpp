#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vd {

// ---------------------------------------------------------------------------
// Backend identifiers
// ---------------------------------------------------------------------------

using ChatId    = int64_t;
using MessageId = int64_t;
using FileId    = int32_t;

/// Backend reference to a message accepted for delivery.
struct MessageHandle {
    ChatId    chat_id    = 0;
    MessageId message_id = 0;
};

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

/// Why a take stopped recording.
enum class StopReason {
    manual,
    silence,
    max_duration,
    source_ended
};

inline const char* stop_reason_to_string(StopReason r) {
    switch (r) {
        case StopReason::manual:       return "manual";
        case StopReason::silence:      return "silence";
        case StopReason::max_duration: return "max_duration";
        case StopReason::source_ended: return "source_ended";
    }
    return "unknown";
}

enum class RecorderError {
    device_unavailable,
    output_unavailable
};

inline const char* recorder_error_to_string(RecorderError e) {
    switch (e) {
        case RecorderError::device_unavailable: return "capture device unavailable";
        case RecorderError::output_unavailable: return "cannot create recording file";
    }
    return "unknown";
}

/// Phase of a tracked send attempt.
enum class SendPhase {
    idle,
    converting,
    conversion_failed,
    sending,
    sent,
    send_failed
};

inline const char* send_phase_to_string(SendPhase p) {
    switch (p) {
        case SendPhase::idle:              return "idle";
        case SendPhase::converting:        return "converting";
        case SendPhase::conversion_failed: return "conversion_failed";
        case SendPhase::sending:           return "sending";
        case SendPhase::sent:              return "sent";
        case SendPhase::send_failed:       return "send_failed";
    }
    return "unknown";
}

/// Kind of a user-facing status event emitted by the orchestrator.
enum class StatusKind {
    converting,
    conversion_fallback,
    sending,
    sent,
    send_failed,
    discarded,
    recording_failed
};

inline const char* status_kind_to_string(StatusKind k) {
    switch (k) {
        case StatusKind::converting:          return "converting";
        case StatusKind::conversion_fallback: return "conversion_fallback";
        case StatusKind::sending:             return "sending";
        case StatusKind::sent:                return "sent";
        case StatusKind::send_failed:         return "send_failed";
        case StatusKind::discarded:           return "discarded";
        case StatusKind::recording_failed:    return "recording_failed";
    }
    return "unknown";
}

/// What happens to a failed attempt awaiting retry when a new take starts.
enum class FailedAttemptPolicy {
    keep_for_retry,
    discard_on_new_take
};

inline const char* failed_attempt_policy_to_string(FailedAttemptPolicy p) {
    switch (p) {
        case FailedAttemptPolicy::keep_for_retry:      return "keep_for_retry";
        case FailedAttemptPolicy::discard_on_new_take: return "discard_on_new_take";
    }
    return "keep_for_retry";
}

inline FailedAttemptPolicy failed_attempt_policy_from_string(const std::string& s) {
    if (s == "discard_on_new_take") return FailedAttemptPolicy::discard_on_new_take;
    return FailedAttemptPolicy::keep_for_retry;
}

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

/// One user-initiated recording attempt.
struct Take {
    std::string id;                 // UUID as string
    std::string raw_path;           // WAV file written by the recorder
    int64_t     duration_ms  = 0;
    int32_t     duration_sec = 0;   // rounded to the nearest second
    StopReason  stop_reason  = StopReason::manual;
    bool        auto_stopped = false;
    int64_t     created_at   = 0;   // Unix timestamp (seconds)
};

/// Codec-ready payload derived from a take.
struct ConvertedArtifact {
    std::string          path;          // OGG/Opus file
    int32_t              duration_sec = 0;
    std::vector<uint8_t> waveform;      // kWaveformBuckets values in [0, kWaveformMax]
    std::string          take_id;
};

/// Terminal result of one recorder start/stop cycle.
struct RecorderEvent {
    enum class Kind { finished, cancelled, failed };

    Kind                         kind = Kind::cancelled;
    std::optional<Take>          take;      // set for finished
    std::optional<RecorderError> error;     // set for failed
};

/// Read-only view of a send attempt, handed out to consumers.
struct AttemptSnapshot {
    std::string id;
    ChatId      chat_id       = 0;
    SendPhase   phase         = SendPhase::idle;
    int         attempt_count = 0;
    bool        has_waveform  = false;
    bool        withdrawn     = false;
    std::string payload_path;
    std::string last_error;
};

/// Transient status pushed to the UI.
struct StatusEvent {
    StatusKind                   kind = StatusKind::converting;
    std::string                  attempt_id;
    std::string                  reason;
    std::optional<MessageHandle> message;
    bool                         retryable     = false;
    int                          attempt_count = 0;
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired during recording with current audio level 0.0 – 1.0.
using MeteringCallback = std::function<void(float)>;

/// Fired exactly once per recorder start/stop cycle.
using RecorderCallback = std::function<void(const RecorderEvent&)>;

} // namespace vd
