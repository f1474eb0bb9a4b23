#pragma once

#include "AudioConverter.hpp"
#include "AudioRecorder.hpp"
#include "EventChannel.hpp"
#include "Executor.hpp"
#include "MessengerSession.hpp"
#include "StatusNotifier.hpp"
#include "Types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vd {

struct OrchestratorSettings {
    RecorderSettings    recorder;
    bool                haptic_feedback       = true;
    FailedAttemptPolicy failed_attempt_policy = FailedAttemptPolicy::keep_for_retry;
};

/// Drives a take from recording to a single outcome: sent, or failed and
/// kept for an explicit retry or discard.
///
/// Per attempt the status sink sees, in order:
///     converting, [conversion_fallback], sending, sent | send_failed
/// and every retry adds sending, sent | send_failed.
///
/// Only one attempt is in flight at a time.  start_recording() is rejected
/// while recording or while an attempt is converting or sending; attempts
/// in send_failed do not block it.  Temporary files of an attempt are
/// removed once it is sent, discarded, or withdrawn.
///
/// The pipeline channel reports busy while recording or while an attempt
/// is converting or sending, and idle otherwise.
///
/// Recorder events, conversion results and send replies are handled on the
/// control executor; conversion runs on the worker executor.  The internal
/// mutex is never held while calling the recorder, the converter, the
/// session or the status sink.
class SendOrchestrator {
public:
    SendOrchestrator(VoiceRecorder& recorder,
                     VoiceConverter& converter,
                     MessengerSession& session,
                     StatusSink& status,
                     Notifications& notifications,
                     Executor& control,
                     Executor& worker);

    // Non-copyable.
    SendOrchestrator(const SendOrchestrator&) = delete;
    SendOrchestrator& operator=(const SendOrchestrator&) = delete;

    void set_settings(const OrchestratorSettings& settings);
    OrchestratorSettings settings() const;

    void set_metering_callback(MeteringCallback cb);

    // ---- Recording ----

    /// Begin a take for the session's target chat.  Returns false when
    /// rejected (busy, not authorized, no target) or the device failed.
    bool start_recording();

    /// User release.  The take continues into conversion and sending.
    void stop_recording();

    /// Drop the take in progress.  No attempt is created.
    void cancel_recording();

    bool is_recording() const;

    // ---- Attempts ----

    /// Send a failed attempt again with the same payload.  Returns false if
    /// `attempt_id` is not awaiting retry or another attempt is busy.
    bool retry(const std::string& attempt_id);

    /// Drop a failed attempt and its files.
    bool discard(const std::string& attempt_id);

    /// Withdraw the converting or sending attempt.  Its result is ignored
    /// when it arrives and its files are removed then.
    bool cancel_active();

    std::optional<AttemptSnapshot> active_attempt() const;

    /// Attempts awaiting retry or discard, oldest first.
    std::vector<AttemptSnapshot> failed_attempts() const;

private:
    struct Attempt {
        std::string  id;                // = take id
        ChatId       chat_id = 0;
        Take         take;
        std::optional<ConvertedArtifact> artifact;

        // Payload, fixed once conversion settles.
        std::string  payload_path;
        int32_t      duration_sec = 0;
        std::optional<std::vector<uint8_t>> waveform;

        int          attempt_count = 0;
        SendPhase    phase         = SendPhase::idle;
        bool         withdrawn     = false;
        std::string  last_error;
    };
    using AttemptPtr = std::shared_ptr<Attempt>;

    void on_recorder_event(uint64_t seq, const RecorderEvent& event);
    void begin_attempt(const AttemptPtr& attempt);
    void on_conversion_done(const AttemptPtr& attempt,
                            std::optional<ConvertedArtifact> artifact,
                            const std::string& error);
    void on_send_reply(const AttemptPtr& attempt, const Reply<MessageHandle>& reply);

    /// Mark the attempt sending and build its request.  Caller holds mu_.
    VoiceMessageRequest prepare_send_locked(Attempt& attempt);

    /// Files owned by the attempt.  Caller holds mu_.
    static std::vector<std::string> files_of_locked(const Attempt& attempt);

    static AttemptSnapshot snapshot_of(const Attempt& attempt);

    void send(const AttemptPtr& attempt, const VoiceMessageRequest& request);
    void remove_files(const std::vector<std::string>& paths);
    void emit(const StatusEvent& event);
    void cue(HapticCue::Style style);

    /// Publish PipelineActivity if busy-ness changed since the last call.
    void publish_activity();

    VoiceRecorder&    recorder_;
    VoiceConverter&   converter_;
    MessengerSession& session_;
    StatusSink&       status_;
    Notifications&    notifications_;
    Executor&         control_;
    Executor&         worker_;

    mutable std::mutex      mu_;
    OrchestratorSettings    settings_;
    MeteringCallback        meter_cb_;
    bool                    recording_      = false;
    uint64_t                recording_seq_  = 0;
    ChatId                  recording_chat_ = 0;
    AttemptPtr              active_;
    std::vector<AttemptPtr> failed_;
    bool                    busy_published_ = false;
};

} // namespace vd
