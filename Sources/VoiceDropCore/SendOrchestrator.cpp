#include "SendOrchestrator.hpp"

#include "Log.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>

namespace vd {

// ---------------------------------------------------------------------------
// Construction / settings
// ---------------------------------------------------------------------------

SendOrchestrator::SendOrchestrator(VoiceRecorder& recorder,
                                   VoiceConverter& converter,
                                   MessengerSession& session,
                                   StatusSink& status,
                                   Notifications& notifications,
                                   Executor& control,
                                   Executor& worker)
    : recorder_(recorder)
    , converter_(converter)
    , session_(session)
    , status_(status)
    , notifications_(notifications)
    , control_(control)
    , worker_(worker) {}

void SendOrchestrator::set_settings(const OrchestratorSettings& settings) {
    std::lock_guard<std::mutex> lock(mu_);
    settings_ = settings;
}

OrchestratorSettings SendOrchestrator::settings() const {
    std::lock_guard<std::mutex> lock(mu_);
    return settings_;
}

void SendOrchestrator::set_metering_callback(MeteringCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    meter_cb_ = std::move(cb);
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

bool SendOrchestrator::start_recording() {
    const bool   authorized = session_.auth().is_ready();
    const ChatId chat_id    = session_.target_chat();

    OrchestratorSettings    settings;
    MeteringCallback        meter_cb;
    std::vector<AttemptPtr> stale;
    uint64_t                seq = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (recording_) {
            Logger::warn("orchestrator: already recording");
            return false;
        }
        if (active_) {
            Logger::warn("orchestrator: attempt " + active_->id + " still in flight");
            return false;
        }
        if (!authorized) {
            Logger::warn("orchestrator: cannot record, session not ready");
            return false;
        }
        if (chat_id == 0) {
            Logger::warn("orchestrator: cannot record, no target chat");
            return false;
        }

        settings = settings_;
        meter_cb = meter_cb_;
        if (settings.failed_attempt_policy == FailedAttemptPolicy::discard_on_new_take) {
            stale.swap(failed_);
        }
        recording_      = true;
        recording_chat_ = chat_id;
        seq             = ++recording_seq_;
    }

    for (const auto& attempt : stale) {
        std::vector<std::string> files;
        {
            std::lock_guard<std::mutex> lock(mu_);
            files = files_of_locked(*attempt);
        }
        remove_files(files);
        Logger::info("orchestrator: attempt " + attempt->id + " discarded for new take");
        StatusEvent event;
        event.kind          = StatusKind::discarded;
        event.attempt_id    = attempt->id;
        event.attempt_count = attempt->attempt_count;
        emit(event);
    }

    bool started = recorder_.start(
        settings.recorder,
        [this, seq](const RecorderEvent& event) {
            control_.post([this, seq, event] { on_recorder_event(seq, event); });
        },
        meter_cb);

    if (!started) {
        std::lock_guard<std::mutex> lock(mu_);
        if (recording_seq_ == seq) recording_ = false;
        return false;
    }

    if (settings.haptic_feedback) cue(HapticCue::Style::recording_started);
    publish_activity();
    return true;
}

void SendOrchestrator::stop_recording() {
    if (!is_recording()) return;
    recorder_.stop();
}

void SendOrchestrator::cancel_recording() {
    if (!is_recording()) return;
    recorder_.cancel();
}

bool SendOrchestrator::is_recording() const {
    std::lock_guard<std::mutex> lock(mu_);
    return recording_;
}

void SendOrchestrator::on_recorder_event(uint64_t seq, const RecorderEvent& event) {
    const bool finished = event.kind == RecorderEvent::Kind::finished && event.take;
    bool       haptics  = false;
    AttemptPtr attempt;
    {
        // The attempt takes the single-flight slot before recording_ is
        // released, so no start_recording() can slip in between.
        std::lock_guard<std::mutex> lock(mu_);
        if (seq == recording_seq_) recording_ = false;
        haptics = settings_.haptic_feedback;
        if (finished) {
            attempt          = std::make_shared<Attempt>();
            attempt->id      = event.take->id;
            attempt->chat_id = recording_chat_;
            attempt->take    = *event.take;
            attempt->phase   = SendPhase::converting;
            active_          = attempt;
        }
    }

    switch (event.kind) {
        case RecorderEvent::Kind::cancelled:
            Logger::info("orchestrator: take cancelled");
            publish_activity();
            return;

        case RecorderEvent::Kind::failed: {
            std::string reason = event.error ? recorder_error_to_string(*event.error)
                                             : "recording failed";
            Logger::warn("orchestrator: " + reason);
            StatusEvent status;
            status.kind   = StatusKind::recording_failed;
            status.reason = reason;
            emit(status);
            publish_activity();
            return;
        }

        case RecorderEvent::Kind::finished:
            break;
    }

    if (!attempt) {
        Logger::error("orchestrator: finished event without a take");
        return;
    }

    begin_attempt(attempt);

    if (haptics) cue(HapticCue::Style::recording_stopped);
    if (attempt->take.auto_stopped) {
        notifications_.auto_stopped.publish(RecordingAutoStopped{});
    }
}

// ---------------------------------------------------------------------------
// Conversion
// ---------------------------------------------------------------------------

void SendOrchestrator::begin_attempt(const AttemptPtr& attempt) {
    const Take take = attempt->take;

    Logger::info("orchestrator: attempt " + take.id + " converting");
    StatusEvent status;
    status.kind       = StatusKind::converting;
    status.attempt_id = take.id;
    emit(status);

    worker_.post([this, attempt, take] {
        std::optional<ConvertedArtifact> artifact;
        std::string error;
        try {
            artifact = converter_.convert(take);
        } catch (const ConversionError& e) {
            error = e.what();
        } catch (const std::exception& e) {
            error = std::string("conversion failed: ") + e.what();
        }
        control_.post([this, attempt, artifact, error] {
            on_conversion_done(attempt, artifact, error);
        });
    });
}

void SendOrchestrator::on_conversion_done(const AttemptPtr& attempt,
                                          std::optional<ConvertedArtifact> artifact,
                                          const std::string& error) {
    bool withdrawn = false;
    std::vector<std::string> files;
    VoiceMessageRequest request;
    {
        std::lock_guard<std::mutex> lock(mu_);
        withdrawn = attempt->withdrawn;
        if (withdrawn) {
            attempt->artifact = artifact;
            files = files_of_locked(*attempt);
        } else if (artifact) {
            attempt->artifact     = artifact;
            attempt->payload_path = artifact->path;
            attempt->duration_sec = artifact->duration_sec;
            attempt->waveform     = artifact->waveform;
            files.push_back(attempt->take.raw_path);
        } else {
            attempt->phase        = SendPhase::conversion_failed;
            attempt->payload_path = attempt->take.raw_path;
            attempt->duration_sec = attempt->take.duration_sec;
            attempt->last_error   = error;
        }
        if (!withdrawn) request = prepare_send_locked(*attempt);
    }

    if (withdrawn) {
        remove_files(files);
        Logger::info("orchestrator: withdrawn attempt " + attempt->id + " cleaned up");
        return;
    }

    // The raw take is no longer needed once the converted file exists.
    remove_files(files);

    if (!artifact) {
        Logger::warn("orchestrator: conversion failed for " + attempt->id
                     + ", sending raw take: " + error);
        StatusEvent fallback;
        fallback.kind       = StatusKind::conversion_fallback;
        fallback.attempt_id = attempt->id;
        fallback.reason     = error;
        emit(fallback);
    }

    send(attempt, request);
}

// ---------------------------------------------------------------------------
// Sending
// ---------------------------------------------------------------------------

VoiceMessageRequest SendOrchestrator::prepare_send_locked(Attempt& attempt) {
    attempt.phase = SendPhase::sending;
    ++attempt.attempt_count;

    VoiceMessageRequest request;
    request.chat_id      = attempt.chat_id;
    request.path         = attempt.payload_path;
    request.duration_sec = attempt.duration_sec;
    request.waveform     = attempt.waveform;
    return request;
}

void SendOrchestrator::send(const AttemptPtr& attempt, const VoiceMessageRequest& request) {
    int count = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        count = attempt->attempt_count;
    }

    Logger::info("orchestrator: attempt " + attempt->id + " sending (try "
                 + std::to_string(count) + ")");
    StatusEvent status;
    status.kind          = StatusKind::sending;
    status.attempt_id    = attempt->id;
    status.attempt_count = count;
    emit(status);

    session_.send_voice_message(request, [this, attempt](Reply<MessageHandle> reply) {
        on_send_reply(attempt, reply);
    });
}

void SendOrchestrator::on_send_reply(const AttemptPtr& attempt,
                                     const Reply<MessageHandle>& reply) {
    bool withdrawn = false;
    int  count     = 0;
    std::vector<std::string> files;
    {
        std::lock_guard<std::mutex> lock(mu_);
        withdrawn = attempt->withdrawn;
        count     = attempt->attempt_count;
        if (active_ == attempt) active_.reset();

        if (withdrawn || reply.ok()) {
            if (!withdrawn) attempt->phase = SendPhase::sent;
            files = files_of_locked(*attempt);
        } else {
            attempt->phase      = SendPhase::send_failed;
            attempt->last_error = reply.error.message;
            failed_.push_back(attempt);
        }
    }

    if (withdrawn) {
        remove_files(files);
        Logger::info("orchestrator: withdrawn attempt " + attempt->id
                     + " settled (" + (reply.ok() ? "accepted" : "rejected") + ")");
        publish_activity();
        return;
    }

    StatusEvent status;
    status.attempt_id    = attempt->id;
    status.attempt_count = count;

    if (reply.ok()) {
        remove_files(files);
        Logger::info("orchestrator: attempt " + attempt->id + " sent as message "
                     + std::to_string(reply.value->message_id));
        status.kind    = StatusKind::sent;
        status.message = *reply.value;
    } else {
        Logger::warn("orchestrator: attempt " + attempt->id + " failed ("
                     + std::to_string(reply.error.code) + "): " + reply.error.message);
        status.kind      = StatusKind::send_failed;
        status.reason    = reply.error.message;
        status.retryable = true;
    }
    emit(status);
    publish_activity();
}

// ---------------------------------------------------------------------------
// Retry / discard / withdraw
// ---------------------------------------------------------------------------

bool SendOrchestrator::retry(const std::string& attempt_id) {
    const bool authorized = session_.auth().is_ready();

    AttemptPtr attempt;
    VoiceMessageRequest request;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = std::find_if(failed_.begin(), failed_.end(),
                               [&](const AttemptPtr& a) { return a->id == attempt_id; });
        if (it == failed_.end()) {
            Logger::warn("orchestrator: no failed attempt " + attempt_id);
            return false;
        }
        if (recording_ || active_) {
            Logger::warn("orchestrator: retry of " + attempt_id + " deferred, pipeline busy");
            return false;
        }
        if (!authorized) {
            Logger::warn("orchestrator: retry of " + attempt_id + " rejected, session not ready");
            return false;
        }
        attempt = *it;
        failed_.erase(it);
        active_ = attempt;
        request = prepare_send_locked(*attempt);
    }

    publish_activity();
    send(attempt, request);
    return true;
}

bool SendOrchestrator::discard(const std::string& attempt_id) {
    AttemptPtr attempt;
    std::vector<std::string> files;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = std::find_if(failed_.begin(), failed_.end(),
                               [&](const AttemptPtr& a) { return a->id == attempt_id; });
        if (it == failed_.end()) return false;
        attempt = *it;
        failed_.erase(it);
        files = files_of_locked(*attempt);
    }

    remove_files(files);
    Logger::info("orchestrator: attempt " + attempt_id + " discarded");
    StatusEvent status;
    status.kind          = StatusKind::discarded;
    status.attempt_id    = attempt_id;
    status.attempt_count = attempt->attempt_count;
    emit(status);
    return true;
}

bool SendOrchestrator::cancel_active() {
    AttemptPtr attempt;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!active_) return false;
        attempt = active_;
        attempt->withdrawn = true;
        active_.reset();
    }

    Logger::info("orchestrator: attempt " + attempt->id + " withdrawn");
    StatusEvent status;
    status.kind       = StatusKind::discarded;
    status.attempt_id = attempt->id;
    emit(status);
    publish_activity();
    return true;
}

// ---------------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------------

std::optional<AttemptSnapshot> SendOrchestrator::active_attempt() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!active_) return std::nullopt;
    return snapshot_of(*active_);
}

std::vector<AttemptSnapshot> SendOrchestrator::failed_attempts() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<AttemptSnapshot> out;
    out.reserve(failed_.size());
    for (const auto& a : failed_) out.push_back(snapshot_of(*a));
    return out;
}

AttemptSnapshot SendOrchestrator::snapshot_of(const Attempt& attempt) {
    AttemptSnapshot s;
    s.id            = attempt.id;
    s.chat_id       = attempt.chat_id;
    s.phase         = attempt.phase;
    s.attempt_count = attempt.attempt_count;
    s.has_waveform  = attempt.waveform.has_value();
    s.withdrawn     = attempt.withdrawn;
    s.payload_path  = attempt.payload_path;
    s.last_error    = attempt.last_error;
    return s;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::vector<std::string> SendOrchestrator::files_of_locked(const Attempt& attempt) {
    std::vector<std::string> files;
    if (!attempt.take.raw_path.empty()) files.push_back(attempt.take.raw_path);
    if (attempt.artifact && !attempt.artifact->path.empty()) {
        files.push_back(attempt.artifact->path);
    }
    return files;
}

void SendOrchestrator::remove_files(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        std::error_code ec;
        if (std::filesystem::remove(path, ec)) {
            Logger::debug("orchestrator: removed " + path);
        } else if (ec) {
            Logger::warn("orchestrator: cannot remove " + path + ": " + ec.message());
        }
    }
}

void SendOrchestrator::emit(const StatusEvent& event) {
    status_.publish(event);
}

void SendOrchestrator::cue(HapticCue::Style style) {
    notifications_.haptics.publish(HapticCue{style});
}

void SendOrchestrator::publish_activity() {
    bool busy = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        busy = recording_ || active_ != nullptr;
        if (busy == busy_published_) return;
        busy_published_ = busy;
    }
    notifications_.pipeline.publish(PipelineActivity{busy});
}

} // namespace vd
