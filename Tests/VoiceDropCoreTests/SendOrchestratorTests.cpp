#include <catch2/catch.hpp>

#include "Fakes.hpp"
#include "SendOrchestrator.hpp"

using namespace vd;
using namespace vd::test;

namespace {

constexpr ChatId kTarget = 100;

using K = StatusKind;

struct Pipeline {
    TempDir             dir;
    FakeRecorder        recorder;
    FakeConverter       converter;
    FakeTransport       transport;
    ManualExecutor      control;
    ManualExecutor      worker;
    Notifications       notes;
    RecordingStatusSink status;
    MessengerSession    session{transport, control, notes};
    SendOrchestrator    orchestrator{recorder, converter, session, status, notes, control, worker};

    int auto_stops = 0;
    std::vector<HapticCue::Style> haptics;

    explicit Pipeline(FailedAttemptPolicy policy = FailedAttemptPolicy::keep_for_retry,
                      bool haptic_feedback = true) {
        notes.auto_stopped.subscribe([this](const RecordingAutoStopped&) { ++auto_stops; });
        notes.haptics.subscribe([this](const HapticCue& c) { haptics.push_back(c.style); });

        session.set_target_chat(kTarget);
        session.start(TdlibParameters{});
        transport.authorize(AuthorizationState::ready);
        pump();

        OrchestratorSettings settings;
        settings.recorder.output_dir   = dir.str();
        settings.haptic_feedback       = haptic_feedback;
        settings.failed_attempt_policy = policy;
        orchestrator.set_settings(settings);
    }

    /// Run both executors until nothing is left.
    void pump() {
        while (control.pending() > 0 || worker.pending() > 0) {
            worker.run_all();
            control.run_all();
        }
    }

    /// Record, finish and convert a take; stops once the send is issued.
    Take record(int64_t duration_ms = 5000, StopReason reason = StopReason::manual) {
        REQUIRE(orchestrator.start_recording());
        orchestrator.stop_recording();
        Take take = recorder.finish(dir.str(), duration_ms, reason);
        pump();
        return take;
    }
};

} // namespace

TEST_CASE("Send orchestrator happy path", "[orchestrator]") {
    Pipeline p;

    SECTION("ConvertSendAndCleanUp") {
        Take take = p.record(5000);

        REQUIRE(p.converter.calls == 1);
        REQUIRE(p.transport.sends.size() == 1);
        const auto& req = p.transport.sends[0].request;
        REQUIRE(req.chat_id == kTarget);
        REQUIRE(req.path == AudioConverter::output_path_for(take.raw_path));
        REQUIRE(req.duration_sec == 5);
        REQUIRE(req.waveform);
        REQUIRE(req.waveform->size() == 63);

        // Raw take is gone once conversion succeeded.
        REQUIRE_FALSE(exists(take.raw_path));
        REQUIRE(exists(req.path));

        auto active = p.orchestrator.active_attempt();
        REQUIRE(active);
        REQUIRE(active->phase == SendPhase::sending);
        REQUIRE(active->has_waveform);

        p.transport.accept_send(0, 555);
        p.pump();

        REQUIRE(p.status.kinds() == std::vector<K>{K::converting, K::sending, K::sent});
        const StatusEvent& sent = p.status.events.back();
        REQUIRE(sent.attempt_id == take.id);
        REQUIRE(sent.message);
        REQUIRE(sent.message->chat_id == kTarget);
        REQUIRE(sent.message->message_id == 555);

        REQUIRE_FALSE(exists(req.path));
        REQUIRE_FALSE(p.orchestrator.active_attempt());
        REQUIRE(p.orchestrator.failed_attempts().empty());
    }

    SECTION("HapticsAndAutoStopNotification") {
        p.record(8000, StopReason::silence);
        REQUIRE(p.auto_stops == 1);
        REQUIRE(p.haptics == std::vector<HapticCue::Style>{
            HapticCue::Style::recording_started, HapticCue::Style::recording_stopped});
    }

    SECTION("ManualStopDoesNotAnnounceAutoStop") {
        p.record(3000, StopReason::manual);
        REQUIRE(p.auto_stops == 0);
        REQUIRE(p.recorder.stop_calls == 1);
    }

    SECTION("PipelineActivityCoversRecordingThroughSend") {
        std::vector<bool> busy;
        p.notes.pipeline.subscribe([&](const PipelineActivity& a) { busy.push_back(a.busy); });

        p.record();
        REQUIRE(busy == std::vector<bool>{true});

        p.transport.accept_send(0, 1);
        p.pump();
        REQUIRE(busy == std::vector<bool>{true, false});
    }

    SECTION("RecorderReceivesConfiguredOutputDir") {
        p.record();
        REQUIRE(p.recorder.last_settings.output_dir == p.dir.str());
    }
}

TEST_CASE("Send orchestrator conversion fallback", "[orchestrator]") {
    Pipeline p;
    p.converter.fail = true;

    Take take = p.record(4000);

    REQUIRE(p.status.kinds() == std::vector<K>{K::converting, K::conversion_fallback, K::sending});
    REQUIRE(p.status.events[1].reason == "encoder exploded");

    REQUIRE(p.transport.sends.size() == 1);
    const auto& req = p.transport.sends[0].request;
    REQUIRE(req.path == take.raw_path);
    REQUIRE_FALSE(req.waveform);
    REQUIRE(req.duration_sec == 4);
    REQUIRE(exists(take.raw_path));

    SECTION("FallbackPayloadIsCleanedUpWhenSent") {
        p.transport.accept_send(0, 9);
        p.pump();
        REQUIRE(p.status.kinds().back() == K::sent);
        REQUIRE_FALSE(exists(take.raw_path));
    }
}

TEST_CASE("Send orchestrator failure and retry", "[orchestrator]") {
    Pipeline p;
    Take take = p.record(5000);
    std::string payload = AudioConverter::output_path_for(take.raw_path);

    p.transport.reject_send(0, 500, "network down");
    p.pump();

    REQUIRE(p.status.kinds() == std::vector<K>{K::converting, K::sending, K::send_failed});
    const StatusEvent& failed = p.status.events.back();
    REQUIRE(failed.retryable);
    REQUIRE(failed.reason == "network down");
    REQUIRE(failed.attempt_count == 1);

    REQUIRE(exists(payload));
    REQUIRE_FALSE(p.orchestrator.active_attempt());
    auto pending = p.orchestrator.failed_attempts();
    REQUIRE(pending.size() == 1);
    REQUIRE(pending[0].id == take.id);
    REQUIRE(pending[0].phase == SendPhase::send_failed);
    REQUIRE(pending[0].last_error == "network down");

    SECTION("RetrySendsTheSamePayload") {
        p.status.clear();
        REQUIRE(p.orchestrator.retry(take.id));
        REQUIRE_FALSE(p.orchestrator.retry(take.id));   // already sending
        p.pump();

        REQUIRE(p.transport.sends.size() == 2);
        REQUIRE(p.transport.sends[1].request.path == p.transport.sends[0].request.path);
        REQUIRE(p.transport.sends[1].payload == p.transport.sends[0].payload);
        REQUIRE(p.transport.sends[1].request.waveform == p.transport.sends[0].request.waveform);
        REQUIRE(p.converter.calls == 1);

        p.transport.accept_send(1, 777);
        p.pump();

        REQUIRE(p.status.kinds() == std::vector<K>{K::sending, K::sent});
        REQUIRE(p.status.events.back().attempt_count == 2);
        REQUIRE_FALSE(exists(payload));
        REQUIRE(p.orchestrator.failed_attempts().empty());
    }

    SECTION("RepeatedFailuresStayRetryable") {
        REQUIRE(p.orchestrator.retry(take.id));
        p.transport.reject_send(1, 500, "still down");
        p.pump();
        REQUIRE(p.status.kinds().back() == K::send_failed);
        REQUIRE(p.status.events.back().attempt_count == 2);
        REQUIRE(p.orchestrator.failed_attempts().size() == 1);
        REQUIRE(exists(payload));
    }

    SECTION("DiscardPurgesFiles") {
        REQUIRE(p.orchestrator.discard(take.id));
        REQUIRE(p.status.kinds().back() == K::discarded);
        REQUIRE_FALSE(exists(payload));
        REQUIRE(p.orchestrator.failed_attempts().empty());
        REQUIRE_FALSE(p.orchestrator.retry(take.id));
        REQUIRE_FALSE(p.orchestrator.discard(take.id));
    }

    SECTION("UnknownAttemptIsRejected") {
        REQUIRE_FALSE(p.orchestrator.retry("nope"));
        REQUIRE_FALSE(p.orchestrator.discard("nope"));
    }

    SECTION("FailedAttemptDoesNotBlockRecording") {
        REQUIRE(p.orchestrator.start_recording());
        REQUIRE(p.orchestrator.failed_attempts().size() == 1);

        // No retry while the pipeline is busy.
        REQUIRE_FALSE(p.orchestrator.retry(take.id));
    }
}

TEST_CASE("Send orchestrator discard_on_new_take policy", "[orchestrator]") {
    Pipeline p(FailedAttemptPolicy::discard_on_new_take);
    Take take = p.record(5000);
    std::string payload = AudioConverter::output_path_for(take.raw_path);
    p.transport.reject_send(0, 500, "network down");
    p.pump();

    REQUIRE(p.orchestrator.start_recording());
    REQUIRE(p.status.kinds().back() == K::discarded);
    REQUIRE(p.status.events.back().attempt_id == take.id);
    REQUIRE(p.orchestrator.failed_attempts().empty());
    REQUIRE_FALSE(exists(payload));
}

TEST_CASE("Send orchestrator single flight", "[orchestrator]") {
    Pipeline p;

    SECTION("RejectedWhileRecording") {
        REQUIRE(p.orchestrator.start_recording());
        REQUIRE(p.orchestrator.is_recording());
        REQUIRE_FALSE(p.orchestrator.start_recording());
        REQUIRE(p.recorder.start_calls == 1);
    }

    SECTION("RejectedWhileConverting") {
        REQUIRE(p.orchestrator.start_recording());
        p.recorder.finish(p.dir.str(), 2000);
        p.control.run_all();   // conversion queued, not run

        REQUIRE(p.orchestrator.active_attempt()->phase == SendPhase::converting);
        REQUIRE_FALSE(p.orchestrator.start_recording());
    }

    SECTION("RejectedFromStopCueSubscriber") {
        bool second_started = false;
        p.notes.haptics.subscribe([&](const HapticCue& c) {
            if (c.style == HapticCue::Style::recording_stopped) {
                second_started = p.orchestrator.start_recording();
            }
        });
        p.notes.auto_stopped.subscribe([&](const RecordingAutoStopped&) {
            second_started = second_started || p.orchestrator.start_recording();
        });

        REQUIRE(p.orchestrator.start_recording());
        p.recorder.finish(p.dir.str(), 8000, StopReason::silence);
        p.control.run_all();

        REQUIRE_FALSE(second_started);
        REQUIRE_FALSE(p.orchestrator.is_recording());
        REQUIRE(p.recorder.start_calls == 1);
        REQUIRE(p.orchestrator.active_attempt()->phase == SendPhase::converting);
    }

    SECTION("RejectedWhileSending") {
        p.record();
        REQUIRE_FALSE(p.orchestrator.start_recording());
        p.transport.accept_send(0, 1);
        p.pump();
        REQUIRE(p.orchestrator.start_recording());
    }

    SECTION("RejectedWithoutTargetChat") {
        p.session.set_target_chat(0);
        REQUIRE_FALSE(p.orchestrator.start_recording());
        REQUIRE(p.recorder.start_calls == 0);
    }

    SECTION("RejectedWhenNotAuthorized") {
        p.transport.authorize(AuthorizationState::closed);
        p.pump();
        REQUIRE_FALSE(p.orchestrator.start_recording());
        REQUIRE(p.recorder.start_calls == 0);
    }
}

TEST_CASE("Send orchestrator recording outcomes", "[orchestrator]") {
    Pipeline p;

    SECTION("CancelledTakeCreatesNoAttempt") {
        REQUIRE(p.orchestrator.start_recording());
        p.orchestrator.cancel_recording();
        p.pump();

        REQUIRE_FALSE(p.orchestrator.is_recording());
        REQUIRE_FALSE(p.orchestrator.active_attempt());
        REQUIRE(p.status.events.empty());
        REQUIRE(p.converter.calls == 0);
    }

    SECTION("DeviceUnavailableIsReported") {
        p.recorder.device_unavailable = true;
        REQUIRE_FALSE(p.orchestrator.start_recording());
        p.pump();

        REQUIRE(p.status.kinds() == std::vector<K>{K::recording_failed});
        REQUIRE_FALSE(p.orchestrator.is_recording());

        p.recorder.device_unavailable = false;
        REQUIRE(p.orchestrator.start_recording());
    }

    SECTION("DeviceLostMidTakeIsReported") {
        REQUIRE(p.orchestrator.start_recording());
        p.recorder.lose_device();
        p.pump();

        REQUIRE(p.status.kinds() == std::vector<K>{K::recording_failed});
        REQUIRE_FALSE(p.orchestrator.is_recording());
    }

    SECTION("NoHapticsWhenDisabled") {
        Pipeline quiet(FailedAttemptPolicy::keep_for_retry, false);
        quiet.record();
        REQUIRE(quiet.haptics.empty());
    }
}

TEST_CASE("Send orchestrator withdrawal", "[orchestrator]") {
    Pipeline p;

    SECTION("WithdrawDuringConversion") {
        REQUIRE(p.orchestrator.start_recording());
        Take take = p.recorder.finish(p.dir.str(), 3000);
        p.control.run_all();

        REQUIRE(p.orchestrator.cancel_active());
        REQUIRE_FALSE(p.orchestrator.active_attempt());
        p.pump();

        REQUIRE(p.status.kinds() == std::vector<K>{K::converting, K::discarded});
        REQUIRE(p.transport.sends.empty());
        REQUIRE_FALSE(exists(take.raw_path));
        REQUIRE_FALSE(exists(AudioConverter::output_path_for(take.raw_path)));
    }

    SECTION("WithdrawDuringSendIgnoresTheVerdict") {
        Take take = p.record();
        std::string payload = AudioConverter::output_path_for(take.raw_path);

        REQUIRE(p.orchestrator.cancel_active());
        REQUIRE(exists(payload));   // still owned by the in-flight send

        p.transport.accept_send(0, 12);
        p.pump();

        REQUIRE(p.status.kinds() == std::vector<K>{K::converting, K::sending, K::discarded});
        REQUIRE_FALSE(exists(payload));
        REQUIRE(p.orchestrator.failed_attempts().empty());
    }

    SECTION("WithdrawnRejectionIsNotKeptForRetry") {
        Take take = p.record();
        REQUIRE(p.orchestrator.cancel_active());
        p.transport.reject_send(0, 500, "late failure");
        p.pump();

        REQUIRE(p.orchestrator.failed_attempts().empty());
        REQUIRE_FALSE(exists(AudioConverter::output_path_for(take.raw_path)));
    }

    SECTION("NothingToWithdraw") {
        REQUIRE_FALSE(p.orchestrator.cancel_active());
    }
}

TEST_CASE("Send orchestrator session loss", "[orchestrator]") {
    Pipeline p;

    REQUIRE(p.orchestrator.start_recording());
    Take take = p.recorder.finish(p.dir.str(), 2000);
    p.transport.authorize(AuthorizationState::closed);
    p.pump();

    REQUIRE(p.transport.sends.empty());
    REQUIRE(p.status.kinds() == std::vector<K>{K::converting, K::sending, K::send_failed});
    REQUIRE(p.status.events.back().retryable);
    REQUIRE(p.status.events.back().reason == "not authorized");

    // The take is kept; retry is refused until the session is back.
    REQUIRE(p.orchestrator.failed_attempts().size() == 1);
    REQUIRE(exists(AudioConverter::output_path_for(take.raw_path)));
    REQUIRE_FALSE(p.orchestrator.retry(take.id));
}
