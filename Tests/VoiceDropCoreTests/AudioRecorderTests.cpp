#include <catch2/catch.hpp>

#include "AudioRecorder.hpp"
#include "Fakes.hpp"

#include <condition_variable>
#include <filesystem>

using namespace vd;
using namespace vd::test;

namespace {

constexpr int kRate = 8000;

/// Collects recorder events from the capture thread.
class EventCatcher {
public:
    RecorderCallback callback() {
        return [this](const RecorderEvent& e) {
            std::lock_guard<std::mutex> lock(mu_);
            events_.push_back(e);
            cv_.notify_all();
        };
    }

    /// Wait for the first event.  Fails the test on timeout.
    RecorderEvent wait() {
        std::unique_lock<std::mutex> lock(mu_);
        bool got = cv_.wait_for(lock, std::chrono::seconds(10), [this] { return !events_.empty(); });
        REQUIRE(got);
        return events_.front();
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mu_);
        return events_.size();
    }

private:
    std::mutex                 mu_;
    std::condition_variable    cv_;
    std::vector<RecorderEvent> events_;
};

/// Delivers one 100 ms block, then blocks in read() until released and
/// delivers one more.
class GatedCaptureSource : public CaptureSource {
public:
    explicit GatedCaptureSource(int sample_rate) : sample_rate_(sample_rate) {}

    bool open() override { return true; }
    int sample_rate() const override { return sample_rate_; }

    bool read(std::vector<float>& out) override {
        std::unique_lock<std::mutex> lock(mu_);
        if (reads_++ > 0) {
            blocked_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return released_; });
        }
        out.insert(out.end(), static_cast<size_t>(sample_rate_ / 10), 0.2f);
        return true;
    }

    void close() override {}

    void wait_until_blocked() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, std::chrono::seconds(10), [this] { return blocked_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mu_);
        released_ = true;
        cv_.notify_all();
    }

private:
    int                     sample_rate_;
    std::mutex              mu_;
    std::condition_variable cv_;
    int                     reads_    = 0;
    bool                    blocked_  = false;
    bool                    released_ = false;
};

RecorderSettings settings_for(const TempDir& dir) {
    RecorderSettings s;
    s.output_dir                = dir.str();
    s.sample_interval_ms        = 50;
    s.silence.threshold         = 0.0056f;
    s.silence.silence_duration  = 2.0;
    s.silence.max_duration      = 60.0;
    return s;
}

size_t files_in(const TempDir& dir) {
    size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.str())) {
        (void)entry;
        ++n;
    }
    return n;
}

} // namespace

TEST_CASE("AudioRecorder stop conditions", "[recorder]") {
    TempDir dir;
    EventCatcher events;

    SECTION("SilenceAutoStopsAndMarksTake") {
        // 6 s of speech, then 4 s of silence.
        auto blocks = constant_blocks(kRate, 6.0, 0.1f);
        append_blocks(blocks, constant_blocks(kRate, 4.0, 0.0f));
        AudioRecorder recorder(std::make_unique<ScriptedCaptureSource>(kRate, blocks));

        REQUIRE(recorder.start(settings_for(dir), events.callback()));
        RecorderEvent e = events.wait();

        REQUIRE(e.kind == RecorderEvent::Kind::finished);
        REQUIRE(e.take);
        REQUIRE(e.take->auto_stopped);
        REQUIRE(e.take->stop_reason == StopReason::silence);
        REQUIRE(e.take->duration_ms == 8000);
        REQUIRE(e.take->duration_sec == 8);
        REQUIRE(exists(e.take->raw_path));
    }

    SECTION("CeilingIsExactEvenMidWindow") {
        auto settings = settings_for(dir);
        settings.silence.max_duration = 2.99;
        AudioRecorder recorder(std::make_unique<ScriptedCaptureSource>(
            kRate, constant_blocks(kRate, 5.0, 0.2f)));

        REQUIRE(recorder.start(settings, events.callback()));
        RecorderEvent e = events.wait();

        REQUIRE(e.kind == RecorderEvent::Kind::finished);
        REQUIRE(e.take->stop_reason == StopReason::max_duration);
        REQUIRE_FALSE(e.take->auto_stopped);
        REQUIRE(e.take->duration_ms == 2990);
    }

    SECTION("SourceEndingAfterAudioFinishesTheTake") {
        AudioRecorder recorder(std::make_unique<ScriptedCaptureSource>(
            kRate, constant_blocks(kRate, 1.0, 0.2f)));

        REQUIRE(recorder.start(settings_for(dir), events.callback()));
        RecorderEvent e = events.wait();

        REQUIRE(e.kind == RecorderEvent::Kind::finished);
        REQUIRE(e.take->stop_reason == StopReason::source_ended);
        REQUIRE(e.take->duration_ms == 1000);
    }

    SECTION("SourceEndingBeforeAudioFails") {
        AudioRecorder recorder(std::make_unique<ScriptedCaptureSource>(
            kRate, std::vector<std::vector<float>>{}));

        REQUIRE(recorder.start(settings_for(dir), events.callback()));
        RecorderEvent e = events.wait();

        REQUIRE(e.kind == RecorderEvent::Kind::failed);
        REQUIRE(e.error == RecorderError::device_unavailable);
        recorder.stop();
        REQUIRE(files_in(dir) == 0);
    }
}

TEST_CASE("AudioRecorder user control", "[recorder]") {
    TempDir dir;
    EventCatcher events;

    SECTION("DeviceUnavailableFailsStart") {
        auto source = std::make_unique<ScriptedCaptureSource>(kRate, constant_blocks(kRate, 1.0, 0.2f));
        source->fail_open = true;
        AudioRecorder recorder(std::move(source));

        REQUIRE_FALSE(recorder.start(settings_for(dir), events.callback()));
        REQUIRE(events.count() == 1);
        RecorderEvent e = events.wait();
        REQUIRE(e.kind == RecorderEvent::Kind::failed);
        REQUIRE(e.error == RecorderError::device_unavailable);
        REQUIRE_FALSE(recorder.is_recording());
    }

    SECTION("ManualStopFinishesOnce") {
        AudioRecorder recorder(std::make_unique<ScriptedCaptureSource>(
            kRate, constant_blocks(kRate, 0.5, 0.2f), true));

        REQUIRE(recorder.start(settings_for(dir), events.callback()));
        REQUIRE(recorder.is_recording());
        REQUIRE_FALSE(recorder.start(settings_for(dir), events.callback()));

        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        recorder.stop();

        RecorderEvent e = events.wait();
        recorder.join();
        REQUIRE(events.count() == 1);
        REQUIRE(e.kind == RecorderEvent::Kind::finished);
        REQUIRE(e.take->stop_reason == StopReason::manual);
        REQUIRE(e.take->duration_ms >= 500);
        REQUIRE_FALSE(recorder.is_recording());
        REQUIRE(exists(e.take->raw_path));
    }

    SECTION("StopReturnsWhileCaptureIsBlocked") {
        auto source = std::make_unique<GatedCaptureSource>(kRate);
        GatedCaptureSource* gate = source.get();
        AudioRecorder recorder(std::move(source));

        REQUIRE(recorder.start(settings_for(dir), events.callback()));
        gate->wait_until_blocked();

        recorder.stop();
        REQUIRE(events.count() == 0);
        REQUIRE(recorder.is_recording());

        gate->release();
        RecorderEvent e = events.wait();
        REQUIRE(e.kind == RecorderEvent::Kind::finished);
        REQUIRE(e.take->stop_reason == StopReason::manual);
        REQUIRE(e.take->duration_ms == 200);
    }

    SECTION("CancelDeletesTheTake") {
        AudioRecorder recorder(std::make_unique<ScriptedCaptureSource>(
            kRate, constant_blocks(kRate, 0.5, 0.2f), true));

        REQUIRE(recorder.start(settings_for(dir), events.callback()));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        recorder.cancel();

        RecorderEvent e = events.wait();
        REQUIRE(e.kind == RecorderEvent::Kind::cancelled);
        REQUIRE_FALSE(e.take);
        REQUIRE(files_in(dir) == 0);
    }

    SECTION("MeteringReportsWindowLevels") {
        std::mutex mu;
        std::vector<float> levels;
        AudioRecorder recorder(std::make_unique<ScriptedCaptureSource>(
            kRate, constant_blocks(kRate, 1.0, 0.25f)));

        REQUIRE(recorder.start(settings_for(dir), events.callback(), [&](float level) {
            std::lock_guard<std::mutex> lock(mu);
            levels.push_back(level);
        }));
        events.wait();
        recorder.stop();

        std::lock_guard<std::mutex> lock(mu);
        REQUIRE(levels.size() == 20);
        for (float l : levels) REQUIRE(l == Approx(0.25f));
    }
}

TEST_CASE("RMS level", "[recorder]") {
    std::vector<float> quiet(100, 0.0f);
    std::vector<float> loud(100, -2.0f);
    std::vector<float> half(100, 0.5f);

    REQUIRE(AudioRecorder::compute_rms(nullptr, 0) == 0.0f);
    REQUIRE(AudioRecorder::compute_rms(quiet.data(), quiet.size()) == 0.0f);
    REQUIRE(AudioRecorder::compute_rms(loud.data(), loud.size()) == 1.0f);
    REQUIRE(AudioRecorder::compute_rms(half.data(), half.size()) == Approx(0.5f));
}
