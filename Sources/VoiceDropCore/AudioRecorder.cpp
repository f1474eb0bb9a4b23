#include "AudioRecorder.hpp"

#include "Log.hpp"
#include "Uuid.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <vector>

namespace vd {

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioRecorder::AudioRecorder(std::unique_ptr<CaptureSource> source)
    : source_(std::move(source)) {}

AudioRecorder::~AudioRecorder() {
    cancel();
    join();
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

bool AudioRecorder::start(const RecorderSettings& settings,
                          RecorderCallback on_event,
                          MeteringCallback meter_cb) {
    std::optional<RecorderEvent> failure;
    {
        std::lock_guard<std::mutex> lock(mu_);

        if (recording_.load()) {
            return false;   // already recording
        }

        // A previous take that ended on its own leaves a finished thread.
        join_thread();

        settings_ = settings;
        on_event_ = std::move(on_event);
        meter_cb_ = std::move(meter_cb);
        request_.store(Request::none);
        current_level_.store(0.0f);

        take_            = Take{};
        take_.id         = generate_uuid();
        take_.created_at = now_unix();

        std::error_code ec;
        std::filesystem::create_directories(settings_.output_dir, ec);

        RecorderEvent failed;
        failed.kind = RecorderEvent::Kind::failed;

        if (ec) {
            Logger::error("recorder: cannot create " + settings_.output_dir + ": " + ec.message());
            failed.error = RecorderError::output_unavailable;
            failure = failed;
        } else if (!source_ || !source_->open()) {
            Logger::error("recorder: capture device unavailable");
            failed.error = RecorderError::device_unavailable;
            failure = failed;
        } else {
            take_.raw_path = (std::filesystem::path(settings_.output_dir)
                              / ("take_" + take_.id + ".wav")).string();
            if (!writer_.open(take_.raw_path, source_->sample_rate())) {
                source_->close();
                failed.error = RecorderError::output_unavailable;
                failure = failed;
            }
        }

        if (!failure) {
            recording_.store(true);
            record_thread_ = std::thread(&AudioRecorder::recording_loop, this);
            Logger::info("recorder: take " + take_.id + " started");
            return true;
        }
    }

    emit(*failure);
    return false;
}

// ---------------------------------------------------------------------------
// stop / cancel
// ---------------------------------------------------------------------------

void AudioRecorder::stop() {
    Request expected = Request::none;
    request_.compare_exchange_strong(expected, Request::stop);
}

void AudioRecorder::cancel() {
    if (recording_.load()) {
        request_.store(Request::cancel);
    }
}

void AudioRecorder::join() {
    std::lock_guard<std::mutex> lock(mu_);
    join_thread();
}

// ---------------------------------------------------------------------------
// get_metering / is_recording
// ---------------------------------------------------------------------------

float AudioRecorder::get_metering() const {
    return current_level_.load();
}

bool AudioRecorder::is_recording() const {
    return recording_.load();
}

// ---------------------------------------------------------------------------
// recording_loop  (runs on background thread)
// ---------------------------------------------------------------------------

void AudioRecorder::recording_loop() {
    const int rate = source_->sample_rate();
    SilenceDetector detector(settings_.silence, rate);

    const int64_t window = std::max<int64_t>(
        1, static_cast<int64_t>(rate) * settings_.sample_interval_ms / 1000);

    std::vector<float> pending;
    std::optional<StopReason> reason;
    bool source_ok = true;
    size_t offset = 0;

    while (request_.load() == Request::none && !reason) {
        if (!source_->read(pending)) {
            source_ok = false;
            break;
        }

        // Meter and write whole windows.  The window that reaches the
        // ceiling is cut short so nothing past max duration is kept.
        for (;;) {
            int64_t n = std::min(window, detector.frames_until_ceiling());
            if (n <= 0) {
                reason = StopReason::max_duration;
                break;
            }
            if (static_cast<int64_t>(pending.size() - offset) < n) break;

            const float* w = pending.data() + offset;
            if (!writer_.write(w, static_cast<size_t>(n))) {
                Logger::error("recorder: write failed for take " + take_.id);
                source_ok = false;
                break;
            }
            offset += static_cast<size_t>(n);

            float level = compute_rms(w, static_cast<size_t>(n));
            current_level_.store(level);
            if (meter_cb_) meter_cb_(level);

            reason = detector.observe(level, n);
            if (reason) break;
        }
        if (!source_ok) break;

        pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(offset));
        offset = 0;
    }

    // On user release keep the trailing partial window.
    if (!reason && source_ok && request_.load() == Request::stop) {
        int64_t n = std::min<int64_t>(static_cast<int64_t>(pending.size() - offset),
                                      detector.frames_until_ceiling());
        if (n > 0 && !writer_.write(pending.data() + offset, static_cast<size_t>(n))) {
            Logger::warn("recorder: trailing samples lost for take " + take_.id);
        }
    }

    finish(reason, source_ok);
}

// ---------------------------------------------------------------------------
// finish
// ---------------------------------------------------------------------------

void AudioRecorder::finish(std::optional<StopReason> reason, bool source_ok) {
    const int rate = source_->sample_rate();
    source_->close();

    const int64_t frames = writer_.frames_written();
    RecorderEvent event;

    if (request_.load() == Request::cancel) {
        writer_.abort();
        event.kind = RecorderEvent::Kind::cancelled;
        Logger::info("recorder: take " + take_.id + " cancelled");
    } else if (!source_ok && frames == 0) {
        writer_.abort();
        event.kind  = RecorderEvent::Kind::failed;
        event.error = RecorderError::device_unavailable;
        Logger::error("recorder: capture lost before any audio in take " + take_.id);
    } else if (!writer_.finalize()) {
        std::error_code ec;
        std::filesystem::remove(take_.raw_path, ec);
        event.kind  = RecorderEvent::Kind::failed;
        event.error = RecorderError::output_unavailable;
        Logger::error("recorder: cannot finalize " + take_.raw_path);
    } else {
        StopReason r = reason ? *reason
                              : (source_ok ? StopReason::manual : StopReason::source_ended);
        take_.duration_ms  = rate > 0 ? frames * 1000 / rate : 0;
        take_.duration_sec = static_cast<int32_t>((take_.duration_ms + 500) / 1000);
        take_.stop_reason  = r;
        take_.auto_stopped = (r == StopReason::silence);

        event.kind = RecorderEvent::Kind::finished;
        event.take = take_;
        Logger::info("recorder: take " + take_.id + " finished ("
                     + stop_reason_to_string(r) + ", "
                     + std::to_string(take_.duration_ms) + " ms)");
    }

    current_level_.store(0.0f);
    recording_.store(false);
    emit(event);
}

void AudioRecorder::emit(const RecorderEvent& event) {
    if (on_event_) on_event_(event);
}

void AudioRecorder::join_thread() {
    if (record_thread_.joinable()
        && record_thread_.get_id() != std::this_thread::get_id()) {
        record_thread_.join();
    }
}

// ---------------------------------------------------------------------------
// compute_rms
// ---------------------------------------------------------------------------

float AudioRecorder::compute_rms(const float* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    float rms = static_cast<float>(std::sqrt(sum / static_cast<double>(count)));

    // Clamp to [0, 1].
    return std::min(1.0f, std::max(0.0f, rms));
}

} // namespace vd
