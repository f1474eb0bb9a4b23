#pragma once

#include "CaptureSource.hpp"
#include "PcmFileWriter.hpp"
#include "SilenceDetector.hpp"
#include "Types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace vd {

struct RecorderSettings {
    std::string     output_dir;             // must be writable; created if missing
    SilenceSettings silence;
    int             sample_interval_ms = 50;
};

/// Produces takes.  Exactly one terminal event per successful start().
class VoiceRecorder {
public:
    virtual ~VoiceRecorder() = default;

    virtual bool start(const RecorderSettings& settings,
                       RecorderCallback on_event,
                       MeteringCallback meter_cb = nullptr) = 0;
    virtual void stop() = 0;
    virtual void cancel() = 0;
    virtual bool is_recording() const = 0;
};

/// Records one take at a time from a CaptureSource into a WAV file.
///
/// Capture runs on a background thread.  Samples are metered in windows of
/// `sample_interval_ms`; each window feeds the SilenceDetector, which ends
/// the take after sustained silence or at the max-duration ceiling.
///
/// Every successful start() is matched by exactly one terminal event:
/// finished (with the Take), cancelled, or failed.  A start() that fails to
/// acquire the device emits failed(device_unavailable) and returns false.
/// Events are delivered on the capture thread, or on the caller's thread
/// for start() failures.  stop() and cancel() only signal the capture
/// thread; they never wait for the device.
class AudioRecorder : public VoiceRecorder {
public:
    explicit AudioRecorder(std::unique_ptr<CaptureSource> source);
    ~AudioRecorder() override;

    // Non-copyable.
    AudioRecorder(const AudioRecorder&) = delete;
    AudioRecorder& operator=(const AudioRecorder&) = delete;

    /// Begin a take.  Returns false if already recording or the device or
    /// output file cannot be acquired.
    bool start(const RecorderSettings& settings,
               RecorderCallback on_event,
               MeteringCallback meter_cb = nullptr) override;

    /// End the take (user release).  Returns at once; the finished event
    /// follows from the capture thread.
    void stop() override;

    /// End the take and delete it.  Returns at once; the cancelled event
    /// follows once the file is removed.
    void cancel() override;

    /// Block until the capture thread has exited.
    void join();

    /// Current audio level in [0.0, 1.0].  Thread-safe.
    float get_metering() const;

    bool is_recording() const override;

    /// Compute RMS level from a buffer of samples, clamped to [0, 1].
    static float compute_rms(const float* samples, size_t count);

private:
    enum class Request { none, stop, cancel };

    /// Background thread entry point.
    void recording_loop();

    /// Finalize or discard the take and emit the terminal event.
    void finish(std::optional<StopReason> reason, bool source_ok);

    void emit(const RecorderEvent& event);

    /// Join a finished capture thread unless called from it.
    void join_thread();

    // ---- State ----
    std::unique_ptr<CaptureSource> source_;
    PcmFileWriter                  writer_;
    std::atomic<bool>              recording_{false};
    std::atomic<Request>           request_{Request::none};
    std::thread                    record_thread_;
    mutable std::mutex             mu_;

    // Callbacks.
    RecorderCallback               on_event_;
    MeteringCallback               meter_cb_;

    // Take info.
    RecorderSettings               settings_;
    Take                           take_;

    // Audio level (written by recording thread, read by UI).
    std::atomic<float>             current_level_{0.0f};
};

} // namespace vd
