#pragma once

#include "AudioConverter.hpp"
#include "AutoPlayQueue.hpp"
#include "AudioRecorder.hpp"
#include "CaptureSource.hpp"
#include "Config.hpp"
#include "EventChannel.hpp"
#include "Executor.hpp"
#include "MessengerSession.hpp"
#include "PreferencesStore.hpp"
#include "SendOrchestrator.hpp"
#include "StatusNotifier.hpp"
#include "Transport.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace vd {

/// Owns and wires every component of the voice pipeline.
///
/// Layout under `root_dir`:
///     preferences.db   user preferences
///     media/           takes and converted voice notes (transient)
///     tdlib/           default backend database directory
class VoiceClient {
public:
    /// A null `capture` selects an FfmpegCaptureSource built from the
    /// configured capture format and device; a null `converter` selects
    /// AudioConverter.
    VoiceClient(std::string root_dir,
                std::unique_ptr<TransportClient> transport,
                std::unique_ptr<CaptureSource> capture = nullptr,
                std::unique_ptr<VoiceConverter> converter = nullptr);
    ~VoiceClient();

    // Non-copyable.
    VoiceClient(const VoiceClient&) = delete;
    VoiceClient& operator=(const VoiceClient&) = delete;

    /// Open preferences, load the configuration, sweep stale media and
    /// start the messenger session.  Returns false on failure.
    bool init(TdlibParameters params);

    bool is_initialized() const { return orchestrator_ != nullptr; }

    /// Throw std::runtime_error before init().
    SendOrchestrator& orchestrator();
    AutoPlayQueue&    autoplay();
    MessengerSession& session();

    Notifications&  notifications() { return notifications_; }
    StatusNotifier& status() { return status_; }

    Config config() const;

    /// Persist `config` and apply it.  Capture device changes take effect
    /// on the next launch.
    bool update_config(const Config& config);

    const std::string& media_dir() const { return media_dir_; }

private:
    void apply_config(const Config& config);

    std::string      root_dir_;
    std::string      media_dir_;
    PreferencesStore prefs_;

    mutable std::mutex mu_;
    Config             config_;

    Notifications  notifications_;
    StatusNotifier status_;

    std::unique_ptr<TransportClient>  transport_;
    std::unique_ptr<CaptureSource>    capture_;     // handed to recorder_ in init()
    std::unique_ptr<VoiceConverter>   converter_;
    std::unique_ptr<AudioRecorder>    recorder_;
    std::unique_ptr<MessengerSession> session_;
    std::unique_ptr<SendOrchestrator> orchestrator_;
    std::unique_ptr<AutoPlayQueue>    autoplay_;

    // Declared last so they drain and join before the components they call.
    SerialExecutor control_{"control"};
    SerialExecutor worker_{"convert"};
};

} // namespace vd
