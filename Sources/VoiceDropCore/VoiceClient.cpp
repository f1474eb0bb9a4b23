#include "VoiceClient.hpp"

#include "Log.hpp"
#include "TempFileJanitor.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace vd {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

VoiceClient::VoiceClient(std::string root_dir,
                         std::unique_ptr<TransportClient> transport,
                         std::unique_ptr<CaptureSource> capture,
                         std::unique_ptr<VoiceConverter> converter)
    : root_dir_(std::move(root_dir))
    , media_dir_((fs::path(root_dir_) / "media").string())
    , prefs_((fs::path(root_dir_) / "preferences.db").string())
    , transport_(std::move(transport))
    , capture_(std::move(capture))
    , converter_(std::move(converter)) {
    if (!transport_) {
        throw std::invalid_argument("VoiceClient requires a transport");
    }
    session_ = std::make_unique<MessengerSession>(*transport_, control_, notifications_);
}

VoiceClient::~VoiceClient() {
    // The cancelled event is posted to control_, which drains before the
    // orchestrator is destroyed.  The capture thread must be gone first.
    if (recorder_) {
        recorder_->cancel();
        recorder_->join();
    }
    if (session_) session_->stop();
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

bool VoiceClient::init(TdlibParameters params) {
    if (is_initialized()) return true;

    std::error_code ec;
    fs::create_directories(media_dir_, ec);
    if (ec) {
        Logger::error("client: cannot create " + media_dir_ + ": " + ec.message());
        return false;
    }

    if (!prefs_.open()) {
        Logger::error("client: cannot open preferences in " + root_dir_);
        return false;
    }

    Config config = load_config(prefs_);
    {
        std::lock_guard<std::mutex> lock(mu_);
        config_ = config;
    }

    TempFileJanitor::sweep(media_dir_, std::chrono::seconds(config.temp_max_age_sec));

    if (!capture_) {
        capture_ = std::make_unique<FfmpegCaptureSource>(config.capture_format,
                                                         config.capture_device);
    }
    if (!converter_) {
        converter_ = std::make_unique<AudioConverter>();
    }
    recorder_ = std::make_unique<AudioRecorder>(std::move(capture_));
    orchestrator_ = std::make_unique<SendOrchestrator>(
        *recorder_, *converter_, *session_, status_, notifications_, control_, worker_);
    autoplay_ = std::make_unique<AutoPlayQueue>(*session_, notifications_, control_);

    apply_config(config);

    if (params.database_directory.empty()) {
        params.database_directory = (fs::path(root_dir_) / "tdlib").string();
    }
    if (params.files_directory.empty()) {
        params.files_directory = params.database_directory;
    }
    session_->start(params);

    Logger::info("client: initialized in " + root_dir_);
    return true;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

SendOrchestrator& VoiceClient::orchestrator() {
    if (!orchestrator_) throw std::runtime_error("VoiceClient not initialized");
    return *orchestrator_;
}

AutoPlayQueue& VoiceClient::autoplay() {
    if (!autoplay_) throw std::runtime_error("VoiceClient not initialized");
    return *autoplay_;
}

MessengerSession& VoiceClient::session() {
    return *session_;
}

Config VoiceClient::config() const {
    std::lock_guard<std::mutex> lock(mu_);
    return config_;
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

bool VoiceClient::update_config(const Config& config) {
    if (!prefs_.is_open()) {
        Logger::warn("client: update_config before init");
        return false;
    }
    if (!save_config(prefs_, config)) {
        Logger::error("client: cannot save preferences");
        return false;
    }

    // Round-trip so the applied values carry the same clamping as startup.
    Config applied = load_config(prefs_);
    {
        std::lock_guard<std::mutex> lock(mu_);
        config_ = applied;
    }
    apply_config(applied);
    return true;
}

void VoiceClient::apply_config(const Config& config) {
    session_->set_auto_play(config.auto_play);
    session_->set_target_chat(config.target_chat_id);

    if (!orchestrator_) return;

    OrchestratorSettings settings;
    settings.recorder.output_dir               = media_dir_;
    settings.recorder.sample_interval_ms       = config.sample_interval_ms;
    settings.recorder.silence.enabled          = config.silence_detection;
    settings.recorder.silence.threshold        = config.silence_threshold;
    settings.recorder.silence.silence_duration = config.silence_duration_sec;
    settings.recorder.silence.max_duration     = config.max_recording_sec;
    settings.haptic_feedback                   = config.haptic_feedback;
    settings.failed_attempt_policy             = config.failed_attempt_policy;
    orchestrator_->set_settings(settings);
}

} // namespace vd
