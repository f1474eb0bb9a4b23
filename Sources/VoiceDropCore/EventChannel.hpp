#pragma once

#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace vd {

/// Typed one-producer broadcast with an explicit subscriber list.
/// Handlers run on the publishing thread, in subscription order, and are
/// invoked outside the internal lock so they may (un)subscribe.
template <typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;
    using Token   = uint64_t;

    Token subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(mu_);
        Token token = ++next_token_;
        handlers_.emplace_back(token, std::move(handler));
        return token;
    }

    void unsubscribe(Token token) {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == token) {
                handlers_.erase(it);
                return;
            }
        }
    }

    void publish(const Event& event) const {
        std::vector<std::pair<Token, Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mu_);
            snapshot = handlers_;
        }
        for (const auto& entry : snapshot) {
            entry.second(event);
        }
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mu_);
        return handlers_.size();
    }

private:
    mutable std::mutex                     mu_;
    std::vector<std::pair<Token, Handler>> handlers_;
    Token                                  next_token_ = 0;
};

// ---------------------------------------------------------------------------
// Notification payloads
// ---------------------------------------------------------------------------

/// An incoming voice note in the target chat that should auto-play.
struct IncomingVoiceMessage {
    MessageHandle message;
    FileId        file_id      = 0;
    int32_t       duration_sec = 0;
};

struct DownloadCompleted {
    FileId      file_id = 0;
    std::string local_path;
};

/// Recording ended because silence lasted past the configured threshold.
struct RecordingAutoStopped {};

struct HapticCue {
    enum class Style { recording_started, recording_stopped };
    Style style = Style::recording_started;
};

/// The send pipeline went busy (recording, converting or sending) or idle.
struct PipelineActivity {
    bool busy = false;
};

/// An incoming voice note whose file is local and due for playback.
struct VoiceNoteReady {
    MessageHandle message;
    FileId        file_id      = 0;
    int32_t       duration_sec = 0;
    std::string   local_path;
};

/// Channels for loosely-coupled consumers.
struct Notifications {
    EventChannel<IncomingVoiceMessage> incoming_voice;
    EventChannel<DownloadCompleted>    download_completed;
    EventChannel<RecordingAutoStopped> auto_stopped;
    EventChannel<HapticCue>            haptics;
    EventChannel<PipelineActivity>     pipeline;
    EventChannel<VoiceNoteReady>       voice_ready;
};

} // namespace vd
