#include "AutoPlayQueue.hpp"

#include "Log.hpp"

namespace vd {

namespace {

bool same_note(const IncomingVoiceMessage& a, const IncomingVoiceMessage& b) {
    return a.message.chat_id == b.message.chat_id
        && a.message.message_id == b.message.message_id;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AutoPlayQueue::AutoPlayQueue(MessengerSession& session,
                             Notifications& notifications,
                             Executor& control)
    : session_(session)
    , notifications_(notifications)
    , control_(control) {
    incoming_token_ = notifications_.incoming_voice.subscribe(
        [this](const IncomingVoiceMessage& note) {
            control_.post([this, note] { on_incoming(note); });
        });
    download_token_ = notifications_.download_completed.subscribe(
        [this](const DownloadCompleted& done) {
            control_.post([this, done] { on_download_completed(done); });
        });
    activity_token_ = notifications_.pipeline.subscribe(
        [this](const PipelineActivity& activity) {
            control_.post([this, busy = activity.busy] { on_activity(busy); });
        });
}

AutoPlayQueue::~AutoPlayQueue() {
    notifications_.incoming_voice.unsubscribe(incoming_token_);
    notifications_.download_completed.unsubscribe(download_token_);
    notifications_.pipeline.unsubscribe(activity_token_);
}

// ---------------------------------------------------------------------------
// Host calls
// ---------------------------------------------------------------------------

void AutoPlayQueue::playback_finished() {
    control_.post([this] {
        {
            std::lock_guard<std::mutex> lock(mu_);
            playing_ = false;
        }
        advance();
    });
}

void AutoPlayQueue::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    Logger::info("autoplay: dropping " + std::to_string(queue_.size()) + " queued note(s)");
    queue_.clear();
    deferred_.reset();
}

size_t AutoPlayQueue::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

bool AutoPlayQueue::is_playing() const {
    std::lock_guard<std::mutex> lock(mu_);
    return playing_;
}

bool AutoPlayQueue::is_held() const {
    std::lock_guard<std::mutex> lock(mu_);
    return held_;
}

std::optional<FileId> AutoPlayQueue::deferred_file() const {
    std::lock_guard<std::mutex> lock(mu_);
    return deferred_;
}

// ---------------------------------------------------------------------------
// Events (control executor)
// ---------------------------------------------------------------------------

void AutoPlayQueue::on_incoming(const IncomingVoiceMessage& note) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        queue_.push_back(note);
        Logger::info("autoplay: queued message " + std::to_string(note.message.message_id)
                     + " (" + std::to_string(queue_.size()) + " pending)");
    }
    advance();
}

void AutoPlayQueue::on_activity(bool busy) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        held_ = busy;
    }
    if (!busy) advance();
}

void AutoPlayQueue::on_download_completed(const DownloadCompleted& done) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!deferred_ || *deferred_ != done.file_id) return;
        deferred_.reset();
    }
    Logger::info("autoplay: deferred file " + std::to_string(done.file_id) + " is local");
    advance();
}

void AutoPlayQueue::on_download_reply(const IncomingVoiceMessage& note,
                                      const Reply<FileInfo>& reply) {
    std::optional<VoiceNoteReady> ready;
    {
        std::lock_guard<std::mutex> lock(mu_);
        downloading_ = false;
        if (queue_.empty() || !same_note(queue_.front(), note)) {
            // Cleared while the download was in flight.
        } else if (!reply.ok()) {
            Logger::warn("autoplay: dropping message " + std::to_string(note.message.message_id)
                         + ", download failed: " + reply.error.message);
            queue_.pop_front();
        } else if (!reply.value->is_downloading_completed || reply.value->local_path.empty()) {
            Logger::info("autoplay: download of file " + std::to_string(note.file_id)
                         + " deferred");
            deferred_ = note.file_id;
        } else if (!held_) {
            queue_.pop_front();
            playing_ = true;
            ready = VoiceNoteReady{note.message, note.file_id, note.duration_sec,
                                   reply.value->local_path};
        }
        // Held: the file is cached now and is handed off once released.
    }

    if (ready) {
        Logger::info("autoplay: message " + std::to_string(ready->message.message_id)
                     + " ready at " + ready->local_path);
        notifications_.voice_ready.publish(*ready);
        return;
    }
    advance();
}

void AutoPlayQueue::advance() {
    IncomingVoiceMessage note;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (queue_.empty() || held_ || playing_ || downloading_ || deferred_) return;
        if (!session_.auto_play()) {
            Logger::info("autoplay: disabled, dropping " + std::to_string(queue_.size())
                         + " queued note(s)");
            queue_.clear();
            return;
        }
        note         = queue_.front();
        downloading_ = true;
    }

    session_.download_file(note.file_id, [this, note](Reply<FileInfo> reply) {
        on_download_reply(note, reply);
    });
}

} // namespace vd
