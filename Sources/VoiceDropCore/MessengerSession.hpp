#pragma once

#include "AuthSession.hpp"
#include "EventChannel.hpp"
#include "Executor.hpp"
#include "Transport.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vd {

/// Whether the backend client can be used at all.
enum class TransportAvailability {
    uninitialized,
    ready,
    closed
};

inline const char* transport_availability_to_string(TransportAvailability a) {
    switch (a) {
        case TransportAvailability::uninitialized: return "uninitialized";
        case TransportAvailability::ready:         return "ready";
        case TransportAvailability::closed:        return "closed";
    }
    return "unknown";
}

/// Facade over a TransportClient.
///
/// Every update and every reply is re-posted to the control executor, where
/// the caches are maintained and callbacks run.  Caches are readable from
/// any thread.  Non-auth requests fail with kUnauthenticatedCode unless the
/// auth machine is ready.
class MessengerSession {
public:
    MessengerSession(TransportClient& transport, Executor& control,
                     Notifications& notifications);
    ~MessengerSession();

    // Non-copyable.
    MessengerSession(const MessengerSession&) = delete;
    MessengerSession& operator=(const MessengerSession&) = delete;

    /// Install the update handler.  The backend is expected to report its
    /// authorization state next.
    void start(const TdlibParameters& params);

    /// Detach from the backend.  Later updates are dropped.
    void stop();

    TransportAvailability transport_availability() const;
    ConnectionState connection_state() const;

    AuthStateMachine&       auth()       { return auth_; }
    const AuthStateMachine& auth() const { return auth_; }

    // ---- Preferences that affect update handling ----

    void set_auto_play(bool enabled);
    bool auto_play() const;

    void set_target_chat(ChatId chat_id);
    ChatId target_chat() const;

    // ---- Requests ----

    void send_voice_message(const VoiceMessageRequest& request,
                            std::function<void(Reply<MessageHandle>)> done);

    /// Reuses a file already on disk instead of downloading it again.
    void download_file(FileId file_id, std::function<void(Reply<FileInfo>)> done);

    void load_chats(int limit, Completion done);
    void load_history(ChatId chat_id, int limit, Completion done);

    bool log_out();

    // ---- Cached projections ----

    std::vector<Chat> chats() const;
    std::optional<Chat> chat(ChatId chat_id) const;

    /// Messages of a chat in ascending id order.
    std::vector<Message> messages(ChatId chat_id) const;

    std::optional<User> current_user() const;

    std::optional<FileInfo> cached_file(FileId file_id) const;

    /// Apply one backend update.  Runs on the control executor.
    void handle_update(const Update& update);

private:
    struct UpdateVisitor;

    void on_auth_state_changed(const AuthStateChanged& change);

    /// Insert unless already known.  Returns true for a new message.
    bool store_message(const Message& message);

    /// Record file state.  Returns true when this completes a download.
    bool store_file(const FileInfo& file);

    void clear_caches();

    /// Complete `done` on the control executor.
    template <typename T>
    void complete_later(std::function<void(Reply<T>)> done, Reply<T> reply) {
        control_.post([done = std::move(done), reply = std::move(reply)] { done(reply); });
    }

    TransportClient& transport_;
    Executor&        control_;
    Notifications&   notifications_;
    AuthStateMachine auth_;

    EventChannel<AuthStateChanged>::Token auth_token_ = 0;

    std::atomic<TransportAvailability> availability_{TransportAvailability::uninitialized};
    std::atomic<ConnectionState>       connection_{ConnectionState::connecting};
    std::atomic<bool>                  auto_play_{true};
    std::atomic<ChatId>                target_chat_{0};

    mutable std::mutex                            mu_;
    std::map<ChatId, Chat>                        chats_;
    std::map<ChatId, std::map<MessageId, Message>> messages_;
    std::map<FileId, FileInfo>                    files_;
    std::optional<User>                           current_user_;
};

} // namespace vd
