#include "MessengerSession.hpp"

#include "Log.hpp"

#include <filesystem>
#include <variant>

namespace vd {

namespace {

const char* kNotAuthorized = "not authorized";

} // namespace

// ---------------------------------------------------------------------------
// Update dispatch
// ---------------------------------------------------------------------------

struct MessengerSession::UpdateVisitor {
    MessengerSession& session;

    void operator()(const AuthorizationStateUpdate& u) const {
        session.auth_.on_authorization_update(u.state);
    }

    void operator()(const NewMessageUpdate& u) const {
        const Message& msg = u.message;
        if (!session.store_message(msg)) {
            Logger::debug("session: duplicate message " + std::to_string(msg.id));
            return;
        }
        if (msg.voice_note) {
            session.store_file(msg.voice_note->file);
        }

        if (session.auto_play() && !msg.is_outgoing && msg.voice_note
            && msg.chat_id != 0 && msg.chat_id == session.target_chat()) {
            IncomingVoiceMessage incoming;
            incoming.message      = MessageHandle{msg.chat_id, msg.id};
            incoming.file_id      = msg.voice_note->file.id;
            incoming.duration_sec = msg.voice_note->duration_sec;
            Logger::info("session: incoming voice note " + std::to_string(msg.id));
            session.notifications_.incoming_voice.publish(incoming);
        }
    }

    void operator()(const FileUpdate& u) const {
        if (session.store_file(u.file)) {
            Logger::info("session: file " + std::to_string(u.file.id) + " downloaded");
            session.notifications_.download_completed.publish(
                DownloadCompleted{u.file.id, u.file.local_path});
        }
    }

    void operator()(const ConnectionStateUpdate& u) const {
        session.connection_.store(u.state);
        Logger::info(std::string("session: connection ")
                     + connection_state_to_string(u.state));
    }

    void operator()(const UserUpdate& u) const {
        std::lock_guard<std::mutex> lock(session.mu_);
        if (session.current_user_ && session.current_user_->id == u.user.id) {
            session.current_user_ = u.user;
        }
    }

    void operator()(const UnhandledUpdate& u) const {
        Logger::debug("session: unhandled update " + u.type);
    }
};

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

MessengerSession::MessengerSession(TransportClient& transport, Executor& control,
                                   Notifications& notifications)
    : transport_(transport)
    , control_(control)
    , notifications_(notifications)
    , auth_(transport, control) {
    auth_token_ = auth_.state_changes().subscribe(
        [this](const AuthStateChanged& change) { on_auth_state_changed(change); });
}

MessengerSession::~MessengerSession() {
    auth_.state_changes().unsubscribe(auth_token_);
    stop();
}

void MessengerSession::start(const TdlibParameters& params) {
    auth_.set_parameters(params);
    transport_.set_update_handler([this](const Update& update) {
        control_.post([this, update] { handle_update(update); });
    });
    if (auth_.state() != AuthState::closed) {
        availability_.store(TransportAvailability::ready);
    }
    Logger::info("session: started");
}

void MessengerSession::stop() {
    if (availability_.load() == TransportAvailability::uninitialized) return;
    transport_.set_update_handler(nullptr);
    availability_.store(TransportAvailability::closed);
}

void MessengerSession::handle_update(const Update& update) {
    if (availability_.load() != TransportAvailability::ready) return;
    std::visit(UpdateVisitor{*this}, update);
}

TransportAvailability MessengerSession::transport_availability() const {
    return availability_.load();
}

ConnectionState MessengerSession::connection_state() const {
    return connection_.load();
}

// ---------------------------------------------------------------------------
// Preferences
// ---------------------------------------------------------------------------

void MessengerSession::set_auto_play(bool enabled) { auto_play_.store(enabled); }
bool MessengerSession::auto_play() const { return auto_play_.load(); }

void MessengerSession::set_target_chat(ChatId chat_id) { target_chat_.store(chat_id); }
ChatId MessengerSession::target_chat() const { return target_chat_.load(); }

// ---------------------------------------------------------------------------
// Auth state
// ---------------------------------------------------------------------------

void MessengerSession::on_auth_state_changed(const AuthStateChanged& change) {
    if (change.to == AuthState::ready) {
        transport_.get_me([this](Reply<User> reply) {
            control_.post([this, reply] {
                if (!reply.ok()) {
                    Logger::warn("session: get_me failed: " + reply.error.message);
                    return;
                }
                std::lock_guard<std::mutex> lock(mu_);
                current_user_ = *reply.value;
            });
        });
    } else if (change.to == AuthState::closed) {
        clear_caches();
        availability_.store(TransportAvailability::closed);
        Logger::info("session: closed, caches cleared");
    }
}

void MessengerSession::clear_caches() {
    std::lock_guard<std::mutex> lock(mu_);
    chats_.clear();
    messages_.clear();
    files_.clear();
    current_user_.reset();
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

void MessengerSession::send_voice_message(const VoiceMessageRequest& request,
                                          std::function<void(Reply<MessageHandle>)> done) {
    if (!auth_.is_ready()) {
        Logger::warn("session: send rejected, not authorized");
        complete_later(std::move(done),
                       Reply<MessageHandle>::failure(kUnauthenticatedCode, kNotAuthorized));
        return;
    }
    transport_.send_voice_message(request, [this, done](Reply<MessageHandle> reply) {
        complete_later(done, std::move(reply));
    });
}

void MessengerSession::download_file(FileId file_id,
                                     std::function<void(Reply<FileInfo>)> done) {
    std::optional<FileInfo> cached = cached_file(file_id);
    if (cached && cached->is_downloading_completed && !cached->local_path.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(cached->local_path, ec)) {
            Logger::debug("session: file " + std::to_string(file_id) + " already local");
            complete_later(std::move(done), Reply<FileInfo>::success(*cached));
            return;
        }
    }

    if (!auth_.is_ready()) {
        complete_later(std::move(done),
                       Reply<FileInfo>::failure(kUnauthenticatedCode, kNotAuthorized));
        return;
    }

    transport_.download_file(file_id, [this, done](Reply<FileInfo> reply) {
        control_.post([this, done, reply] {
            if (reply.ok() && store_file(*reply.value)) {
                notifications_.download_completed.publish(
                    DownloadCompleted{reply.value->id, reply.value->local_path});
            }
            if (!reply.ok()) {
                Logger::warn("session: download failed: " + reply.error.message);
            }
            done(reply);
        });
    });
}

void MessengerSession::load_chats(int limit, Completion done) {
    if (!auth_.is_ready()) {
        control_.post([done] { done(TransportError{kUnauthenticatedCode, kNotAuthorized}); });
        return;
    }
    transport_.list_chats(limit, [this, done](Reply<std::vector<Chat>> reply) {
        control_.post([this, done, reply] {
            if (!reply.ok()) {
                done(reply.error);
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mu_);
                chats_.clear();
                for (const auto& c : *reply.value) {
                    chats_[c.id] = c;
                }
            }
            done(std::nullopt);
        });
    });
}

void MessengerSession::load_history(ChatId chat_id, int limit, Completion done) {
    if (!auth_.is_ready()) {
        control_.post([done] { done(TransportError{kUnauthenticatedCode, kNotAuthorized}); });
        return;
    }
    transport_.get_chat_history(chat_id, 0, limit,
        [this, done](Reply<std::vector<Message>> reply) {
            control_.post([this, done, reply] {
                if (!reply.ok()) {
                    done(reply.error);
                    return;
                }
                for (const auto& m : *reply.value) {
                    store_message(m);
                    if (m.voice_note) store_file(m.voice_note->file);
                }
                done(std::nullopt);
            });
        });
}

bool MessengerSession::log_out() {
    return auth_.log_out();
}

// ---------------------------------------------------------------------------
// Caches
// ---------------------------------------------------------------------------

bool MessengerSession::store_message(const Message& message) {
    std::lock_guard<std::mutex> lock(mu_);
    auto& history = messages_[message.chat_id];
    if (!history.emplace(message.id, message).second) {
        return false;
    }
    auto it = chats_.find(message.chat_id);
    if (it != chats_.end()
        && (!it->second.last_message_id || *it->second.last_message_id < message.id)) {
        it->second.last_message_id = message.id;
    }
    return true;
}

bool MessengerSession::store_file(const FileInfo& file) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = files_.find(file.id);
    bool was_complete = it != files_.end() && it->second.is_downloading_completed;
    files_[file.id] = file;
    return !was_complete && file.is_downloading_completed && !file.local_path.empty();
}

std::vector<Chat> MessengerSession::chats() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<Chat> out;
    out.reserve(chats_.size());
    for (const auto& entry : chats_) out.push_back(entry.second);
    return out;
}

std::optional<Chat> MessengerSession::chat(ChatId chat_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = chats_.find(chat_id);
    if (it == chats_.end()) return std::nullopt;
    return it->second;
}

std::vector<Message> MessengerSession::messages(ChatId chat_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<Message> out;
    auto it = messages_.find(chat_id);
    if (it == messages_.end()) return out;
    out.reserve(it->second.size());
    for (const auto& entry : it->second) out.push_back(entry.second);
    return out;
}

std::optional<User> MessengerSession::current_user() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_user_;
}

std::optional<FileInfo> MessengerSession::cached_file(FileId file_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = files_.find(file_id);
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

} // namespace vd
