#pragma once

#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vd {

// ---------------------------------------------------------------------------
// Errors and replies
// ---------------------------------------------------------------------------

/// Error reported by the messaging backend.  `message` is carried verbatim
/// into user-facing status events.
struct TransportError {
    int         code = 0;
    std::string message;
};

/// Code used when an operation is attempted while not authorized.
constexpr int kUnauthenticatedCode = 401;

/// Reply to a request: either a value or an error.
template <typename T>
struct Reply {
    std::optional<T> value;
    TransportError   error;

    bool ok() const { return value.has_value(); }

    static Reply success(T v) {
        Reply r;
        r.value = std::move(v);
        return r;
    }

    static Reply failure(int code, std::string message) {
        Reply r;
        r.error = TransportError{code, std::move(message)};
        return r;
    }
};

/// Reply to a request that carries no value.  Empty optional = success.
using Completion = std::function<void(const std::optional<TransportError>&)>;

// ---------------------------------------------------------------------------
// Backend objects
// ---------------------------------------------------------------------------

struct TdlibParameters {
    int32_t     api_id = 0;
    std::string api_hash;
    std::string database_directory;
    std::string files_directory;
    bool        use_message_database = true;
    std::string system_language_code = "en";
    std::string device_model         = "Desktop";
    std::string application_version  = "1.0";
};

struct User {
    int64_t     id = 0;
    std::string first_name;
    std::string last_name;
    std::string username;
};

struct Chat {
    ChatId      id = 0;
    std::string title;
    int32_t     unread_count = 0;
    std::optional<MessageId> last_message_id;
};

struct FileInfo {
    FileId      id = 0;
    int64_t     size = 0;
    std::string local_path;                 // empty until downloaded
    bool        is_downloading_completed = false;
};

struct VoiceNoteInfo {
    int32_t              duration_sec = 0;
    std::vector<uint8_t> waveform;
    std::string          mime_type;
    FileInfo             file;
};

struct Message {
    MessageId   id = 0;
    ChatId      chat_id = 0;
    bool        is_outgoing = false;
    int64_t     date = 0;                   // Unix seconds
    std::string text;
    std::optional<VoiceNoteInfo> voice_note;
};

/// Outgoing voice note.  Without a waveform the backend shows a flat one.
struct VoiceMessageRequest {
    ChatId      chat_id = 0;
    std::string path;
    int32_t     duration_sec = 0;
    std::optional<std::vector<uint8_t>> waveform;
};

// ---------------------------------------------------------------------------
// Updates
// ---------------------------------------------------------------------------

/// Authorization state as reported by the backend.
enum class AuthorizationState {
    wait_parameters,
    wait_phone_number,
    wait_code,
    wait_password,
    ready,
    logging_out,
    closing,
    closed
};

inline const char* authorization_state_to_string(AuthorizationState s) {
    switch (s) {
        case AuthorizationState::wait_parameters:   return "wait_parameters";
        case AuthorizationState::wait_phone_number: return "wait_phone_number";
        case AuthorizationState::wait_code:         return "wait_code";
        case AuthorizationState::wait_password:     return "wait_password";
        case AuthorizationState::ready:             return "ready";
        case AuthorizationState::logging_out:       return "logging_out";
        case AuthorizationState::closing:           return "closing";
        case AuthorizationState::closed:            return "closed";
    }
    return "unknown";
}

enum class ConnectionState {
    waiting_for_network,
    connecting,
    updating,
    ready
};

inline const char* connection_state_to_string(ConnectionState s) {
    switch (s) {
        case ConnectionState::waiting_for_network: return "waiting_for_network";
        case ConnectionState::connecting:          return "connecting";
        case ConnectionState::updating:            return "updating";
        case ConnectionState::ready:               return "ready";
    }
    return "unknown";
}

struct AuthorizationStateUpdate {
    AuthorizationState state = AuthorizationState::wait_parameters;
};

struct NewMessageUpdate {
    Message message;
};

struct FileUpdate {
    FileInfo file;
};

struct ConnectionStateUpdate {
    ConnectionState state = ConnectionState::connecting;
};

struct UserUpdate {
    User user;
};

/// Anything the core does not act on.
struct UnhandledUpdate {
    std::string type;
};

using Update = std::variant<AuthorizationStateUpdate,
                            NewMessageUpdate,
                            FileUpdate,
                            ConnectionStateUpdate,
                            UserUpdate,
                            UnhandledUpdate>;

// ---------------------------------------------------------------------------
// TransportClient
// ---------------------------------------------------------------------------

/// Asynchronous channel to the messaging backend.
///
/// Every request completes exactly once through its callback, on a thread
/// of the implementation's choosing.  Updates may arrive on any thread.
class TransportClient {
public:
    using UpdateHandler = std::function<void(const Update&)>;

    virtual ~TransportClient() = default;

    virtual void set_update_handler(UpdateHandler handler) = 0;

    // ---- Authorization ----

    virtual void set_parameters(const TdlibParameters& params, Completion done) = 0;
    virtual void submit_phone_number(const std::string& phone, Completion done) = 0;
    virtual void submit_code(const std::string& code, Completion done) = 0;
    virtual void submit_second_factor(const std::string& password, Completion done) = 0;
    virtual void log_out(Completion done) = 0;

    // ---- Queries ----

    virtual void get_me(std::function<void(Reply<User>)> done) = 0;

    virtual void list_chats(int limit,
                            std::function<void(Reply<std::vector<Chat>>)> done) = 0;

    /// Messages older than `from_message_id` (0 = newest), newest first.
    virtual void get_chat_history(ChatId chat_id, MessageId from_message_id, int limit,
                                  std::function<void(Reply<std::vector<Message>>)> done) = 0;

    // ---- Media ----

    /// Success means the backend took ownership of the payload.
    virtual void send_voice_message(const VoiceMessageRequest& request,
                                    std::function<void(Reply<MessageHandle>)> done) = 0;

    virtual void download_file(FileId file_id,
                               std::function<void(Reply<FileInfo>)> done) = 0;
};

} // namespace vd
