#pragma once

#include "EventChannel.hpp"
#include "Executor.hpp"
#include "Transport.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace vd {

/// Local view of authentication progress.
enum class AuthState {
    uninitialized,
    awaiting_phone_number,
    awaiting_code,
    awaiting_second_factor,
    ready,
    closed
};

inline const char* auth_state_to_string(AuthState s) {
    switch (s) {
        case AuthState::uninitialized:          return "uninitialized";
        case AuthState::awaiting_phone_number:  return "awaiting_phone_number";
        case AuthState::awaiting_code:          return "awaiting_code";
        case AuthState::awaiting_second_factor: return "awaiting_second_factor";
        case AuthState::ready:                  return "ready";
        case AuthState::closed:                 return "closed";
    }
    return "unknown";
}

/// Which submission a failure belongs to.
enum class AuthStep {
    parameters,
    phone_number,
    code,
    second_factor,
    log_out
};

inline const char* auth_step_to_string(AuthStep s) {
    switch (s) {
        case AuthStep::parameters:    return "parameters";
        case AuthStep::phone_number:  return "phone_number";
        case AuthStep::code:          return "code";
        case AuthStep::second_factor: return "second_factor";
        case AuthStep::log_out:       return "log_out";
    }
    return "unknown";
}

struct AuthStateChanged {
    AuthState from = AuthState::uninitialized;
    AuthState to   = AuthState::uninitialized;
};

/// A submission was rejected by the backend.  The state did not change.
struct AuthStepFailed {
    AuthStep    step = AuthStep::phone_number;
    int         code = 0;
    std::string reason;
};

/// Tracks authentication progress.  State only moves on backend
/// authorization updates, never on a local submission.
///
/// Submission replies are posted to the control executor before they are
/// published, so subscribers always run there.
class AuthStateMachine {
public:
    AuthStateMachine(TransportClient& transport, Executor& control);

    // Non-copyable.
    AuthStateMachine(const AuthStateMachine&) = delete;
    AuthStateMachine& operator=(const AuthStateMachine&) = delete;

    /// Parameters sent automatically when the backend asks for them.
    void set_parameters(const TdlibParameters& params);

    AuthState state() const;
    bool is_ready() const { return state() == AuthState::ready; }

    /// Apply a backend authorization state.  Returns true if the local state
    /// changed; disallowed jumps are logged and ignored.
    bool on_authorization_update(AuthorizationState backend_state);

    // Fire-and-forget.  Return false without contacting the backend when the
    // machine is not waiting for that input.
    bool submit_phone_number(const std::string& phone);
    bool submit_code(const std::string& code);
    bool submit_second_factor(const std::string& password);

    /// Ask the backend to end the session.  Returns false if already closed.
    bool log_out();

    EventChannel<AuthStateChanged>& state_changes() { return state_changes_; }
    EventChannel<AuthStepFailed>&   step_failures() { return step_failures_; }

    /// Local state for a backend state.
    static AuthState map_backend_state(AuthorizationState backend_state);

    /// Whether `from -> to` is a legal transition.
    static bool is_allowed(AuthState from, AuthState to);

private:
    /// Move to `to` if allowed and publish the change.
    bool transition(AuthState to);

    bool submit(AuthState expected, AuthStep step,
                const std::function<void(Completion)>& request);

    /// Completion that reports failures on the control executor.
    Completion step_completion(AuthStep step);

    TransportClient& transport_;
    Executor&        control_;

    mutable std::mutex             mu_;
    AuthState                      state_ = AuthState::uninitialized;
    std::optional<TdlibParameters> params_;

    EventChannel<AuthStateChanged> state_changes_;
    EventChannel<AuthStepFailed>   step_failures_;
};

} // namespace vd
