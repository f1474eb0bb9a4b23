#include "AuthSession.hpp"

#include "Log.hpp"

namespace vd {

AuthStateMachine::AuthStateMachine(TransportClient& transport, Executor& control)
    : transport_(transport), control_(control) {}

void AuthStateMachine::set_parameters(const TdlibParameters& params) {
    std::lock_guard<std::mutex> lock(mu_);
    params_ = params;
}

AuthState AuthStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

// ---------------------------------------------------------------------------
// Transition table
// ---------------------------------------------------------------------------

AuthState AuthStateMachine::map_backend_state(AuthorizationState backend_state) {
    switch (backend_state) {
        case AuthorizationState::wait_parameters:   return AuthState::uninitialized;
        case AuthorizationState::wait_phone_number: return AuthState::awaiting_phone_number;
        case AuthorizationState::wait_code:         return AuthState::awaiting_code;
        case AuthorizationState::wait_password:     return AuthState::awaiting_second_factor;
        case AuthorizationState::ready:             return AuthState::ready;
        case AuthorizationState::logging_out:
        case AuthorizationState::closing:
        case AuthorizationState::closed:            return AuthState::closed;
    }
    return AuthState::closed;
}

bool AuthStateMachine::is_allowed(AuthState from, AuthState to) {
    if (from == AuthState::closed) return false;
    if (to == AuthState::closed) return true;

    switch (from) {
        case AuthState::uninitialized:
            return true;                // a restored session may jump to ready
        case AuthState::awaiting_phone_number:
            return to == AuthState::awaiting_code;
        case AuthState::awaiting_code:
            return to == AuthState::awaiting_second_factor
                || to == AuthState::ready
                || to == AuthState::awaiting_phone_number;
        case AuthState::awaiting_second_factor:
            return to == AuthState::ready
                || to == AuthState::awaiting_phone_number;
        case AuthState::ready:
        case AuthState::closed:
            return false;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Backend updates
// ---------------------------------------------------------------------------

bool AuthStateMachine::on_authorization_update(AuthorizationState backend_state) {
    bool changed = transition(map_backend_state(backend_state));

    if (backend_state == AuthorizationState::wait_parameters) {
        std::optional<TdlibParameters> params;
        {
            std::lock_guard<std::mutex> lock(mu_);
            params = params_;
        }
        if (params) {
            transport_.set_parameters(*params, step_completion(AuthStep::parameters));
        } else {
            Logger::warn("auth: backend wants parameters but none were configured");
        }
    }
    return changed;
}

bool AuthStateMachine::transition(AuthState to) {
    AuthStateChanged change;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ == to) return false;
        if (!is_allowed(state_, to)) {
            Logger::warn(std::string("auth: ignoring transition ")
                         + auth_state_to_string(state_) + " -> " + auth_state_to_string(to));
            return false;
        }
        change.from = state_;
        change.to   = to;
        state_      = to;
    }
    Logger::info(std::string("auth: ") + auth_state_to_string(change.from)
                 + " -> " + auth_state_to_string(change.to));
    state_changes_.publish(change);
    return true;
}

// ---------------------------------------------------------------------------
// Submissions
// ---------------------------------------------------------------------------

bool AuthStateMachine::submit_phone_number(const std::string& phone) {
    return submit(AuthState::awaiting_phone_number, AuthStep::phone_number,
                  [this, phone](Completion done) {
                      transport_.submit_phone_number(phone, std::move(done));
                  });
}

bool AuthStateMachine::submit_code(const std::string& code) {
    return submit(AuthState::awaiting_code, AuthStep::code,
                  [this, code](Completion done) {
                      transport_.submit_code(code, std::move(done));
                  });
}

bool AuthStateMachine::submit_second_factor(const std::string& password) {
    return submit(AuthState::awaiting_second_factor, AuthStep::second_factor,
                  [this, password](Completion done) {
                      transport_.submit_second_factor(password, std::move(done));
                  });
}

bool AuthStateMachine::log_out() {
    if (state() == AuthState::closed) return false;
    Logger::info("auth: logging out");
    transport_.log_out(step_completion(AuthStep::log_out));
    return true;
}

bool AuthStateMachine::submit(AuthState expected, AuthStep step,
                              const std::function<void(Completion)>& request) {
    AuthState current = state();
    if (current != expected) {
        Logger::warn(std::string("auth: ") + auth_step_to_string(step)
                     + " submitted while " + auth_state_to_string(current));
        return false;
    }
    request(step_completion(step));
    return true;
}

Completion AuthStateMachine::step_completion(AuthStep step) {
    return [this, step](const std::optional<TransportError>& error) {
        if (!error) return;
        AuthStepFailed failure{step, error->code, error->message};
        control_.post([this, failure] {
            Logger::warn(std::string("auth: ") + auth_step_to_string(failure.step)
                         + " rejected: " + failure.reason);
            step_failures_.publish(failure);
        });
    };
}

} // namespace vd
