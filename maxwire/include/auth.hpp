#pragma once

/// @file auth.hpp
/// @brief Phone/code login and token resume as an explicit state machine.
///
/// @par States
/// @code
///                 begin_auth             submit_code
/// Unauthenticated ──────────► CodeRequested ──────────► Verifying
///        ▲                        ▲    │ code rejected      │ ok
///        │                        └────┴────────────────────┤
///        │        token rejected                            ▼
/// ReauthRequired ◄────────────────────────────────── Authenticated
///
/// any state ── rate-limit error ──► RateLimited{until} ── after until ──► retry
/// @endcode

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "client_config.hpp"
#include "correlator.hpp"
#include "errors.hpp"
#include "event_dispatcher.hpp"
#include "session_store.hpp"

namespace maxwire {

// ═══════════════════════════════════════════════════════════════════════════
// AuthState — Closed Set of States
// ═══════════════════════════════════════════════════════════════════════════

namespace auth_state {

struct Unauthenticated {};

struct CodeRequested {
    std::string request_id;
};

struct Verifying {
    std::string request_id;
};

struct Authenticated {
    std::string token;
};

struct ReauthRequired {};

struct RateLimited {
    std::chrono::system_clock::time_point until;
    std::optional<std::string> request_id;
};

}  // namespace auth_state

using AuthState = std::variant<
    auth_state::Unauthenticated,
    auth_state::CodeRequested,
    auth_state::Verifying,
    auth_state::Authenticated,
    auth_state::ReauthRequired,
    auth_state::RateLimited>;

[[nodiscard]] auto to_string(const AuthState& state) noexcept -> std::string_view;


// ═══════════════════════════════════════════════════════════════════════════
// AuthStateMachine
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Holds references to collaborators owned by the client
// • Non-copyable, non-movable; lives exactly as long as its client
//
// ═══════════════════════════════════════════════════════════════════════════

/// Serializes authentication exchanges and owns the AuthState.
///
/// Only one operation may be in flight; a concurrent call throws AuthError
/// immediately. Timeouts and lost connections propagate unchanged and leave
/// the state where it was before the call.
class AuthStateMachine {
public:
    AuthStateMachine(const svckit::ClientConfig& config,
                     Correlator& correlator,
                     SessionKeeper& session,
                     EventDispatcher& dispatcher);

    AuthStateMachine(const AuthStateMachine&) = delete;
    AuthStateMachine& operator=(const AuthStateMachine&) = delete;

    /// Request an SMS code for @p phone.
    /// @throws protocol::RateLimitError while throttled
    /// @throws protocol::AuthError if the server refused or the state forbids it
    auto begin_auth(std::string phone) -> asio::awaitable<void>;

    /// Verify @p code; on success the new token is persisted and returned.
    /// @throws protocol::AuthError if the code was rejected or none was requested
    auto submit_code(std::string code) -> asio::awaitable<std::string>;

    /// Log in with a stored token. Returns the login payload
    /// (profile, chats, ...).
    /// @throws protocol::AuthError if the token was rejected
    auto resume(std::string token) -> asio::awaitable<nlohmann::json>;

    /// Drop the token and move to ReauthRequired; emits `auth_required`.
    void on_token_rejected();

    /// True if @p error means the session token is no longer valid.
    [[nodiscard]] auto is_token_rejection(const protocol::ServerError& error) const -> bool;

    [[nodiscard]] auto state() const -> AuthState;
    [[nodiscard]] auto authenticated() const -> bool;

private:
    class BusyGuard;

    void set_state(AuthState next);

    /// Throw RateLimitError if still inside a cooldown window.
    void check_rate_limit() const;

    /// Map a rate-limit ServerError to RateLimited + event + exception.
    [[noreturn]] void enter_rate_limit(const protocol::ServerError& error,
                                       std::optional<std::string> request_id);

    auto send_navigation_events() -> asio::awaitable<void>;

    const svckit::ClientConfig& config_;
    Correlator& correlator_;
    SessionKeeper& session_;
    EventDispatcher& dispatcher_;

    mutable std::mutex mutex_;
    AuthState state_{auth_state::Unauthenticated{}};
    std::atomic<bool> busy_{false};
};

}  // namespace maxwire
