#include "auth.hpp"

#include <utility>

#include <fmt/core.h>

#include "log.hpp"

namespace maxwire {

using nlohmann::json;
using namespace auth_state;

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

auto epoch_ms() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

auto error_details(const protocol::ServerError& error) -> json {
    return {
        {"error", error.code()},
        {"message", error.server_message()},
        {"localizedMessage", error.localized_message()},
    };
}

}  // namespace


auto to_string(const AuthState& state) noexcept -> std::string_view {
    return std::visit(overloaded{
        [](const Unauthenticated&) -> std::string_view { return "unauthenticated"; },
        [](const CodeRequested&)   -> std::string_view { return "code_requested"; },
        [](const Verifying&)       -> std::string_view { return "verifying"; },
        [](const Authenticated&)   -> std::string_view { return "authenticated"; },
        [](const ReauthRequired&)  -> std::string_view { return "reauth_required"; },
        [](const RateLimited&)     -> std::string_view { return "rate_limited"; },
    }, state);
}


// ───────────────────────────────────────────────────────────────────────────
// BusyGuard — one auth exchange at a time
// ───────────────────────────────────────────────────────────────────────────

class AuthStateMachine::BusyGuard {
public:
    explicit BusyGuard(std::atomic<bool>& busy)
        : busy_{busy}
    {
        if (busy_.exchange(true)) {
            throw protocol::AuthError{"another auth operation is in progress"};
        }
    }

    ~BusyGuard() { busy_.store(false); }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    std::atomic<bool>& busy_;
};


AuthStateMachine::AuthStateMachine(const svckit::ClientConfig& config,
                                   Correlator& correlator,
                                   SessionKeeper& session,
                                   EventDispatcher& dispatcher)
    : config_{config}
    , correlator_{correlator}
    , session_{session}
    , dispatcher_{dispatcher}
{}


// ═══════════════════════════════════════════════════════════════════════════
// STATE
// ═══════════════════════════════════════════════════════════════════════════

auto AuthStateMachine::state() const -> AuthState {
    std::lock_guard lock{mutex_};
    return state_;
}

auto AuthStateMachine::authenticated() const -> bool {
    std::lock_guard lock{mutex_};
    return std::holds_alternative<Authenticated>(state_);
}

void AuthStateMachine::set_state(AuthState next) {
    std::lock_guard lock{mutex_};
    if (state_.index() != next.index()) {
        MAXWIRE_LOG_D("auth", "{} -> {}", to_string(state_), to_string(next));
    }
    state_ = std::move(next);
}

void AuthStateMachine::check_rate_limit() const {
    std::lock_guard lock{mutex_};
    if (const auto* limited = std::get_if<RateLimited>(&state_)) {
        if (std::chrono::system_clock::now() < limited->until) {
            throw protocol::RateLimitError{"auth attempts are rate limited", limited->until};
        }
    }
}

void AuthStateMachine::enter_rate_limit(const protocol::ServerError& error,
                                        std::optional<std::string> request_id) {
    auto until = std::chrono::system_clock::now() + config_.rate_limit_cooldown();
    set_state(RateLimited{until, std::move(request_id)});
    MAXWIRE_LOG_W("auth", "rate limited: {}", error.localized_message());
    dispatcher_.emit(events::kAuthLimitExceeded, error.payload());
    throw protocol::RateLimitError{error.localized_message().empty()
                                       ? std::string{"auth attempts are rate limited"}
                                       : error.localized_message(),
                                   until};
}

auto AuthStateMachine::is_token_rejection(const protocol::ServerError& error) const -> bool {
    return config_.auth_codes().is_token_rejection(error.code(), error.server_message());
}

void AuthStateMachine::on_token_rejected() {
    MAXWIRE_LOG_W("auth", "session token rejected, re-authentication required");
    set_state(ReauthRequired{});
    session_.set_token(std::nullopt);
    dispatcher_.emit(events::kAuthRequired);
}


// ═══════════════════════════════════════════════════════════════════════════
// BEGIN AUTH
// ═══════════════════════════════════════════════════════════════════════════

auto AuthStateMachine::begin_auth(std::string phone) -> asio::awaitable<void> {
    BusyGuard guard{busy_};
    check_rate_limit();

    {
        std::lock_guard lock{mutex_};
        if (std::holds_alternative<Verifying>(state_) || std::holds_alternative<Authenticated>(state_)) {
            throw protocol::AuthError{fmt::format("cannot begin auth while {}", to_string(state_))};
        }
    }

    auto session = session_.snapshot();
    json payload = {
        {"phone", phone},
        {"type", "START_AUTH"},
        {"language", session.locale},
    };

    MAXWIRE_LOG_I("auth", "requesting verification code");
    json reply;
    try {
        reply = co_await correlator_.call(config_.opcodes().auth_request, std::move(payload),
                                          config_.auth_timeout());
    } catch (const protocol::ServerError& e) {
        if (config_.auth_codes().is_rate_limit(e.code())) {
            enter_rate_limit(e, std::nullopt);
        }
        throw protocol::AuthError{"phone rejected: " + e.localized_message(), e.code()};
    }

    auto it = reply.find("token");
    if (it == reply.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw protocol::AuthError{"auth response carried no request id"};
    }

    set_state(CodeRequested{it->get<std::string>()});
    session_.set_phone(std::move(phone));

    if (config_.navigation_events()) {
        co_await send_navigation_events();
    }
}

auto AuthStateMachine::send_navigation_events() -> asio::awaitable<void> {
    auto now = epoch_ms();
    json payload = {
        {"events", json::array({
            {{"type", "COLD_START"}, {"time", now}},
            {{"type", "GO"}, {"page", 1}, {"time", now}},
        })},
    };

    try {
        co_await correlator_.notify(config_.opcodes().events, std::move(payload));
        MAXWIRE_LOG_D("auth", "navigation events sent");
    } catch (const protocol::Error& e) {
        MAXWIRE_LOG_W("auth", "navigation events not sent: {}", e.what());
    }
}


// ═══════════════════════════════════════════════════════════════════════════
// SUBMIT CODE
// ═══════════════════════════════════════════════════════════════════════════

auto AuthStateMachine::submit_code(std::string code) -> asio::awaitable<std::string> {
    BusyGuard guard{busy_};
    check_rate_limit();

    std::string request_id;
    {
        std::lock_guard lock{mutex_};
        if (const auto* requested = std::get_if<CodeRequested>(&state_)) {
            request_id = requested->request_id;
        } else if (const auto* limited = std::get_if<RateLimited>(&state_); limited && limited->request_id) {
            request_id = *limited->request_id;
        } else {
            throw protocol::AuthError{fmt::format("no verification code requested ({})", to_string(state_))};
        }
    }

    set_state(Verifying{request_id});
    json payload = {
        {"token", request_id},
        {"verifyCode", std::move(code)},
        {"authTokenType", "CHECK_CODE"},
    };

    json reply;
    try {
        reply = co_await correlator_.call(config_.opcodes().check_code, std::move(payload),
                                          config_.auth_timeout());
    } catch (const protocol::ServerError& e) {
        if (config_.auth_codes().is_rate_limit(e.code())) {
            enter_rate_limit(e, request_id);
        }
        set_state(CodeRequested{request_id});
        MAXWIRE_LOG_W("auth", "code rejected: {}", e.localized_message());
        dispatcher_.emit(events::kAuthCodeError, error_details(e));
        throw protocol::AuthError{"code rejected: " + e.localized_message(), e.code()};
    } catch (const std::exception&) {
        set_state(CodeRequested{request_id});
        throw;
    }

    const auto token_ptr = json::json_pointer{"/tokenAttrs/LOGIN/token"};
    if (!reply.contains(token_ptr) || !reply.at(token_ptr).is_string()) {
        set_state(CodeRequested{request_id});
        throw protocol::AuthError{"code accepted but no login token returned"};
    }

    auto token = reply.at(token_ptr).get<std::string>();
    set_state(Authenticated{token});
    session_.set_token(token);
    MAXWIRE_LOG_I("auth", "code accepted, token stored");
    co_return token;
}


// ═══════════════════════════════════════════════════════════════════════════
// RESUME
// ═══════════════════════════════════════════════════════════════════════════

auto AuthStateMachine::resume(std::string token) -> asio::awaitable<json> {
    BusyGuard guard{busy_};

    json payload = {
        {"interactive", false},
        {"token", token},
        {"chatsCount", config_.chats_count()},
        {"chatsSync", 0},
        {"contactsSync", 0},
        {"presenceSync", 0},
        {"draftsSync", 0},
    };

    json reply;
    try {
        reply = co_await correlator_.call(config_.opcodes().login, std::move(payload),
                                          config_.auth_timeout());
    } catch (const protocol::ServerError& e) {
        if (is_token_rejection(e)) {
            on_token_rejected();
            throw protocol::AuthError{"session token rejected", e.code()};
        }
        if (config_.auth_codes().is_rate_limit(e.code())) {
            enter_rate_limit(e, std::nullopt);
        }
        throw protocol::AuthError{"login failed: " + e.localized_message(), e.code()};
    }

    set_state(Authenticated{token});
    session_.set_token(std::move(token));
    MAXWIRE_LOG_I("auth", "logged in with stored token");
    co_return reply;
}

}  // namespace maxwire
