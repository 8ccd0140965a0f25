#include "max_client.hpp"

#include <exception>
#include <set>

#include <boost/asio/redirect_error.hpp>
#include <fmt/core.h>

#include "errors.hpp"
#include "log.hpp"
#include "ws_transport.hpp"

namespace maxwire {

using nlohmann::json;

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

auto epoch_ms() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

auto int_field(const json& j, const char* key) -> std::optional<std::int64_t> {
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto it = j.find(key);
    if (it != j.end() && it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    return std::nullopt;
}

/// Records carried by a push: `{key: [...]}`, `{singular: {...}}` or the bare record.
auto records(const json& payload, const char* plural, const char* singular) -> std::vector<json> {
    std::vector<json> out;
    if (auto it = payload.find(plural); it != payload.end() && it->is_array()) {
        for (const auto& item : *it) {
            if (item.is_object()) {
                out.push_back(item);
            }
        }
    } else if (auto one = payload.find(singular); one != payload.end() && one->is_object()) {
        out.push_back(*one);
    } else if (payload.is_object() && payload.contains("id")) {
        out.push_back(payload);
    }
    return out;
}

}  // namespace


// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTION
// ═══════════════════════════════════════════════════════════════════════════

MaxClient::MaxClient(asio::io_context& ioc, svckit::ClientConfig config, TransportFactory factory)
    : ioc_{ioc}
    , strand_{asio::make_strand(ioc)}
    , config_{std::move(config)}
    , factory_{factory ? std::move(factory) : WsTransport::factory(config_.tls())}
    , session_{config_.session_path()}
    , correlator_{strand_}
    , auth_{config_, correlator_, session_, dispatcher_}
    , backoff_{config_.retry()}
    , backoff_timer_{strand_}
    , disconnect_signal_{strand_}
    , connect_signal_{strand_}
{}

MaxClient::~MaxClient() {
    if (transport_) {
        transport_->close();
    }
    if (dialing_) {
        dialing_->close();
    }
    if (code_provider_) {
        code_provider_->cancel();
    }
    MAXWIRE_LOG_D("client", "destroyed");
}

void MaxClient::set_code_provider(std::shared_ptr<CodeProvider> provider) {
    code_provider_ = std::move(provider);
}

auto MaxClient::handshake_headers(const Session& session) const -> Headers {
    return {
        {"User-Agent", session.user_agent},
        {"Origin", config_.origin()},
    };
}


// ═══════════════════════════════════════════════════════════════════════════
// CONNECTION
// ═══════════════════════════════════════════════════════════════════════════

auto MaxClient::connect() -> asio::awaitable<void> {
    if (connecting_) {
        co_await wait_for_connect();
        co_return;
    }
    if (connected_.load() && transport_) {
        co_return;
    }
    if (stopped_.load()) {
        throw protocol::ConnectionClosed{"client stopped"};
    }

    // Later callers park on connect_signal_ until this attempt settles.
    connecting_ = true;
    connect_error_ = nullptr;
    connect_signal_.expires_at(asio::steady_timer::time_point::max());

    std::exception_ptr failure;
    try {
        co_await open_connection();
    } catch (const std::exception&) {
        failure = std::current_exception();
    }

    connecting_ = false;
    connect_error_ = failure;
    connect_signal_.cancel();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

auto MaxClient::wait_for_connect() -> asio::awaitable<void> {
    MAXWIRE_LOG_D("client", "connect already in progress, waiting for it");
    boost::system::error_code ec;
    while (connecting_) {
        co_await connect_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    if (connect_error_) {
        std::rethrow_exception(connect_error_);
    }
    if (!connected_.load(std::memory_order_acquire) || !transport_) {
        throw protocol::ConnectionClosed{"connection closed before it was ready"};
    }
}

auto MaxClient::open_connection() -> asio::awaitable<void> {
    session_.load_or_create(config_.device());
    auto session = session_.snapshot();
    correlator_.set_protocol_version(session.protocol_version);

    MAXWIRE_LOG_I("client", "connecting to {}", config_.endpoint().ws_url());
    auto transport = factory_(strand_);
    dialing_ = transport;
    std::exception_ptr dial_failure;
    try {
        co_await transport->connect(config_.endpoint(), handshake_headers(session));
    } catch (const std::exception&) {
        dial_failure = std::current_exception();
    }
    dialing_.reset();
    if (dial_failure) {
        transport->close();
        std::rethrow_exception(dial_failure);
    }

    if (stopped_.load()) {
        transport->close();
        throw protocol::ConnectionClosed{"client stopped"};
    }

    transport_ = transport;
    correlator_.attach(transport);
    connected_.store(true, std::memory_order_release);

    asio::co_spawn(strand_, read_loop(transport),
        [self = shared_from_this()](std::exception_ptr e) {
            if (!e) {
                return;
            }
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                MAXWIRE_LOG_E("client", "read loop failed: {}", ex.what());
            }
        });

    json hello = {
        {"userAgent", session.user_agent_payload()},
        {"deviceId", session.device_id},
    };
    try {
        co_await call(config_.opcodes().session_init, std::move(hello));
    } catch (const std::exception& e) {
        MAXWIRE_LOG_W("client", "session init failed: {}", e.what());
        close_connection();
        throw;
    }
    MAXWIRE_LOG_D("client", "session initialised (device {})", session.device_id);
}

auto MaxClient::read_loop(std::shared_ptr<Transport> transport) -> asio::awaitable<void> {
    auto self = shared_from_this();
    std::size_t decode_errors = 0;

    try {
        while (true) {
            auto text = co_await transport->receive();
            if (!text) {
                MAXWIRE_LOG_I("client", "connection closed");
                break;
            }

            protocol::Frame frame;
            try {
                frame = protocol::decode(*text);
                decode_errors = 0;
            } catch (const protocol::DecodeError& e) {
                MAXWIRE_LOG_W("codec", "dropping frame: {}", e.what());
                if (++decode_errors >= config_.max_consecutive_decode_errors()) {
                    MAXWIRE_LOG_E("client", "{} consecutive undecodable frames, closing", decode_errors);
                    break;
                }
                continue;
            }
            MAXWIRE_LOG_T("codec", "<- {}", protocol::describe(frame));

            std::visit(overloaded{
                [this](protocol::Response& response) {
                    correlator_.resolve(std::move(response));
                },
                [this](protocol::Request& request) {
                    handle_push(protocol::Push{request.opcode, std::move(request.payload), request.seq});
                },
                [this](protocol::Push& push) {
                    handle_push(std::move(push));
                },
            }, frame);
        }
    } catch (const protocol::TransportError& e) {
        MAXWIRE_LOG_W("transport", "connection lost: {}", e.what());
    }

    on_disconnected(transport);
}

void MaxClient::on_disconnected(const std::shared_ptr<Transport>& transport) {
    transport->close();
    if (transport_ != transport) {
        return;
    }

    transport_.reset();
    correlator_.detach();
    connected_.store(false, std::memory_order_release);
    correlator_.fail_all();
    disconnect_signal_.cancel();
}

void MaxClient::close_connection() {
    if (auto transport = transport_) {
        on_disconnected(transport);
    }
}


// ═══════════════════════════════════════════════════════════════════════════
// START / RUN / STOP
// ═══════════════════════════════════════════════════════════════════════════

auto MaxClient::start() -> asio::awaitable<void> {
    auto self = shared_from_this();
    session_.load_or_create(config_.device());
    co_await connect();

    try {
        auto login = co_await authenticate();
        co_await initial_sync(login);
    } catch (const std::exception& e) {
        MAXWIRE_LOG_W("client", "start failed: {}", e.what());
        close_connection();
        throw;
    }

    MAXWIRE_LOG_I("client", "ready ({} chats)", cache_.chats().size());
    dispatcher_.emit(events::kReady);
}

auto MaxClient::run() -> asio::awaitable<void> {
    auto self = shared_from_this();
    running_.store(true, std::memory_order_release);
    std::size_t failures = 0;

    while (running_.load(std::memory_order_acquire)) {
        bool online = false;
        try {
            co_await start();
            online = true;
            failures = 0;
        } catch (const protocol::AuthError& e) {
            MAXWIRE_LOG_E("client", "authentication failed: {}", e.what());
            running_.store(false, std::memory_order_release);
            throw;
        } catch (const std::exception& e) {
            if (!running_.load(std::memory_order_acquire)) {
                break;
            }
            MAXWIRE_LOG_W("client", "connection attempt {} failed: {}", failures + 1, e.what());
        }

        if (online) {
            co_await wait_for_disconnect();
            if (!running_.load(std::memory_order_acquire)) {
                break;
            }
            MAXWIRE_LOG_W("client", "disconnected, reconnecting");
        } else if (backoff_.exhausted(++failures)) {
            running_.store(false, std::memory_order_release);
            throw protocol::TransportError{fmt::format("giving up after {} failed attempts", failures)};
        }

        auto delay = backoff_.delay_for(online ? 0 : failures - 1);
        MAXWIRE_LOG_I("client", "reconnecting in {}ms", delay.count());
        backoff_timer_.expires_after(delay);
        boost::system::error_code ec;
        co_await backoff_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

    MAXWIRE_LOG_I("client", "stopped");
}

auto MaxClient::wait_for_disconnect() -> asio::awaitable<void> {
    boost::system::error_code ec;
    while (connected_.load(std::memory_order_acquire) && running_.load(std::memory_order_acquire)) {
        disconnect_signal_.expires_at(asio::steady_timer::time_point::max());
        co_await disconnect_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

void MaxClient::stop() {
    running_.store(false, std::memory_order_release);
    asio::dispatch(strand_, [self = shared_from_this()] { self->shutdown(); });
}

void MaxClient::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    MAXWIRE_LOG_I("client", "stopping");
    backoff_timer_.cancel();
    if (code_provider_) {
        code_provider_->cancel();
    }
    if (dialing_) {
        dialing_->close();
    }
    close_connection();
    correlator_.fail_all();
    disconnect_signal_.cancel();
    dispatcher_.stop();
}


// ═══════════════════════════════════════════════════════════════════════════
// AUTHENTICATION
// ═══════════════════════════════════════════════════════════════════════════

auto MaxClient::authenticate() -> asio::awaitable<json> {
    auto session = session_.snapshot();

    if (session.token) {
        bool token_rejected = false;
        try {
            co_return co_await auth_.resume(*session.token);
        } catch (const protocol::RateLimitError&) {
            throw;
        } catch (const protocol::AuthError&) {
            if (!std::holds_alternative<auth_state::ReauthRequired>(auth_.state())) {
                throw;
            }
            token_rejected = true;
        }
        if (token_rejected) {
            MAXWIRE_LOG_W("client", "stored token rejected, falling back to interactive login");
        }
    }

    auto token = co_await interactive_login();
    co_return co_await auth_.resume(std::move(token));
}

auto MaxClient::interactive_login() -> asio::awaitable<std::string> {
    auto phone = config_.phone() ? config_.phone() : session_.snapshot().phone;
    if (!phone || phone->empty()) {
        throw protocol::AuthError{"no session token and no phone number to log in with"};
    }
    if (!code_provider_) {
        throw protocol::AuthError{"no session token and no code provider for interactive login"};
    }

    co_await auth_.begin_auth(*phone);

    std::optional<std::string> previous_error;
    for (std::size_t attempt = 1; attempt <= config_.max_code_attempts(); ++attempt) {
        std::string code;
        std::exception_ptr provider_failure;
        try {
            CodeRequest request{*phone, attempt, previous_error};
            code = co_await code_provider_->provide_code(request);
        } catch (const std::exception&) {
            provider_failure = std::current_exception();
        }
        if (stopped_.load()) {
            throw protocol::ConnectionClosed{"client stopped while waiting for a verification code"};
        }
        if (provider_failure) {
            std::rethrow_exception(provider_failure);
        }

        try {
            co_return co_await auth_.submit_code(std::move(code));
        } catch (const protocol::RateLimitError&) {
            throw;
        } catch (const protocol::AuthError& e) {
            MAXWIRE_LOG_W("client", "code attempt {}/{} rejected", attempt, config_.max_code_attempts());
            previous_error = e.what();
        }
    }
    throw protocol::AuthError{fmt::format("verification code rejected {} times", config_.max_code_attempts())};
}

auto MaxClient::begin_auth(std::string phone) -> asio::awaitable<void> {
    auto self = shared_from_this();
    co_await connect();
    co_await auth_.begin_auth(std::move(phone));
}

auto MaxClient::submit_code(std::string code) -> asio::awaitable<std::string> {
    auto self = shared_from_this();
    co_await connect();
    co_return co_await auth_.submit_code(std::move(code));
}


// ═══════════════════════════════════════════════════════════════════════════
// INITIAL SYNC
// ═══════════════════════════════════════════════════════════════════════════

auto MaxClient::initial_sync(const json& login) -> asio::awaitable<void> {
    if (auto profile = login.find("profile"); profile != login.end() && profile->is_object()) {
        auto me = user_from_json(*profile);
        cache_.set_current_user(me);
        MAXWIRE_LOG_I("client", "logged in as {} ({})", display_name(me), me.id);
    }

    if (auto chats = login.find("chats"); chats != login.end() && chats->is_array()) {
        for (const auto& entry : *chats) {
            if (entry.is_object()) {
                cache_.upsert(chat_from_json(entry));
            }
        }
    }

    // Saved-messages chat (id 0) arrives as a stub in the login payload.
    if (cache_.get_chat(0)) {
        try {
            std::vector<std::int64_t> saved_chat_ids = {0};
            co_await fetch_chats(std::move(saved_chat_ids));
        } catch (const protocol::Error& e) {
            MAXWIRE_LOG_W("client", "refreshing chat 0 failed: {}", e.what());
        }
    }

    std::set<std::int64_t> contact_ids;
    if (auto me = cache_.current_user()) {
        contact_ids.insert(me->id);
    }
    for (const auto& chat : cache_.chats()) {
        contact_ids.insert(chat.participants.begin(), chat.participants.end());
    }

    std::vector<std::int64_t> ids;
    for (auto id : contact_ids) {
        if (ids.size() >= config_.contacts_sync_limit()) {
            break;
        }
        ids.push_back(id);
    }
    if (ids.empty()) {
        co_return;
    }

    try {
        co_await fetch_contacts(std::move(ids));
    } catch (const protocol::Error& e) {
        MAXWIRE_LOG_W("client", "contact sync failed: {}", e.what());
    }
}


// ═══════════════════════════════════════════════════════════════════════════
// REQUESTS
// ═══════════════════════════════════════════════════════════════════════════

auto MaxClient::call(int opcode, json payload) -> asio::awaitable<json> {
    co_return co_await call(opcode, std::move(payload), config_.call_timeout());
}

auto MaxClient::call(int opcode, json payload, Duration timeout) -> asio::awaitable<json> {
    auto self = shared_from_this();
    try {
        co_return co_await correlator_.call(opcode, std::move(payload), timeout);
    } catch (const protocol::ServerError& e) {
        if (auth_.is_token_rejection(e)) {
            auth_.on_token_rejected();
        }
        throw;
    }
}

auto MaxClient::post_message(std::int64_t chat_id, json message) -> asio::awaitable<Message> {
    const auto cid = epoch_ms();
    message["cid"] = cid;

    json payload = {
        {"chatId", chat_id},
        {"message", message},
        {"notify", true},
    };
    auto reply = co_await call(config_.opcodes().send_message, std::move(payload));

    Message sent;
    if (auto it = reply.find("message"); it != reply.end() && it->is_object()) {
        sent = message_from_json(*it, int_field(reply, "chatId").value_or(chat_id));
    } else {
        sent.chat_id = chat_id;
        sent.timestamp = cid;
        if (auto text = message.find("text"); text != message.end() && text->is_string()) {
            sent.text = text->get<std::string>();
        }
        if (auto attaches = message.find("attaches"); attaches != message.end()) {
            sent.attachments = *attaches;
        }
        if (auto me = cache_.current_user()) {
            sent.sender_id = me->id;
        }
    }

    if (!sent.id.empty()) {
        cache_.set_last_message(sent.chat_id, sent.id);
    }
    dispatcher_.emit(events::kMessageSent, sent);
    co_return sent;
}

auto MaxClient::send_message(std::int64_t chat_id, std::string text,
                             std::optional<std::string> reply_to) -> asio::awaitable<Message> {
    json message = {
        {"text", std::move(text)},
        {"elements", json::array()},
        {"attaches", json::array()},
    };
    if (reply_to) {
        message["replyTo"] = *reply_to;
    }
    co_return co_await post_message(chat_id, std::move(message));
}

auto MaxClient::send_sticker(std::int64_t chat_id, std::int64_t sticker_id,
                             std::optional<std::string> reply_to) -> asio::awaitable<Message> {
    json message = {
        {"attaches", json::array({{{"_type", "STICKER"}, {"stickerId", sticker_id}}})},
    };
    if (reply_to) {
        message["replyTo"] = *reply_to;
    }
    co_return co_await post_message(chat_id, std::move(message));
}

auto MaxClient::edit_message(std::int64_t chat_id, std::string message_id, std::string text)
    -> asio::awaitable<void>
{
    json payload = {
        {"chatId", chat_id},
        {"messageId", std::move(message_id)},
        {"text", std::move(text)},
    };
    co_await call(config_.opcodes().edit_message, std::move(payload));
}

auto MaxClient::delete_message(std::int64_t chat_id, std::string message_id) -> asio::awaitable<void> {
    json payload = {
        {"chatId", chat_id},
        {"messageId", std::move(message_id)},
    };
    co_await call(config_.opcodes().delete_message, std::move(payload));
}

auto MaxClient::send_reaction(std::int64_t chat_id, std::string message_id, std::string reaction)
    -> asio::awaitable<void>
{
    json payload = {
        {"chatId", chat_id},
        {"messageId", std::move(message_id)},
        {"reaction", {{"reactionType", "EMOJI"}, {"id", std::move(reaction)}}},
    };
    co_await call(config_.opcodes().reaction, std::move(payload));
}

auto MaxClient::fetch_chats(std::vector<std::int64_t> chat_ids) -> asio::awaitable<std::vector<Chat>> {
    json payload = {{"chatIds", std::move(chat_ids)}};
    auto reply = co_await call(config_.opcodes().chats, std::move(payload));

    std::vector<Chat> chats;
    if (auto it = reply.find("chats"); it != reply.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (!entry.is_object()) {
                continue;
            }
            auto chat = chat_from_json(entry);
            cache_.upsert(chat);
            chats.push_back(std::move(chat));
        }
    }
    co_return chats;
}

auto MaxClient::fetch_contacts(std::vector<std::int64_t> contact_ids) -> asio::awaitable<std::vector<User>> {
    json payload = {{"contactIds", std::move(contact_ids)}};
    auto reply = co_await call(config_.opcodes().contacts, std::move(payload));

    std::vector<User> users;
    if (auto it = reply.find("contacts"); it != reply.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (!entry.is_object()) {
                continue;
            }
            auto user = user_from_json(entry);
            cache_.upsert(user);
            users.push_back(std::move(user));
        }
    }
    MAXWIRE_LOG_D("cache", "synced {} contact(s)", users.size());
    dispatcher_.emit(events::kContactsUpdate, users);
    co_return users;
}


// ═══════════════════════════════════════════════════════════════════════════
// PUSH HANDLING
// ═══════════════════════════════════════════════════════════════════════════

void MaxClient::handle_push(protocol::Push push) {
    const auto& ops = config_.opcodes();

    try {
        if (push.opcode == ops.new_message) {
            auto chat_id = int_field(push.payload, "chatId");
            auto it = push.payload.find("message");
            if (!chat_id || it == push.payload.end() || !it->is_object()) {
                MAXWIRE_LOG_W("client", "new-message push without chatId/message");
                return;
            }
            auto message = message_from_json(*it, *chat_id);
            if (!message.id.empty()) {
                cache_.set_last_message(message.chat_id, message.id);
            }
            dispatcher_.emit(events::kNewMessage, std::move(message));
            return;
        }

        if (ops.contact_patch && push.opcode == *ops.contact_patch) {
            std::vector<User> users;
            for (const auto& record : records(push.payload, "contacts", "contact")) {
                users.push_back(cache_.merge_user(record));
            }
            if (!users.empty()) {
                dispatcher_.emit(events::kContactsUpdate, std::move(users));
            }
            return;
        }

        if (ops.chat_patch && push.opcode == *ops.chat_patch) {
            for (const auto& record : records(push.payload, "chats", "chat")) {
                cache_.merge_chat(record);
            }
            return;
        }
    } catch (const protocol::ProtocolError& e) {
        MAXWIRE_LOG_W("client", "malformed push opcode={}: {}", push.opcode, e.what());
        return;
    }

    MAXWIRE_LOG_D("client", "unhandled push opcode={}", push.opcode);
    dispatcher_.emit(events::kPush, std::move(push));
}


// ═══════════════════════════════════════════════════════════════════════════
// EVENTS & ACCESSORS
// ═══════════════════════════════════════════════════════════════════════════

void MaxClient::on(const std::string& name, std::shared_ptr<EventHandler> handler) {
    dispatcher_.on(name, std::move(handler));
}

auto MaxClient::on(const std::string& name, FunctionHandler::Callback callback)
    -> std::shared_ptr<EventHandler>
{
    return dispatcher_.on(name, std::move(callback));
}

auto MaxClient::off(const std::string& name, const std::shared_ptr<EventHandler>& handler) -> bool {
    return dispatcher_.off(name, handler);
}

void MaxClient::emit(std::string name, EventPayload payload) {
    dispatcher_.emit(std::move(name), std::move(payload));
}

auto MaxClient::wait_idle(Duration timeout) -> bool {
    return dispatcher_.wait_idle(timeout);
}

auto MaxClient::get_chat(std::int64_t id) const -> std::optional<Chat> {
    return cache_.get_chat(id);
}

auto MaxClient::get_user(std::int64_t id) const -> std::optional<User> {
    return cache_.get_user(id);
}

auto MaxClient::get_entity(std::int64_t id) const -> std::optional<Entity> {
    if (auto chat = cache_.get_chat(id)) {
        return Entity{std::move(*chat)};
    }
    if (auto user = cache_.get_user(id)) {
        return Entity{std::move(*user)};
    }
    return std::nullopt;
}

auto MaxClient::current_user() const -> std::optional<User> {
    return cache_.current_user();
}

auto MaxClient::current_session() const -> Session {
    return session_.snapshot();
}

auto MaxClient::auth_state() const -> AuthState {
    return auth_.state();
}

}  // namespace maxwire
