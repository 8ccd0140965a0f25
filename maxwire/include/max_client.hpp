#pragma once

/// @file max_client.hpp
/// @brief Connection supervisor and public facade of the maxwire driver.
///
/// Demonstrates:
/// - Private constructor + perfect forwarding factory
/// - Asio awaitable coroutines on a single strand
/// - Reconnect loop driven by ReconnectBackoff

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "auth.hpp"
#include "client_config.hpp"
#include "code_provider.hpp"
#include "correlator.hpp"
#include "entities.hpp"
#include "entity_cache.hpp"
#include "event_dispatcher.hpp"
#include "protocol.hpp"
#include "retry.hpp"
#include "session_store.hpp"
#include "transport.hpp"

namespace maxwire {

// ═══════════════════════════════════════════════════════════════════════════
// MaxClient — Shared Resource Class
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
//
// This class manages unique resources:
// • The live Transport and the read loop coroutine holding it
// • Timers bound to the client strand
// • The handler worker thread (inside EventDispatcher)
//
// DECISION: Non-copyable, non-movable, always held by std::shared_ptr
// • Coroutines keep the client alive through shared_from_this()
// • Members hold references to each other (auth → correlator, session)
//
// ═══════════════════════════════════════════════════════════════════════════

/// MAX messenger client: connection, login, cache and events.
///
/// @par Threading
/// Every coroutine of the client runs on executor(), a strand. Callers on
/// other threads start work with
/// `asio::co_spawn(client->executor(), client->call(...), asio::use_future)`.
/// Event handlers run on a separate worker thread.
///
/// @par Example
/// @code
/// auto client = MaxClient::create(ioc, svckit::ClientConfig::from_env());
/// client->on(events::kNewMessage, [](const Event& ev) {
///     const auto& msg = std::get<Message>(ev.payload);
///     fmt::print("{}: {}\n", msg.chat_id, msg.text);
/// });
/// asio::co_spawn(client->executor(), client->run(), asio::detached);
/// ioc.run();
/// @endcode
class MaxClient : public std::enable_shared_from_this<MaxClient> {
public:
    using Duration = std::chrono::milliseconds;
    using Entity = std::variant<Chat, User>;

    // ───────────────────────────────────────────────────────────────────────
    // RULE OF SIX: Non-Copyable, Non-Movable
    // ───────────────────────────────────────────────────────────────────────

    MaxClient() = delete;
    ~MaxClient();
    MaxClient(const MaxClient&) = delete;
    MaxClient& operator=(const MaxClient&) = delete;
    MaxClient(MaxClient&&) = delete;
    MaxClient& operator=(MaxClient&&) = delete;

    // ───────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ───────────────────────────────────────────────────────────────────────

    /// Create client with perfect forwarding.
    ///
    /// Accepts (io_context&, ClientConfig) and optionally a
    /// TransportFactory; the default factory opens WsTransport instances.
    template<typename... Args>
    [[nodiscard]] static auto create(Args&&... args) -> std::shared_ptr<MaxClient> {
        return std::shared_ptr<MaxClient>(new MaxClient(std::forward<Args>(args)...));
    }

    void set_code_provider(std::shared_ptr<CodeProvider> provider);

    // ───────────────────────────────────────────────────────────────────────
    // Life Cycle
    // ───────────────────────────────────────────────────────────────────────

    /// Open a connection and send the session-init frame.
    /// No-op while already connected. A call made while another connect is
    /// in flight waits for that attempt and shares its outcome.
    auto connect() -> asio::awaitable<void>;

    /// Connect, authenticate, sync and emit `ready`.
    /// Any failure closes the connection and propagates.
    auto start() -> asio::awaitable<void>;

    /// start() and keep the client online, reconnecting with backoff.
    /// Returns after stop(); throws AuthError or when the attempt budget
    /// is exhausted.
    auto run() -> asio::awaitable<void>;

    /// Close everything. Safe from any thread, including event handlers.
    /// Cancels an outstanding verification-code request through
    /// CodeProvider::cancel().
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto is_connected() const noexcept -> bool {
        return connected_.load(std::memory_order_acquire);
    }

    // ───────────────────────────────────────────────────────────────────────
    // Requests
    // ───────────────────────────────────────────────────────────────────────

    /// Raw request with the configured call timeout.
    auto call(int opcode, nlohmann::json payload) -> asio::awaitable<nlohmann::json>;
    auto call(int opcode, nlohmann::json payload, Duration timeout) -> asio::awaitable<nlohmann::json>;

    /// Interactive login steps, connecting first if needed.
    auto begin_auth(std::string phone) -> asio::awaitable<void>;
    auto submit_code(std::string code) -> asio::awaitable<std::string>;

    auto send_message(std::int64_t chat_id, std::string text,
                      std::optional<std::string> reply_to = std::nullopt) -> asio::awaitable<Message>;
    auto send_sticker(std::int64_t chat_id, std::int64_t sticker_id,
                      std::optional<std::string> reply_to = std::nullopt) -> asio::awaitable<Message>;
    auto edit_message(std::int64_t chat_id, std::string message_id, std::string text) -> asio::awaitable<void>;
    auto delete_message(std::int64_t chat_id, std::string message_id) -> asio::awaitable<void>;
    auto send_reaction(std::int64_t chat_id, std::string message_id,
                       std::string reaction = "\xF0\x9F\x91\x8D") -> asio::awaitable<void>;

    /// Fetch and cache chats / contacts by id.
    auto fetch_chats(std::vector<std::int64_t> chat_ids) -> asio::awaitable<std::vector<Chat>>;
    auto fetch_contacts(std::vector<std::int64_t> contact_ids) -> asio::awaitable<std::vector<User>>;

    // ───────────────────────────────────────────────────────────────────────
    // Events
    // ───────────────────────────────────────────────────────────────────────

    void on(const std::string& name, std::shared_ptr<EventHandler> handler);
    auto on(const std::string& name, FunctionHandler::Callback callback) -> std::shared_ptr<EventHandler>;
    auto off(const std::string& name, const std::shared_ptr<EventHandler>& handler) -> bool;
    void emit(std::string name, EventPayload payload = {});

    /// Wait until queued events have been handled.
    auto wait_idle(Duration timeout) -> bool;

    // ───────────────────────────────────────────────────────────────────────
    // Accessors
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] auto get_chat(std::int64_t id) const -> std::optional<Chat>;
    [[nodiscard]] auto get_user(std::int64_t id) const -> std::optional<User>;

    /// Chat with this id, else user with this id.
    [[nodiscard]] auto get_entity(std::int64_t id) const -> std::optional<Entity>;

    [[nodiscard]] auto current_user() const -> std::optional<User>;
    [[nodiscard]] auto cache() const noexcept -> const EntityCache& { return cache_; }
    [[nodiscard]] auto current_session() const -> Session;
    [[nodiscard]] auto auth_state() const -> AuthState;
    [[nodiscard]] auto config() const noexcept -> const svckit::ClientConfig& { return config_; }
    [[nodiscard]] auto executor() const -> asio::any_io_executor { return strand_; }

    /// Requests currently waiting for a response.
    [[nodiscard]] auto pending_requests() const -> std::size_t { return correlator_.pending_count(); }

private:
    // ───────────────────────────────────────────────────────────────────────
    // Private Constructor (use factory)
    // ───────────────────────────────────────────────────────────────────────

    MaxClient(asio::io_context& ioc, svckit::ClientConfig config, TransportFactory factory = {});

    // ───────────────────────────────────────────────────────────────────────
    // Coroutine Handlers
    // ───────────────────────────────────────────────────────────────────────

    auto open_connection() -> asio::awaitable<void>;
    auto wait_for_connect() -> asio::awaitable<void>;
    auto read_loop(std::shared_ptr<Transport> transport) -> asio::awaitable<void>;
    auto authenticate() -> asio::awaitable<nlohmann::json>;
    auto interactive_login() -> asio::awaitable<std::string>;
    auto initial_sync(const nlohmann::json& login) -> asio::awaitable<void>;
    auto post_message(std::int64_t chat_id, nlohmann::json message) -> asio::awaitable<Message>;
    auto wait_for_disconnect() -> asio::awaitable<void>;

    void handle_push(protocol::Push push);
    void on_disconnected(const std::shared_ptr<Transport>& transport);
    void close_connection();
    void shutdown();

    [[nodiscard]] auto handshake_headers(const Session& session) const -> Headers;

    // ───────────────────────────────────────────────────────────────────────
    // Member Data
    // ───────────────────────────────────────────────────────────────────────

    /// Reference to io_context (not owned).
    asio::io_context& ioc_;

    /// All connection work is serialized here.
    asio::strand<asio::io_context::executor_type> strand_;

    svckit::ClientConfig config_;
    TransportFactory factory_;

    SessionKeeper session_;
    EventDispatcher dispatcher_;
    EntityCache cache_;
    Correlator correlator_;
    AuthStateMachine auth_;
    protocol::retry::ReconnectBackoff backoff_;

    asio::steady_timer backoff_timer_;
    asio::steady_timer disconnect_signal_;
    asio::steady_timer connect_signal_;

    std::shared_ptr<Transport> transport_;

    /// Transport still inside connect(); stop() closes it.
    std::shared_ptr<Transport> dialing_;
    std::shared_ptr<CodeProvider> code_provider_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> stopped_{false};

    // Strand-only.
    bool connecting_{false};
    std::exception_ptr connect_error_;
};

}  // namespace maxwire
