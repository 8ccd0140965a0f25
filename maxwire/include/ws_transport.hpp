#pragma once

/// @file ws_transport.hpp
/// @brief Boost.Beast WebSocket transport, plain or over TLS.

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "client_config.hpp"
#include "transport.hpp"

namespace maxwire {

namespace beast = boost::beast;
namespace ssl = asio::ssl;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;


// ═══════════════════════════════════════════════════════════════════════════
// WsTransport — One WebSocket Connection
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
//
// This class manages unique resources:
// • SSL context (OpenSSL state, shared with nobody)
// • The socket, owned by exactly one of the two stream pointers
//
// DECISION: Non-copyable, non-movable (inherited from Transport)
// • Always created through factory() and held by std::shared_ptr
// • Destructor closes the socket if still open
//
// ═══════════════════════════════════════════════════════════════════════════

/// WebSocket transport over `beast::tcp_stream`, optionally TLS-wrapped.
///
/// @par Thread Safety
/// All operations must run on the executor the transport was created with
/// (the client's strand). Writes are serialized internally so one
/// outstanding `async_write` is never overlapped by another.
///
/// @par Example
/// @code
/// auto factory = WsTransport::factory(svckit::TlsConfig::from_env());
/// auto transport = factory(strand);
/// co_await transport->connect(endpoint, {{"Origin", "https://web.max.ru"}});
/// @endcode
class WsTransport final : public Transport {
public:
    using PlainStream = websocket::stream<beast::tcp_stream>;
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    /// Timeout for resolve, TCP connect and TLS handshake together.
    static constexpr std::chrono::seconds kConnectTimeout{30};

    WsTransport(asio::any_io_executor executor, svckit::TlsConfig tls);
    ~WsTransport() override;

    /// Factory producing a new WsTransport per connection attempt.
    [[nodiscard]] static auto factory(svckit::TlsConfig tls) -> TransportFactory;

    auto connect(const svckit::Endpoint& endpoint, const Headers& headers)
        -> asio::awaitable<void> override;
    auto send(std::string text) -> asio::awaitable<void> override;
    auto receive() -> asio::awaitable<std::optional<std::string>> override;
    void close() noexcept override;

private:
    template<typename Stream>
    auto handshake(Stream& ws, const svckit::Endpoint& endpoint, const Headers& headers)
        -> asio::awaitable<void>;

    template<typename Stream>
    auto write(Stream& ws, const std::string& text) -> asio::awaitable<void>;

    template<typename Stream>
    auto read(Stream& ws) -> asio::awaitable<std::optional<std::string>>;

    auto make_ssl_context() const -> std::unique_ptr<ssl::context>;

    asio::any_io_executor executor_;
    svckit::TlsConfig tls_;
    std::unique_ptr<ssl::context> ssl_ctx_;

    /// Exactly one of these is set after a successful connect().
    std::unique_ptr<PlainStream> plain_;
    std::unique_ptr<TlsStream> secure_;

    /// Wakes writers waiting for the in-flight write to finish.
    asio::steady_timer write_gate_;
    bool writing_{false};

    std::atomic<bool> open_{false};
    std::atomic<bool> closed_{false};
};

}  // namespace maxwire
