#pragma once

/// @file transport.hpp
/// @brief Abstract message-oriented duplex transport.
///
/// One Transport instance carries exactly one connection. The supervisor
/// asks its TransportFactory for a fresh instance on every connection
/// attempt, which also lets tests substitute a scripted socket.

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "client_config.hpp"

namespace maxwire {

namespace asio = boost::asio;

/// HTTP headers for the WebSocket upgrade request.
using Headers = std::map<std::string, std::string>;


// ═══════════════════════════════════════════════════════════════════════════
// Transport — Abstract Interface
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Polymorphic base, always owned through std::shared_ptr
// • Copy and move are deleted so an open socket is never sliced
//
// ═══════════════════════════════════════════════════════════════════════════

class Transport {
public:
    Transport() = default;
    virtual ~Transport() = default;
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;
    Transport(Transport&&) = delete;
    Transport& operator=(Transport&&) = delete;

    /// Open the connection and complete the WebSocket handshake.
    /// @throws protocol::ConnectError on DNS, TCP, TLS or upgrade failure.
    virtual auto connect(const svckit::Endpoint& endpoint, const Headers& headers)
        -> asio::awaitable<void> = 0;

    /// Send one text frame. Concurrent senders are serialized.
    /// @throws protocol::SendError if the connection is closed or fails.
    virtual auto send(std::string text) -> asio::awaitable<void> = 0;

    /// Next inbound text frame; std::nullopt once the peer closed cleanly.
    /// @throws protocol::TransportError on any other failure.
    virtual auto receive() -> asio::awaitable<std::optional<std::string>> = 0;

    /// Tear the connection down. Safe to call repeatedly and from any state.
    virtual void close() noexcept = 0;
};

/// Produces a fresh Transport bound to the given executor.
using TransportFactory = std::function<std::shared_ptr<Transport>(asio::any_io_executor)>;

}  // namespace maxwire
