#include "ws_transport.hpp"

#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <openssl/ssl.h>

#include "errors.hpp"
#include "log.hpp"

namespace maxwire {

// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTION
// ═══════════════════════════════════════════════════════════════════════════

WsTransport::WsTransport(asio::any_io_executor executor, svckit::TlsConfig tls)
    : executor_{std::move(executor)}
    , tls_{std::move(tls)}
    , write_gate_{executor_}
{}

WsTransport::~WsTransport() {
    close();
}

auto WsTransport::factory(svckit::TlsConfig tls) -> TransportFactory {
    return [tls = std::move(tls)](asio::any_io_executor executor) -> std::shared_ptr<Transport> {
        return std::make_shared<WsTransport>(std::move(executor), tls);
    };
}

auto WsTransport::make_ssl_context() const -> std::unique_ptr<ssl::context> {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    if (!tls_.verify_peer) {
        ctx->set_verify_mode(ssl::verify_none);
        return ctx;
    }

    ctx->set_verify_mode(ssl::verify_peer);
    if (!tls_.ca_file.empty()) {
        ctx->load_verify_file(tls_.ca_file.string());
    } else {
        ctx->set_default_verify_paths();
    }
    return ctx;
}


// ═══════════════════════════════════════════════════════════════════════════
// CONNECT
// ═══════════════════════════════════════════════════════════════════════════

auto WsTransport::connect(const svckit::Endpoint& endpoint, const Headers& headers)
    -> asio::awaitable<void>
{
    if (open_.load() || closed_.load()) {
        throw protocol::ConnectError{"transport is not reusable"};
    }

    try {
        tcp::resolver resolver{executor_};
        auto results = co_await resolver.async_resolve(
            endpoint.host(),
            std::to_string(endpoint.port()),
            asio::use_awaitable
        );

        if (endpoint.use_tls()) {
            ssl_ctx_ = make_ssl_context();
            secure_ = std::make_unique<TlsStream>(executor_, *ssl_ctx_);

            auto& tcp_layer = beast::get_lowest_layer(*secure_);
            tcp_layer.expires_after(kConnectTimeout);
            co_await tcp_layer.async_connect(results, asio::use_awaitable);

            // SNI; most virtual-hosted endpoints reject the handshake without it.
            if (!SSL_set_tlsext_host_name(secure_->next_layer().native_handle(),
                                          endpoint.host().c_str())) {
                throw protocol::ConnectError{"failed to set TLS server name"};
            }
            if (tls_.verify_peer) {
                secure_->next_layer().set_verify_callback(
                    ssl::host_name_verification(endpoint.host()));
            }

            co_await secure_->next_layer().async_handshake(
                ssl::stream_base::client,
                asio::use_awaitable
            );
            co_await handshake(*secure_, endpoint, headers);
        } else {
            plain_ = std::make_unique<PlainStream>(executor_);

            auto& tcp_layer = beast::get_lowest_layer(*plain_);
            tcp_layer.expires_after(kConnectTimeout);
            co_await tcp_layer.async_connect(results, asio::use_awaitable);
            co_await handshake(*plain_, endpoint, headers);
        }
    } catch (const boost::system::system_error& e) {
        close();
        throw protocol::ConnectError{"connect to " + endpoint.ws_url() + " failed: " + e.code().message()};
    }

    if (closed_.load()) {
        throw protocol::ConnectError{"transport closed during connect"};
    }
    open_.store(true);
    MAXWIRE_LOG_I("transport", "connected to {}", endpoint.ws_url());
}

template<typename Stream>
auto WsTransport::handshake(Stream& ws, const svckit::Endpoint& endpoint, const Headers& headers)
    -> asio::awaitable<void>
{
    // The websocket layer has its own keepalive/idle timeouts from here on.
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator(
        [headers](websocket::request_type& req) {
            for (const auto& [name, value] : headers) {
                req.set(name, value);
            }
        }));
    ws.text(true);

    co_await ws.async_handshake(endpoint.host_header(), endpoint.target(), asio::use_awaitable);
}


// ═══════════════════════════════════════════════════════════════════════════
// SEND
// ═══════════════════════════════════════════════════════════════════════════

auto WsTransport::send(std::string text) -> asio::awaitable<void> {
    if (!open_.load() || closed_.load()) {
        throw protocol::SendError{"send on a closed transport"};
    }
    if (secure_) {
        co_await write(*secure_, text);
    } else {
        co_await write(*plain_, text);
    }
}

template<typename Stream>
auto WsTransport::write(Stream& ws, const std::string& text) -> asio::awaitable<void> {
    boost::system::error_code ec;

    // Only one async_write may be outstanding on a websocket stream.
    while (writing_) {
        write_gate_.expires_at(asio::steady_timer::time_point::max());
        co_await write_gate_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (closed_.load()) {
            throw protocol::SendError{"transport closed while waiting to send"};
        }
    }

    writing_ = true;
    co_await ws.async_write(asio::buffer(text), asio::redirect_error(asio::use_awaitable, ec));
    writing_ = false;
    write_gate_.cancel();

    if (ec) {
        throw protocol::SendError{"send failed: " + ec.message()};
    }
    MAXWIRE_LOG_T("transport", "sent {} bytes", text.size());
}


// ═══════════════════════════════════════════════════════════════════════════
// RECEIVE
// ═══════════════════════════════════════════════════════════════════════════

auto WsTransport::receive() -> asio::awaitable<std::optional<std::string>> {
    if (!open_.load() || closed_.load()) {
        co_return std::nullopt;
    }
    if (secure_) {
        co_return co_await read(*secure_);
    }
    co_return co_await read(*plain_);
}

template<typename Stream>
auto WsTransport::read(Stream& ws) -> asio::awaitable<std::optional<std::string>> {
    beast::flat_buffer buffer;
    boost::system::error_code ec;
    co_await ws.async_read(buffer, asio::redirect_error(asio::use_awaitable, ec));

    if (ec == websocket::error::closed) {
        MAXWIRE_LOG_I("transport", "peer closed the connection ({})", ws.reason().reason.c_str());
        co_return std::nullopt;
    }
    if (ec) {
        if (closed_.load()) {
            co_return std::nullopt;
        }
        throw protocol::TransportError{"read failed: " + ec.message()};
    }
    co_return beast::buffers_to_string(buffer.data());
}


// ═══════════════════════════════════════════════════════════════════════════
// CLOSE
// ═══════════════════════════════════════════════════════════════════════════

void WsTransport::close() noexcept {
    if (closed_.exchange(true)) {
        return;
    }

    // Closing the lowest layer aborts every pending read and write.
    boost::system::error_code ec;
    if (secure_) {
        beast::get_lowest_layer(*secure_).socket().close(ec);
    }
    if (plain_) {
        beast::get_lowest_layer(*plain_).socket().close(ec);
    }
    write_gate_.cancel();

    if (open_.exchange(false)) {
        MAXWIRE_LOG_D("transport", "closed");
    }
}

}  // namespace maxwire
