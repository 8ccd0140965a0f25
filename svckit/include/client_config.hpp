#pragma once

/// @file client_config.hpp
/// @brief Endpoint, TLS and driver configuration value classes.
///
/// Everything the server protocol does not pin down (opcodes, timeouts,
/// backoff bounds, device identity defaults) lives here with a documented
/// default, so a deployment can correct it without touching code.

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "opcodes.hpp"
#include "protocol.hpp"
#include "retry.hpp"

namespace svckit {

using namespace std::chrono_literals;


// ═══════════════════════════════════════════════════════════════════════════
// TlsConfig — Trivial Class Pattern (All Default)
// ═══════════════════════════════════════════════════════════════════════════

/// TLS peer verification settings.
class TlsConfig {
public:
    TlsConfig() = default;
    ~TlsConfig() = default;
    TlsConfig(const TlsConfig&) = default;
    TlsConfig& operator=(const TlsConfig&) = default;
    TlsConfig(TlsConfig&&) noexcept = default;
    TlsConfig& operator=(TlsConfig&&) noexcept = default;

    explicit TlsConfig(std::filesystem::path ca, bool verify = true)
        : ca_file{std::move(ca)}
        , verify_peer{verify}
    {}

    /// Create TLS config from the environment.
    /// CERT_PATH names a directory holding `ca.pem`; without it the system
    /// trust store is used.
    [[nodiscard]] static auto from_env() -> TlsConfig {
        TlsConfig tls;
        if (const char* env = std::getenv("CERT_PATH"); env && *env) {
            tls.ca_file = std::filesystem::path{env} / "ca.pem";
        }
        if (const char* env = std::getenv("MAXWIRE_TLS_VERIFY"); env && std::string_view{env} == "0") {
            tls.verify_peer = false;
        }
        return tls;
    }

    /// Extra CA bundle; empty uses the default verify paths.
    std::filesystem::path ca_file;

    bool verify_peer{true};
};


// ═══════════════════════════════════════════════════════════════════════════
// ProtocolHint — Enum Class
// ═══════════════════════════════════════════════════════════════════════════

/// WebSocket scheme.
enum class ProtocolHint : std::uint8_t {
    Wss,  ///< Secure WebSocket (TLS)
    Ws    ///< Plain WebSocket
};

[[nodiscard]] constexpr auto to_string(ProtocolHint hint) noexcept
    -> std::string_view
{
    switch (hint) {
        case ProtocolHint::Wss: return "wss";
        case ProtocolHint::Ws:  return "ws";
    }
    return "wss";
}


// ═══════════════════════════════════════════════════════════════════════════
// Endpoint — Parsed WebSocket URL
// ═══════════════════════════════════════════════════════════════════════════

/// Host, port, target and scheme of the WebSocket server.
///
/// @par Example Usage
/// @code
/// auto ep = Endpoint::parse("wss://ws-api.oneme.ru/websocket");
/// ep.host();    // "ws-api.oneme.ru"
/// ep.port();    // 443
/// ep.target();  // "/websocket"
/// @endcode
class Endpoint {
public:
    Endpoint() = default;

    Endpoint(std::string host, std::uint16_t port, std::string target, ProtocolHint hint)
        : host_{std::move(host)}
        , port_{port}
        , target_{std::move(target)}
        , protocol_hint_{hint}
    {}

    /// Parse `ws://` or `wss://` URLs.
    /// @throws std::invalid_argument on any other scheme or a bad port.
    [[nodiscard]] static auto parse(std::string_view url) -> Endpoint {
        ProtocolHint hint;
        if (url.starts_with("wss://")) {
            hint = ProtocolHint::Wss;
            url.remove_prefix(6);
        } else if (url.starts_with("ws://")) {
            hint = ProtocolHint::Ws;
            url.remove_prefix(5);
        } else {
            throw std::invalid_argument{"unsupported WebSocket URL: " + std::string{url}};
        }

        auto slash = url.find('/');
        std::string target = slash == std::string_view::npos ? "/" : std::string{url.substr(slash)};
        auto authority = url.substr(0, slash);

        std::uint16_t port = hint == ProtocolHint::Wss ? 443 : 80;
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            auto digits = std::string{authority.substr(colon + 1)};
            int value = 0;
            try {
                value = std::stoi(digits);
            } catch (const std::exception&) {
                throw std::invalid_argument{"bad port in WebSocket URL: " + digits};
            }
            if (value <= 0 || value > 65535) {
                throw std::invalid_argument{"port out of range: " + digits};
            }
            port = static_cast<std::uint16_t>(value);
            authority = authority.substr(0, colon);
        }
        if (authority.empty()) {
            throw std::invalid_argument{"WebSocket URL has no host"};
        }
        return Endpoint{std::string{authority}, port, std::move(target), hint};
    }

    [[nodiscard]] auto host() const noexcept -> const std::string& { return host_; }
    [[nodiscard]] auto port() const noexcept -> std::uint16_t { return port_; }
    [[nodiscard]] auto target() const noexcept -> const std::string& { return target_; }
    [[nodiscard]] auto protocol_hint() const noexcept -> ProtocolHint { return protocol_hint_; }
    [[nodiscard]] auto use_tls() const noexcept -> bool { return protocol_hint_ == ProtocolHint::Wss; }

    /// Full WebSocket URL.
    [[nodiscard]] auto ws_url() const -> std::string {
        return std::string{to_string(protocol_hint_)} + "://" +
               host_ + ":" + std::to_string(port_) + target_;
    }

    /// Value of the HTTP Host header.
    [[nodiscard]] auto host_header() const -> std::string {
        return host_ + ":" + std::to_string(port_);
    }

private:
    std::string host_;
    std::uint16_t port_{443};
    std::string target_{"/"};
    ProtocolHint protocol_hint_{ProtocolHint::Wss};
};


// ═══════════════════════════════════════════════════════════════════════════
// DeviceProfile — Defaults for a Freshly Created Session
// ═══════════════════════════════════════════════════════════════════════════

/// Device description presented to the server on first run.
struct DeviceProfile {
    std::string user_agent{
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) "
        "AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/142.0.0.0 Safari/537.36"};
    std::string app_version{"25.12.3"};
    std::string device_type{"ANDROID"};
    std::string locale{"ru"};
    std::string device_locale{"ru"};
    std::string os_version{"Windows"};
    std::string device_name{"Chrome"};
    std::string screen{"1080x1920 1.0x"};
    std::string timezone{"Europe/Moscow"};
    int protocol_version{protocol::kDefaultProtocolVersion};
};


// ═══════════════════════════════════════════════════════════════════════════
// ClientConfig — Driver Configuration with Builder Methods
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Strings, paths, durations and small aggregates only
// • Compiler-generated operations are correct
//
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr std::string_view kDefaultUrl = "wss://ws-api.oneme.ru/websocket";
inline constexpr std::string_view kDefaultOrigin = "https://web.max.ru";
inline constexpr std::string_view kDefaultSessionPath = "session.maxwire";

/// Complete configuration of one client instance.
///
/// @par Example Usage
/// @code
/// auto cfg = ClientConfig::from_env()
///                .with_session_path("state/alice.json")
///                .with_call_timeout(5s);
/// @endcode
class ClientConfig {
public:
    using Duration = std::chrono::milliseconds;

    ClientConfig() = default;
    ~ClientConfig() = default;
    ClientConfig(const ClientConfig&) = default;
    ClientConfig& operator=(const ClientConfig&) = default;
    ClientConfig(ClientConfig&&) noexcept = default;
    ClientConfig& operator=(ClientConfig&&) noexcept = default;

    /// Defaults overridden by MAXWIRE_URL, MAXWIRE_SESSION, MAXWIRE_ORIGIN,
    /// CERT_PATH and MAXWIRE_TLS_VERIFY.
    [[nodiscard]] static auto from_env() -> ClientConfig {
        ClientConfig cfg;
        if (const char* env = std::getenv("MAXWIRE_URL"); env && *env) {
            cfg.endpoint_ = Endpoint::parse(env);
        }
        if (const char* env = std::getenv("MAXWIRE_SESSION"); env && *env) {
            cfg.session_path_ = env;
        }
        if (const char* env = std::getenv("MAXWIRE_ORIGIN"); env && *env) {
            cfg.origin_ = env;
        }
        cfg.tls_ = TlsConfig::from_env();
        return cfg;
    }

    // ───────────────────────────────────────────────────────────────────────
    // Builder Methods (Fluent Interface)
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] auto with_url(std::string_view url) && -> ClientConfig {
        endpoint_ = Endpoint::parse(url);
        return std::move(*this);
    }

    [[nodiscard]] auto with_tls(TlsConfig tls) && -> ClientConfig {
        tls_ = std::move(tls);
        return std::move(*this);
    }

    [[nodiscard]] auto with_origin(std::string origin) && -> ClientConfig {
        origin_ = std::move(origin);
        return std::move(*this);
    }

    [[nodiscard]] auto with_session_path(std::filesystem::path path) && -> ClientConfig {
        session_path_ = std::move(path);
        return std::move(*this);
    }

    [[nodiscard]] auto with_device(DeviceProfile device) && -> ClientConfig {
        device_ = std::move(device);
        return std::move(*this);
    }

    [[nodiscard]] auto with_call_timeout(Duration d) && -> ClientConfig {
        call_timeout_ = d;
        return std::move(*this);
    }

    [[nodiscard]] auto with_auth_timeout(Duration d) && -> ClientConfig {
        auth_timeout_ = d;
        return std::move(*this);
    }

    [[nodiscard]] auto with_retry(protocol::retry::BackoffConfig retry) && -> ClientConfig {
        retry_ = retry;
        return std::move(*this);
    }

    [[nodiscard]] auto with_opcodes(protocol::OpcodeTable opcodes) && -> ClientConfig {
        opcodes_ = std::move(opcodes);
        return std::move(*this);
    }

    [[nodiscard]] auto with_auth_codes(protocol::AuthErrorCodes codes) && -> ClientConfig {
        auth_codes_ = std::move(codes);
        return std::move(*this);
    }

    [[nodiscard]] auto with_phone(std::string phone) && -> ClientConfig {
        phone_ = std::move(phone);
        return std::move(*this);
    }

    [[nodiscard]] auto with_max_code_attempts(std::size_t n) && -> ClientConfig {
        max_code_attempts_ = n;
        return std::move(*this);
    }

    [[nodiscard]] auto with_rate_limit_cooldown(Duration d) && -> ClientConfig {
        rate_limit_cooldown_ = d;
        return std::move(*this);
    }

    [[nodiscard]] auto with_chats_count(int n) && -> ClientConfig {
        chats_count_ = n;
        return std::move(*this);
    }

    [[nodiscard]] auto with_contacts_sync_limit(std::size_t n) && -> ClientConfig {
        contacts_sync_limit_ = n;
        return std::move(*this);
    }

    [[nodiscard]] auto with_max_consecutive_decode_errors(std::size_t n) && -> ClientConfig {
        max_consecutive_decode_errors_ = n;
        return std::move(*this);
    }

    [[nodiscard]] auto with_navigation_events(bool enabled) && -> ClientConfig {
        navigation_events_ = enabled;
        return std::move(*this);
    }

    // ───────────────────────────────────────────────────────────────────────
    // Accessors
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] auto endpoint() const noexcept -> const Endpoint& { return endpoint_; }
    [[nodiscard]] auto tls() const noexcept -> const TlsConfig& { return tls_; }
    [[nodiscard]] auto origin() const noexcept -> const std::string& { return origin_; }
    [[nodiscard]] auto session_path() const noexcept -> const std::filesystem::path& { return session_path_; }
    [[nodiscard]] auto device() const noexcept -> const DeviceProfile& { return device_; }
    [[nodiscard]] auto call_timeout() const noexcept -> Duration { return call_timeout_; }
    [[nodiscard]] auto auth_timeout() const noexcept -> Duration { return auth_timeout_; }
    [[nodiscard]] auto retry() const noexcept -> const protocol::retry::BackoffConfig& { return retry_; }
    [[nodiscard]] auto opcodes() const noexcept -> const protocol::OpcodeTable& { return opcodes_; }
    [[nodiscard]] auto auth_codes() const noexcept -> const protocol::AuthErrorCodes& { return auth_codes_; }
    [[nodiscard]] auto phone() const noexcept -> const std::optional<std::string>& { return phone_; }
    [[nodiscard]] auto max_code_attempts() const noexcept -> std::size_t { return max_code_attempts_; }
    [[nodiscard]] auto rate_limit_cooldown() const noexcept -> Duration { return rate_limit_cooldown_; }
    [[nodiscard]] auto chats_count() const noexcept -> int { return chats_count_; }
    [[nodiscard]] auto contacts_sync_limit() const noexcept -> std::size_t { return contacts_sync_limit_; }
    [[nodiscard]] auto max_consecutive_decode_errors() const noexcept -> std::size_t {
        return max_consecutive_decode_errors_;
    }
    [[nodiscard]] auto navigation_events() const noexcept -> bool { return navigation_events_; }

private:
    Endpoint endpoint_{Endpoint::parse(kDefaultUrl)};
    TlsConfig tls_;
    std::string origin_{kDefaultOrigin};
    std::filesystem::path session_path_{kDefaultSessionPath};
    DeviceProfile device_;
    Duration call_timeout_{10s};
    Duration auth_timeout_{60s};
    protocol::retry::BackoffConfig retry_;
    protocol::OpcodeTable opcodes_;
    protocol::AuthErrorCodes auth_codes_;
    std::optional<std::string> phone_;
    std::size_t max_code_attempts_{3};
    Duration rate_limit_cooldown_{60s};
    int chats_count_{40};
    std::size_t contacts_sync_limit_{50};
    std::size_t max_consecutive_decode_errors_{16};
    bool navigation_events_{true};
};

}  // namespace svckit
