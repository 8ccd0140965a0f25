#pragma once

/// @file errors.hpp
/// @brief Exception taxonomy shared by every maxwire layer.
///
/// Transport-level failures are recovered by the connection supervisor.
/// Request-level failures reach the caller of the request that caused them.

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace protocol {

// ═══════════════════════════════════════════════════════════════════════════
// Error — Root of the Hierarchy
// ═══════════════════════════════════════════════════════════════════════════

/// Base class for every error raised by the driver.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};


// ───────────────────────────────────────────────────────────────────────────
// Transport
// ───────────────────────────────────────────────────────────────────────────

/// Socket-level failure. Triggers a reconnect when seen by the supervisor.
class TransportError : public Error {
public:
    using Error::Error;
};

/// DNS, TCP, TLS or WebSocket handshake failure.
class ConnectError : public TransportError {
public:
    using TransportError::TransportError;
};

/// Write attempted on a closed or failed socket.
class SendError : public TransportError {
public:
    using TransportError::TransportError;
};

/// The connection went away while a request was waiting for its response.
class ConnectionClosed : public Error {
public:
    ConnectionClosed()
        : Error{"connection closed"}
    {}

    using Error::Error;
};


// ───────────────────────────────────────────────────────────────────────────
// Protocol
// ───────────────────────────────────────────────────────────────────────────

/// Malformed frame. Logged and dropped by the read loop.
class ProtocolError : public Error {
public:
    using Error::Error;
};

/// Envelope could not be decoded.
class DecodeError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};


// ───────────────────────────────────────────────────────────────────────────
// Correlation
// ───────────────────────────────────────────────────────────────────────────

/// No response arrived for a request within its timeout.
class CorrelationTimeout : public Error {
public:
    CorrelationTimeout(std::uint64_t seq, int opcode)
        : Error{"request seq=" + std::to_string(seq) +
                " opcode=" + std::to_string(opcode) + " timed out"}
        , seq_{seq}
        , opcode_{opcode}
    {}

    [[nodiscard]] auto seq() const noexcept -> std::uint64_t { return seq_; }
    [[nodiscard]] auto opcode() const noexcept -> int { return opcode_; }

private:
    std::uint64_t seq_;
    int opcode_;
};

/// Server answered with a non-ok status.
///
/// The error payload conventionally carries `error`, `message` and
/// `localizedMessage`; all three are optional.
class ServerError : public Error {
public:
    ServerError(int status, int opcode, nlohmann::json payload)
        : Error{describe(status, opcode, payload)}
        , status_{status}
        , opcode_{opcode}
        , code_{string_field(payload, "error")}
        , server_message_{string_field(payload, "message")}
        , localized_message_{string_field(payload, "localizedMessage")}
        , payload_{std::move(payload)}
    {}

    [[nodiscard]] auto status() const noexcept -> int { return status_; }
    [[nodiscard]] auto opcode() const noexcept -> int { return opcode_; }
    [[nodiscard]] auto code() const noexcept -> const std::string& { return code_; }
    [[nodiscard]] auto server_message() const noexcept -> const std::string& { return server_message_; }
    [[nodiscard]] auto payload() const noexcept -> const nlohmann::json& { return payload_; }

    /// Localized text if the server sent one, otherwise the raw message.
    [[nodiscard]] auto localized_message() const noexcept -> const std::string& {
        return localized_message_.empty() ? server_message_ : localized_message_;
    }

private:
    static auto string_field(const nlohmann::json& payload, const char* key) -> std::string {
        if (payload.is_object()) {
            auto it = payload.find(key);
            if (it != payload.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
        return {};
    }

    static auto describe(int status, int opcode, const nlohmann::json& payload) -> std::string {
        auto text = "server error status=" + std::to_string(status) +
                    " opcode=" + std::to_string(opcode);
        if (auto code = string_field(payload, "error"); !code.empty()) {
            text += " code=" + code;
        }
        if (auto msg = string_field(payload, "message"); !msg.empty()) {
            text += ": " + msg;
        }
        return text;
    }

    int status_;
    int opcode_;
    std::string code_;
    std::string server_message_;
    std::string localized_message_;
    nlohmann::json payload_;
};


// ───────────────────────────────────────────────────────────────────────────
// Authentication
// ───────────────────────────────────────────────────────────────────────────

/// Phone or code rejected, or auth attempted in the wrong state.
class AuthError : public Error {
public:
    explicit AuthError(const std::string& what, std::string code = {})
        : Error{what}
        , code_{std::move(code)}
    {}

    /// Server error code, empty for client-side failures.
    [[nodiscard]] auto code() const noexcept -> const std::string& { return code_; }

private:
    std::string code_;
};

/// Server throttled authentication attempts.
class RateLimitError : public AuthError {
public:
    RateLimitError(const std::string& what, std::chrono::system_clock::time_point until)
        : AuthError{what, "rate_limited"}
        , until_{until}
    {}

    /// Earliest moment at which another attempt may be made.
    [[nodiscard]] auto until() const noexcept -> std::chrono::system_clock::time_point {
        return until_;
    }

private:
    std::chrono::system_clock::time_point until_;
};


// ───────────────────────────────────────────────────────────────────────────
// Session
// ───────────────────────────────────────────────────────────────────────────

/// Session file exists but cannot be parsed. Never escapes the session store.
class SessionCorruptError : public Error {
public:
    using Error::Error;
};

}  // namespace protocol
