#pragma once

/// @file protocol.hpp
/// @brief Wire frames and the JSON envelope codec.
///
/// Every frame on the socket is one JSON object:
/// @code
/// {"ver": 11, "cmd": 0, "seq": 42, "opcode": 64, "payload": {...}}
/// @endcode
///
/// The `cmd` field discriminates the frame kind:
/// - no `seq`                       → Push
/// - `seq`, `cmd` absent or 0       → Request (client- or server-originated)
/// - `seq`, `cmd` non-zero          → Response, `cmd` is the status

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace protocol {

// ═══════════════════════════════════════════════════════════════════════════
// Envelope Constants
// ═══════════════════════════════════════════════════════════════════════════

/// `cmd` of a request frame.
inline constexpr int kCmdRequest = 0;

/// `cmd` of a successful response.
inline constexpr int kCmdOk = 1;

/// `cmd` of an error response.
inline constexpr int kCmdError = 3;

/// Protocol version sent in `ver` unless the session overrides it.
inline constexpr int kDefaultProtocolVersion = 11;


// ═══════════════════════════════════════════════════════════════════════════
// Frame Alternatives — Plain Value Types
// ═══════════════════════════════════════════════════════════════════════════

/// Outgoing request, or a request the server originated.
struct Request {
    std::uint64_t seq{0};
    int opcode{0};
    nlohmann::json payload = nlohmann::json::object();
    int cmd{kCmdRequest};
    int ver{kDefaultProtocolVersion};
};

/// Answer to a request, matched by `seq`.
struct Response {
    std::uint64_t seq{0};
    int status{kCmdOk};
    int opcode{0};
    nlohmann::json payload = nlohmann::json::object();

    [[nodiscard]] auto ok() const noexcept -> bool { return status == kCmdOk; }
};

/// Unsolicited server frame.
struct Push {
    int opcode{0};
    nlohmann::json payload = nlohmann::json::object();
    std::optional<std::uint64_t> seq;
};

/// Closed set of frames. Match with std::visit.
using Frame = std::variant<Request, Response, Push>;


// ═══════════════════════════════════════════════════════════════════════════
// Codec — Pure Functions
// ═══════════════════════════════════════════════════════════════════════════

/// Serialize a request envelope.
[[nodiscard]] auto encode(const Request& request) -> std::string;

/// Parse one inbound frame.
///
/// @throws DecodeError on non-JSON text, a non-object envelope, or a
///         missing or mistyped `opcode`, `seq` or `cmd`.
[[nodiscard]] auto decode(std::string_view text) -> Frame;

/// Short human-readable tag for logs, e.g. "response seq=3 status=1".
[[nodiscard]] auto describe(const Frame& frame) -> std::string;

}  // namespace protocol
