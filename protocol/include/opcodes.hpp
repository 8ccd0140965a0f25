#pragma once

/// @file opcodes.hpp
/// @brief Opcode table and auth error vocabularies.
///
/// The server protocol is not publicly documented. Every number here is a
/// configurable default observed from the official web client, not a
/// protocol guarantee.

#include <optional>
#include <string>
#include <unordered_set>

namespace protocol {

/// Opcodes the driver sends or interprets.
struct OpcodeTable {
    int events{5};            ///< Client navigation/telemetry events
    int session_init{6};      ///< Device hello, first frame on every socket
    int auth_request{17};     ///< Phone submission, answers with a request id
    int check_code{18};       ///< Verification code submission
    int login{19};            ///< Token login, answers with profile and chats
    int edit_message{21};
    int delete_message{22};
    int contacts{32};
    int chats{48};
    int send_message{64};
    int new_message{128};     ///< Push: incoming message
    int reaction{178};

    /// Push carrying a partial contact record. Disabled unless configured.
    std::optional<int> contact_patch;

    /// Push carrying a partial chat record. Disabled unless configured.
    std::optional<int> chat_patch;
};

/// Server error codes with a meaning to the auth state machine.
struct AuthErrorCodes {
    /// Codes or messages meaning the session token is no longer accepted.
    std::unordered_set<std::string> token_rejected{"login.token", "FAIL_LOGIN_TOKEN"};

    /// Codes meaning too many attempts.
    std::unordered_set<std::string> rate_limited{"error.limit.violate"};

    [[nodiscard]] auto is_token_rejection(const std::string& code,
                                          const std::string& message) const -> bool {
        return token_rejected.contains(code) || token_rejected.contains(message);
    }

    [[nodiscard]] auto is_rate_limit(const std::string& code) const -> bool {
        return rate_limited.contains(code);
    }
};

}  // namespace protocol
