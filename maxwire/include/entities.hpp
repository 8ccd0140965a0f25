#pragma once

/// @file entities.hpp
/// @brief User, Chat and Message value types and their JSON parsers.
///
/// Parsers are lenient: absent fields take their defaults, so a partial
/// server record never throws. Only a non-object input is rejected.

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace maxwire {

class EntityCache;

// ═══════════════════════════════════════════════════════════════════════════
// User
// ═══════════════════════════════════════════════════════════════════════════

struct User {
    std::int64_t id{0};
    std::optional<std::string> phone;
    std::optional<std::string> name;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::int64_t> photo_id;
    std::optional<std::string> base_url;

    auto operator==(const User&) const -> bool = default;
};


// ═══════════════════════════════════════════════════════════════════════════
// Chat
// ═══════════════════════════════════════════════════════════════════════════

enum class ChatType : std::uint8_t {
    Dialog,
    Chat,
    Channel,
    Unknown
};

[[nodiscard]] auto parse_chat_type(std::string_view text) noexcept -> ChatType;
[[nodiscard]] auto to_string(ChatType type) noexcept -> std::string_view;

struct Chat {
    std::int64_t id{0};
    ChatType type{ChatType::Dialog};
    std::optional<std::string> title;
    std::set<std::int64_t> participants;

    /// Key of the newest known message; resolve through the chat's history.
    std::optional<std::string> last_message_id;

    std::optional<std::int64_t> owner;
    std::optional<std::int64_t> created;
    std::optional<std::int64_t> modified;
    std::string status{"ACTIVE"};

    auto operator==(const Chat&) const -> bool = default;
};


// ═══════════════════════════════════════════════════════════════════════════
// Message
// ═══════════════════════════════════════════════════════════════════════════

struct Message {
    std::string id;
    std::string text;
    std::int64_t sender_id{0};
    std::int64_t timestamp{0};
    std::int64_t chat_id{0};
    std::string type{"USER"};
    nlohmann::json attachments = nlohmann::json::array();

    auto operator==(const Message&) const -> bool = default;
};


// ═══════════════════════════════════════════════════════════════════════════
// Parsers
// ═══════════════════════════════════════════════════════════════════════════

/// Accepts both `{"contact": {...}}` wrappers and bare contact records.
/// @throws protocol::ProtocolError if @p j is not an object.
[[nodiscard]] auto user_from_json(const nlohmann::json& j) -> User;

/// @throws protocol::ProtocolError if @p j is not an object.
[[nodiscard]] auto chat_from_json(const nlohmann::json& j) -> Chat;

/// @throws protocol::ProtocolError if @p j is not an object.
[[nodiscard]] auto message_from_json(const nlohmann::json& j, std::int64_t chat_id) -> Message;

/// Message ids arrive as numbers or strings; normalize to string.
[[nodiscard]] auto id_to_string(const nlohmann::json& id) -> std::string;


// ═══════════════════════════════════════════════════════════════════════════
// Display Helpers
// ═══════════════════════════════════════════════════════════════════════════

/// Full name, else first/last name, else phone, else `User <id>`.
[[nodiscard]] auto display_name(const User& user) -> std::string;

/// Title; for dialogs the other participant's name; else `Chat <id>`.
[[nodiscard]] auto display_name(const Chat& chat, const EntityCache& cache) -> std::string;

}  // namespace maxwire
