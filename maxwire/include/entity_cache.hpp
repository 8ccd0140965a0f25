#pragma once

/// @file entity_cache.hpp
/// @brief In-memory view of users and chats seen by the client.

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "entities.hpp"

namespace maxwire {

// ═══════════════════════════════════════════════════════════════════════════
// EntityCache — Reader/Writer Guarded Maps
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Holds a std::shared_mutex, which is neither copyable nor movable
// • One cache per client, never transferred
//
// ═══════════════════════════════════════════════════════════════════════════

/// Chat and user maps.
///
/// upsert() replaces a whole record (last write wins). merge_*() applies a
/// partial record: fields present in the JSON overwrite, absent fields keep
/// their cached value. Readers always receive copies.
class EntityCache {
public:
    EntityCache() = default;
    EntityCache(const EntityCache&) = delete;
    EntityCache& operator=(const EntityCache&) = delete;

    void upsert(User user);
    void upsert(Chat chat);

    [[nodiscard]] auto get_user(std::int64_t id) const -> std::optional<User>;
    [[nodiscard]] auto get_chat(std::int64_t id) const -> std::optional<Chat>;

    [[nodiscard]] auto users() const -> std::vector<User>;
    [[nodiscard]] auto chats() const -> std::vector<Chat>;

    /// Apply a partial contact record. Returns the merged user.
    /// @throws protocol::ProtocolError if the record has no integer id.
    auto merge_user(const nlohmann::json& partial) -> User;

    /// Apply a partial chat record. Returns the merged chat.
    /// @throws protocol::ProtocolError if the record has no integer id.
    auto merge_chat(const nlohmann::json& partial) -> Chat;

    /// Record the newest message key of a chat. Unknown chats are ignored.
    void set_last_message(std::int64_t chat_id, std::string message_id);

    void set_current_user(User user);
    [[nodiscard]] auto current_user() const -> std::optional<User>;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::int64_t, User> users_;
    std::unordered_map<std::int64_t, Chat> chats_;
    std::optional<User> current_user_;
};

}  // namespace maxwire
