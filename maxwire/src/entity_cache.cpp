#include "entity_cache.hpp"

#include <mutex>
#include <utility>

#include "errors.hpp"
#include "log.hpp"

namespace maxwire {

using nlohmann::json;

namespace {

auto require_id(const json& j, const char* what) -> std::int64_t {
    if (!j.is_object()) {
        throw protocol::ProtocolError{std::string{what} + " patch is not an object"};
    }
    auto it = j.find("id");
    if (it == j.end() || !it->is_number_integer()) {
        throw protocol::ProtocolError{std::string{what} + " patch has no id"};
    }
    return it->get<std::int64_t>();
}

/// Overwrite @p field from @p source[key] only if the key is present.
template<typename T>
void overwrite_if_present(const json& source, const char* key, T& field, const T& parsed) {
    if (source.contains(key)) {
        field = parsed;
    }
}

}  // namespace


// ═══════════════════════════════════════════════════════════════════════════
// Whole-Record Writes
// ═══════════════════════════════════════════════════════════════════════════

void EntityCache::upsert(User user) {
    std::unique_lock lock{mutex_};
    auto id = user.id;
    users_.insert_or_assign(id, std::move(user));
}

void EntityCache::upsert(Chat chat) {
    std::unique_lock lock{mutex_};
    auto id = chat.id;
    chats_.insert_or_assign(id, std::move(chat));
}

void EntityCache::set_current_user(User user) {
    std::unique_lock lock{mutex_};
    users_.insert_or_assign(user.id, user);
    current_user_ = std::move(user);
}

void EntityCache::set_last_message(std::int64_t chat_id, std::string message_id) {
    std::unique_lock lock{mutex_};
    auto it = chats_.find(chat_id);
    if (it == chats_.end()) {
        MAXWIRE_LOG_T("cache", "last message for unknown chat {}", chat_id);
        return;
    }
    it->second.last_message_id = std::move(message_id);
}

void EntityCache::clear() {
    std::unique_lock lock{mutex_};
    users_.clear();
    chats_.clear();
    current_user_.reset();
}


// ═══════════════════════════════════════════════════════════════════════════
// Partial Merges
// ═══════════════════════════════════════════════════════════════════════════

auto EntityCache::merge_user(const json& partial) -> User {
    const json& contact = partial.is_object() && partial.contains("contact") ? partial["contact"] : partial;
    auto id = require_id(contact, "contact");
    auto parsed = user_from_json(contact);

    std::unique_lock lock{mutex_};
    auto [it, inserted] = users_.try_emplace(id, User{});
    User& user = it->second;
    user.id = id;

    overwrite_if_present(contact, "phone", user.phone, parsed.phone);
    overwrite_if_present(contact, "photoId", user.photo_id, parsed.photo_id);
    overwrite_if_present(contact, "baseUrl", user.base_url, parsed.base_url);

    if (auto names = contact.find("names");
        names != contact.end() && names->is_array() && !names->empty() && names->front().is_object()) {
        const auto& first = names->front();
        overwrite_if_present(first, "name", user.name, parsed.name);
        overwrite_if_present(first, "firstName", user.first_name, parsed.first_name);
        overwrite_if_present(first, "lastName", user.last_name, parsed.last_name);
    }

    if (current_user_ && current_user_->id == id) {
        current_user_ = user;
    }
    MAXWIRE_LOG_T("cache", "merged user {} ({})", id, inserted ? "new" : "existing");
    return user;
}

auto EntityCache::merge_chat(const json& partial) -> Chat {
    auto id = require_id(partial, "chat");
    auto parsed = chat_from_json(partial);

    std::unique_lock lock{mutex_};
    auto [it, inserted] = chats_.try_emplace(id, Chat{});
    Chat& chat = it->second;
    chat.id = id;

    overwrite_if_present(partial, "type", chat.type, parsed.type);
    overwrite_if_present(partial, "title", chat.title, parsed.title);
    overwrite_if_present(partial, "participants", chat.participants, parsed.participants);
    overwrite_if_present(partial, "owner", chat.owner, parsed.owner);
    overwrite_if_present(partial, "created", chat.created, parsed.created);
    overwrite_if_present(partial, "modified", chat.modified, parsed.modified);
    overwrite_if_present(partial, "status", chat.status, parsed.status);
    if (parsed.last_message_id) {
        chat.last_message_id = parsed.last_message_id;
    }

    MAXWIRE_LOG_T("cache", "merged chat {} ({})", id, inserted ? "new" : "existing");
    return chat;
}


// ═══════════════════════════════════════════════════════════════════════════
// Readers
// ═══════════════════════════════════════════════════════════════════════════

auto EntityCache::get_user(std::int64_t id) const -> std::optional<User> {
    std::shared_lock lock{mutex_};
    auto it = users_.find(id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto EntityCache::get_chat(std::int64_t id) const -> std::optional<Chat> {
    std::shared_lock lock{mutex_};
    auto it = chats_.find(id);
    if (it == chats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto EntityCache::users() const -> std::vector<User> {
    std::shared_lock lock{mutex_};
    std::vector<User> out;
    out.reserve(users_.size());
    for (const auto& [id, user] : users_) {
        out.push_back(user);
    }
    return out;
}

auto EntityCache::chats() const -> std::vector<Chat> {
    std::shared_lock lock{mutex_};
    std::vector<Chat> out;
    out.reserve(chats_.size());
    for (const auto& [id, chat] : chats_) {
        out.push_back(chat);
    }
    return out;
}

auto EntityCache::current_user() const -> std::optional<User> {
    std::shared_lock lock{mutex_};
    return current_user_;
}

}  // namespace maxwire
