#include "entities.hpp"

#include <charconv>

#include <fmt/core.h>

#include "entity_cache.hpp"
#include "errors.hpp"

namespace maxwire {

using nlohmann::json;

namespace {

auto opt_string(const json& j, const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

auto opt_int(const json& j, const char* key) -> std::optional<std::int64_t> {
    auto it = j.find(key);
    if (it != j.end() && it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    return std::nullopt;
}

auto parse_id(std::string_view text) -> std::optional<std::int64_t> {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto string_id(const json& j, const char* key) -> std::string {
    auto it = j.find(key);
    return it == j.end() ? std::string{} : id_to_string(*it);
}

void require_object(const json& j, const char* what) {
    if (!j.is_object()) {
        throw protocol::ProtocolError{fmt::format("{} record is not an object", what)};
    }
}

}  // namespace


// ═══════════════════════════════════════════════════════════════════════════
// ChatType
// ═══════════════════════════════════════════════════════════════════════════

auto parse_chat_type(std::string_view text) noexcept -> ChatType {
    if (text == "DIALOG")  return ChatType::Dialog;
    if (text == "CHAT")    return ChatType::Chat;
    if (text == "CHANNEL") return ChatType::Channel;
    return ChatType::Unknown;
}

auto to_string(ChatType type) noexcept -> std::string_view {
    switch (type) {
        case ChatType::Dialog:  return "DIALOG";
        case ChatType::Chat:    return "CHAT";
        case ChatType::Channel: return "CHANNEL";
        case ChatType::Unknown: break;
    }
    return "UNKNOWN";
}


// ═══════════════════════════════════════════════════════════════════════════
// Parsers
// ═══════════════════════════════════════════════════════════════════════════

auto id_to_string(const json& id) -> std::string {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    if (id.is_number_integer()) {
        return std::to_string(id.get<std::int64_t>());
    }
    return {};
}

auto user_from_json(const json& j) -> User {
    require_object(j, "user");
    const json& contact = j.contains("contact") && j["contact"].is_object() ? j["contact"] : j;

    User user;
    user.id = opt_int(contact, "id").value_or(0);
    user.phone = opt_string(contact, "phone");
    if (!user.phone) {
        if (auto phone = opt_int(contact, "phone")) {
            user.phone = std::to_string(*phone);
        }
    }
    user.photo_id = opt_int(contact, "photoId");
    user.base_url = opt_string(contact, "baseUrl");

    auto names = contact.find("names");
    if (names != contact.end() && names->is_array() && !names->empty() && names->front().is_object()) {
        const auto& first = names->front();
        user.name = opt_string(first, "name");
        user.first_name = opt_string(first, "firstName");
        user.last_name = opt_string(first, "lastName");
    }
    return user;
}

auto chat_from_json(const json& j) -> Chat {
    require_object(j, "chat");

    Chat chat;
    chat.id = opt_int(j, "id").value_or(0);
    if (auto type = opt_string(j, "type")) {
        chat.type = parse_chat_type(*type);
    }
    chat.title = opt_string(j, "title");
    chat.owner = opt_int(j, "owner");
    chat.created = opt_int(j, "created");
    chat.modified = opt_int(j, "modified");
    chat.status = opt_string(j, "status").value_or("ACTIVE");

    // Participants come as {"<user id>": <join time>} or as a plain id list.
    if (auto it = j.find("participants"); it != j.end()) {
        if (it->is_object()) {
            for (const auto& [key, value] : it->items()) {
                if (auto id = parse_id(key)) {
                    chat.participants.insert(*id);
                }
            }
        } else if (it->is_array()) {
            for (const auto& id : *it) {
                if (id.is_number_integer()) {
                    chat.participants.insert(id.get<std::int64_t>());
                }
            }
        }
    }

    if (auto it = j.find("lastMessage"); it != j.end() && it->is_object()) {
        if (auto id = string_id(*it, "id"); !id.empty()) {
            chat.last_message_id = std::move(id);
        }
    }
    return chat;
}

auto message_from_json(const json& j, std::int64_t chat_id) -> Message {
    require_object(j, "message");

    Message message;
    message.id = string_id(j, "id");
    message.text = opt_string(j, "text").value_or("");
    message.sender_id = opt_int(j, "sender").value_or(0);
    message.timestamp = opt_int(j, "time").value_or(0);
    message.chat_id = chat_id;
    message.type = opt_string(j, "type").value_or("USER");
    if (auto it = j.find("attaches"); it != j.end() && it->is_array()) {
        message.attachments = *it;
    }
    return message;
}


// ═══════════════════════════════════════════════════════════════════════════
// Display Helpers
// ═══════════════════════════════════════════════════════════════════════════

auto display_name(const User& user) -> std::string {
    if (user.name && !user.name->empty()) {
        return *user.name;
    }
    std::string joined;
    if (user.first_name) {
        joined = *user.first_name;
    }
    if (user.last_name && !user.last_name->empty()) {
        joined += joined.empty() ? *user.last_name : " " + *user.last_name;
    }
    if (!joined.empty()) {
        return joined;
    }
    if (user.phone) {
        return *user.phone;
    }
    return fmt::format("User {}", user.id);
}

auto display_name(const Chat& chat, const EntityCache& cache) -> std::string {
    if (chat.title && !chat.title->empty()) {
        return *chat.title;
    }

    if (chat.type == ChatType::Dialog && !chat.participants.empty()) {
        auto me = cache.current_user();
        for (auto id : chat.participants) {
            if (me && me->id == id && chat.participants.size() > 1) {
                continue;
            }
            if (auto user = cache.get_user(id); user && user->name) {
                return *user->name;
            }
            break;
        }
    }
    return fmt::format("Chat {}", chat.id);
}

}  // namespace maxwire
