#include "session_store.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "errors.hpp"
#include "log.hpp"

namespace maxwire {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

auto required_string(const json& j, const char* key) -> std::string {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw protocol::SessionCorruptError{std::string{"session field '"} + key + "' missing or not a string"};
    }
    return it->get<std::string>();
}

auto optional_string(const json& j, const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw protocol::SessionCorruptError{std::string{"session field '"} + key + "' is not a string"};
    }
    return it->get<std::string>();
}

auto nullable(const std::optional<std::string>& value) -> json {
    return value ? json(*value) : json(nullptr);
}

}  // namespace


// ═══════════════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════════════

auto Session::create(const svckit::DeviceProfile& device) -> Session {
    Session s;
    s.device_id = boost::uuids::to_string(boost::uuids::random_generator{}());
    s.user_agent = device.user_agent;
    s.app_version = device.app_version;
    s.device_type = device.device_type;
    s.locale = device.locale;
    s.device_locale = device.device_locale;
    s.os_version = device.os_version;
    s.device_name = device.device_name;
    s.screen = device.screen;
    s.timezone = device.timezone;
    s.protocol_version = device.protocol_version;
    return s;
}

auto Session::user_agent_payload() const -> json {
    return {
        {"deviceType", device_type},
        {"locale", locale},
        {"deviceLocale", device_locale},
        {"osVersion", os_version},
        {"deviceName", device_name},
        {"headerUserAgent", user_agent},
        {"appVersion", app_version},
        {"screen", screen},
        {"timezone", timezone},
    };
}

auto Session::to_json() const -> json {
    return {
        {"device_id", device_id},
        {"user_agent", user_agent},
        {"app_version", app_version},
        {"device_type", device_type},
        {"locale", locale},
        {"device_locale", device_locale},
        {"os_version", os_version},
        {"device_name", device_name},
        {"screen", screen},
        {"timezone", timezone},
        {"version", protocol_version},
        {"token", nullable(token)},
        {"phone", nullable(phone)},
    };
}

auto Session::from_json(const json& j) -> Session {
    if (!j.is_object()) {
        throw protocol::SessionCorruptError{"session file is not a JSON object"};
    }

    Session s;
    s.device_id = required_string(j, "device_id");
    if (s.device_id.empty()) {
        throw protocol::SessionCorruptError{"session has an empty device_id"};
    }
    s.user_agent = required_string(j, "user_agent");
    s.app_version = required_string(j, "app_version");
    s.device_type = required_string(j, "device_type");
    s.locale = required_string(j, "locale");
    s.device_locale = required_string(j, "device_locale");
    s.os_version = required_string(j, "os_version");
    s.device_name = required_string(j, "device_name");
    s.screen = required_string(j, "screen");
    s.timezone = required_string(j, "timezone");

    auto ver = j.find("version");
    if (ver == j.end() || !ver->is_number_integer()) {
        throw protocol::SessionCorruptError{"session field 'version' missing or not an integer"};
    }
    s.protocol_version = ver->get<int>();
    s.token = optional_string(j, "token");
    s.phone = optional_string(j, "phone");
    return s;
}


// ═══════════════════════════════════════════════════════════════════════════
// SessionStore
// ═══════════════════════════════════════════════════════════════════════════

auto SessionStore::load(const fs::path& path) -> std::optional<Session> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        MAXWIRE_LOG_D("session", "no session file at {}", path.string());
        return std::nullopt;
    }

    std::ifstream in{path};
    if (!in) {
        MAXWIRE_LOG_W("session", "cannot open session file {}", path.string());
        return std::nullopt;
    }

    try {
        json j = json::parse(in, nullptr, false);
        if (j.is_discarded()) {
            throw protocol::SessionCorruptError{"session file is not valid JSON"};
        }
        auto session = Session::from_json(j);
        MAXWIRE_LOG_I("session", "loaded session {} (token {})",
                      session.device_id, session.token ? "present" : "absent");
        return session;
    } catch (const protocol::SessionCorruptError& e) {
        MAXWIRE_LOG_W("session", "ignoring corrupt session file {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

void SessionStore::save(const fs::path& path, const Session& session) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out{tmp, std::ios::trunc};
        if (!out) {
            throw protocol::Error{"cannot write session file " + tmp.string()};
        }
        out << session.to_json().dump(2) << '\n';
        out.flush();
        if (!out) {
            throw protocol::Error{"failed writing session file " + tmp.string()};
        }
    }
    fs::rename(tmp, path);
    MAXWIRE_LOG_T("session", "saved {}", path.string());
}


// ═══════════════════════════════════════════════════════════════════════════
// SessionKeeper
// ═══════════════════════════════════════════════════════════════════════════

SessionKeeper::SessionKeeper(fs::path path)
    : path_{std::move(path)}
{}

void SessionKeeper::load_or_create(const svckit::DeviceProfile& device) {
    std::lock_guard lock{mutex_};
    if (session_) {
        return;
    }

    session_ = SessionStore::load(path_);
    if (!session_) {
        session_ = Session::create(device);
        MAXWIRE_LOG_I("session", "created session {}", session_->device_id);
        persist_locked();
    }
}

auto SessionKeeper::loaded() const -> bool {
    std::lock_guard lock{mutex_};
    return session_.has_value();
}

auto SessionKeeper::snapshot() const -> Session {
    std::lock_guard lock{mutex_};
    if (!session_) {
        throw protocol::Error{"session not loaded"};
    }
    return *session_;
}

void SessionKeeper::set_token(std::optional<std::string> token) {
    std::lock_guard lock{mutex_};
    if (!session_) {
        throw protocol::Error{"session not loaded"};
    }
    if (session_->token == token) {
        return;
    }
    session_->token = std::move(token);
    persist_locked();
}

void SessionKeeper::set_phone(std::optional<std::string> phone) {
    std::lock_guard lock{mutex_};
    if (!session_) {
        throw protocol::Error{"session not loaded"};
    }
    if (session_->phone == phone) {
        return;
    }
    session_->phone = std::move(phone);
    persist_locked();
}

void SessionKeeper::persist_locked() {
    try {
        SessionStore::save(path_, *session_);
    } catch (const std::exception& e) {
        MAXWIRE_LOG_E("session", "failed to persist session to {}: {}", path_.string(), e.what());
    }
}

}  // namespace maxwire
