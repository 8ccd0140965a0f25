#pragma once

/// @file session_store.hpp
/// @brief Persistent device identity and auth token.
///
/// File format (pretty-printed JSON):
/// @code
/// {
///   "device_id": "3f0c...", "user_agent": "Mozilla/5.0 ...",
///   "app_version": "25.12.3", "device_type": "ANDROID",
///   "locale": "ru", "device_locale": "ru", "os_version": "Windows",
///   "device_name": "Chrome", "screen": "1080x1920 1.0x",
///   "timezone": "Europe/Moscow", "version": 11,
///   "token": null, "phone": "+79990000000"
/// }
/// @endcode

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "client_config.hpp"

namespace maxwire {

// ═══════════════════════════════════════════════════════════════════════════
// Session — Plain Value Type
// ═══════════════════════════════════════════════════════════════════════════

struct Session {
    std::string device_id;
    std::string user_agent;
    std::string app_version;
    std::string device_type;
    std::string locale;
    std::string device_locale;
    std::string os_version;
    std::string device_name;
    std::string screen;
    std::string timezone;
    int protocol_version{protocol::kDefaultProtocolVersion};
    std::optional<std::string> token;
    std::optional<std::string> phone;

    /// Fresh session with a random UUID device id.
    [[nodiscard]] static auto create(const svckit::DeviceProfile& device) -> Session;

    /// `userAgent` object of the session-init payload.
    [[nodiscard]] auto user_agent_payload() const -> nlohmann::json;

    [[nodiscard]] auto to_json() const -> nlohmann::json;

    /// @throws protocol::SessionCorruptError on missing or mistyped fields.
    [[nodiscard]] static auto from_json(const nlohmann::json& j) -> Session;

    auto operator==(const Session&) const -> bool = default;
};


// ═══════════════════════════════════════════════════════════════════════════
// SessionStore — File Persistence
// ═══════════════════════════════════════════════════════════════════════════

class SessionStore {
public:
    SessionStore() = delete;

    /// Load the session file.
    /// @return std::nullopt if the file is missing or unreadable; corrupt
    ///         files are logged, never thrown.
    [[nodiscard]] static auto load(const std::filesystem::path& path) -> std::optional<Session>;

    /// Atomically replace the session file (write `<path>.tmp`, rename).
    /// @throws std::filesystem::filesystem_error or protocol::Error on I/O failure.
    static void save(const std::filesystem::path& path, const Session& session);
};


// ═══════════════════════════════════════════════════════════════════════════
// SessionKeeper — Single Writer for the Live Session
// ═══════════════════════════════════════════════════════════════════════════

/// Owns the in-memory session and writes it through on every change.
///
/// Persistence failures are logged; the in-memory value still changes so
/// the running client keeps working.
class SessionKeeper {
public:
    explicit SessionKeeper(std::filesystem::path path);

    SessionKeeper(const SessionKeeper&) = delete;
    SessionKeeper& operator=(const SessionKeeper&) = delete;

    /// Load from disk, or create and persist a new session.
    /// Does nothing once a session is loaded.
    void load_or_create(const svckit::DeviceProfile& device);

    [[nodiscard]] auto loaded() const -> bool;
    [[nodiscard]] auto snapshot() const -> Session;
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    void set_token(std::optional<std::string> token);
    void set_phone(std::optional<std::string> phone);

private:
    void persist_locked();

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::optional<Session> session_;
};

}  // namespace maxwire
