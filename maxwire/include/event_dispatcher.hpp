#pragma once

/// @file event_dispatcher.hpp
/// @brief Named event fan-out to user handlers on a serial worker.
///
/// Demonstrates:
/// - Strategy Pattern: EventHandler interface with a std::function adapter
/// - Handlers isolated from the I/O strand: the read loop only enqueues

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "entities.hpp"
#include "protocol.hpp"

namespace maxwire {

namespace asio = boost::asio;

// ═══════════════════════════════════════════════════════════════════════════
// Event
// ═══════════════════════════════════════════════════════════════════════════

/// Event payload alternatives:
/// - monostate: `ready`, `auth_required`
/// - Message: `new_message`, `message_sent`
/// - vector<User>: `contacts_update`
/// - json: `auth_code_error`, `auth_limit_exceeded`
/// - Push: `push` (frames the client does not interpret)
using EventPayload = std::variant<std::monostate, Message, std::vector<User>, nlohmann::json, protocol::Push>;

struct Event {
    std::string name;
    EventPayload payload;
};

namespace events {
inline constexpr const char* kReady = "ready";
inline constexpr const char* kNewMessage = "new_message";
inline constexpr const char* kMessageSent = "message_sent";
inline constexpr const char* kContactsUpdate = "contacts_update";
inline constexpr const char* kAuthRequired = "auth_required";
inline constexpr const char* kAuthLimitExceeded = "auth_limit_exceeded";
inline constexpr const char* kAuthCodeError = "auth_code_error";
inline constexpr const char* kPush = "push";
}  // namespace events


// ═══════════════════════════════════════════════════════════════════════════
// EventHandler — Strategy Interface
// ═══════════════════════════════════════════════════════════════════════════

class EventHandler {
public:
    virtual ~EventHandler() = default;

    /// Runs on the dispatcher's worker thread. Exceptions derived from
    /// std::exception are logged and do not stop other handlers.
    virtual void on_event(const Event& event) = 0;
};

/// Adapts a callable to EventHandler.
class FunctionHandler final : public EventHandler {
public:
    using Callback = std::function<void(const Event&)>;

    explicit FunctionHandler(Callback callback)
        : callback_{std::move(callback)}
    {}

    void on_event(const Event& event) override { callback_(event); }

private:
    Callback callback_;
};


// ═══════════════════════════════════════════════════════════════════════════
// EventDispatcher — Serial Delivery
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
//
// This class manages unique resources:
// • A worker thread (asio::thread_pool of one)
// • Handler registry guarded by a mutex
//
// DECISION: Non-copyable, non-movable
// • Destructor stops the worker and joins it
//
// ═══════════════════════════════════════════════════════════════════════════

/// Delivers events in emission order on one dedicated thread.
///
/// emit() snapshots the handler list at call time, so registering or
/// removing handlers later never affects an event already emitted.
class EventDispatcher {
public:
    EventDispatcher();
    ~EventDispatcher();
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;
    EventDispatcher(EventDispatcher&&) = delete;
    EventDispatcher& operator=(EventDispatcher&&) = delete;

    /// Register @p handler; invocation order equals registration order.
    void on(const std::string& name, std::shared_ptr<EventHandler> handler);

    /// Register a callable. Keep the returned handle to remove it later.
    auto on(const std::string& name, FunctionHandler::Callback callback)
        -> std::shared_ptr<EventHandler>;

    /// Remove by pointer identity. @return false if not registered.
    auto off(const std::string& name, const std::shared_ptr<EventHandler>& handler) -> bool;

    /// Queue @p payload for every handler registered under @p name.
    /// No-op after stop().
    void emit(std::string name, EventPayload payload = {});

    /// Stop delivering. Queued events that have not started are dropped.
    void stop();

    /// Block until every queued event has been delivered.
    /// @return false if the timeout expired first.
    auto wait_idle(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto handler_count(const std::string& name) const -> std::size_t;

private:
    void deliver(const Event& event, const std::vector<std::shared_ptr<EventHandler>>& handlers);
    void finish_one();

    asio::thread_pool worker_{1};
    asio::strand<asio::thread_pool::executor_type> strand_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::vector<std::shared_ptr<EventHandler>>> handlers_;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    std::size_t queued_{0};

    std::atomic<bool> stopped_{false};
};

}  // namespace maxwire
