#include "event_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include "log.hpp"

namespace maxwire {

EventDispatcher::EventDispatcher()
    : strand_{asio::make_strand(worker_.get_executor())}
{}

EventDispatcher::~EventDispatcher() {
    stop();
    worker_.join();
}


// ═══════════════════════════════════════════════════════════════════════════
// REGISTRY
// ═══════════════════════════════════════════════════════════════════════════

void EventDispatcher::on(const std::string& name, std::shared_ptr<EventHandler> handler) {
    if (!handler) {
        return;
    }
    std::lock_guard lock{registry_mutex_};
    handlers_[name].push_back(std::move(handler));
}

auto EventDispatcher::on(const std::string& name, FunctionHandler::Callback callback)
    -> std::shared_ptr<EventHandler>
{
    auto handler = std::make_shared<FunctionHandler>(std::move(callback));
    on(name, handler);
    return handler;
}

auto EventDispatcher::off(const std::string& name, const std::shared_ptr<EventHandler>& handler) -> bool {
    std::lock_guard lock{registry_mutex_};
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return false;
    }
    auto& list = it->second;
    auto pos = std::find(list.begin(), list.end(), handler);
    if (pos == list.end()) {
        return false;
    }
    list.erase(pos);
    return true;
}

auto EventDispatcher::handler_count(const std::string& name) const -> std::size_t {
    std::lock_guard lock{registry_mutex_};
    auto it = handlers_.find(name);
    return it == handlers_.end() ? 0 : it->second.size();
}


// ═══════════════════════════════════════════════════════════════════════════
// DELIVERY
// ═══════════════════════════════════════════════════════════════════════════

void EventDispatcher::emit(std::string name, EventPayload payload) {
    if (stopped_.load(std::memory_order_acquire)) {
        return;
    }

    std::vector<std::shared_ptr<EventHandler>> snapshot;
    {
        std::lock_guard lock{registry_mutex_};
        if (auto it = handlers_.find(name); it != handlers_.end()) {
            snapshot = it->second;
        }
    }
    if (snapshot.empty()) {
        MAXWIRE_LOG_T("dispatch", "no handlers for '{}'", name);
        return;
    }

    {
        std::lock_guard lock{idle_mutex_};
        ++queued_;
    }
    asio::post(strand_, [this, event = Event{std::move(name), std::move(payload)},
                         handlers = std::move(snapshot)] {
        deliver(event, handlers);
        finish_one();
    });
}

void EventDispatcher::deliver(const Event& event,
                              const std::vector<std::shared_ptr<EventHandler>>& handlers) {
    for (const auto& handler : handlers) {
        if (stopped_.load(std::memory_order_acquire)) {
            return;
        }
        try {
            handler->on_event(event);
        } catch (const std::exception& e) {
            MAXWIRE_LOG_E("dispatch", "handler for '{}' threw: {}", event.name, e.what());
        } catch (...) {
            // Handlers are user code; a non-std throw must not reach the worker thread.
            MAXWIRE_LOG_E("dispatch", "handler for '{}' threw a non-standard exception", event.name);
        }
    }
}

void EventDispatcher::finish_one() {
    std::lock_guard lock{idle_mutex_};
    if (queued_ > 0) {
        --queued_;
    }
    if (queued_ == 0) {
        idle_cv_.notify_all();
    }
}

void EventDispatcher::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_.stop();
    {
        std::lock_guard lock{idle_mutex_};
        queued_ = 0;
    }
    idle_cv_.notify_all();
    MAXWIRE_LOG_D("dispatch", "stopped");
}

auto EventDispatcher::wait_idle(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock{idle_mutex_};
    return idle_cv_.wait_for(lock, timeout, [this] { return queued_ == 0; });
}

}  // namespace maxwire
