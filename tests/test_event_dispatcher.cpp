// =============================================================================
// EventDispatcher Unit Tests
// Validates ordering, handler isolation, registration snapshots and stop()
// =============================================================================

#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "event_dispatcher.hpp"
#include "test_helpers.hpp"

using namespace maxwire;
using namespace maxwire::test;
using namespace std::chrono_literals;

namespace {

/// Thread-safe ordered log of handler invocations.
class CallLog {
public:
    void add(std::string entry) {
        std::lock_guard lock{mutex_};
        entries_.push_back(std::move(entry));
    }

    [[nodiscard]] auto entries() const -> std::vector<std::string> {
        std::lock_guard lock{mutex_};
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

}  // namespace

// -----------------------------------------------------------------------------
// Emit_SlowFirstHandler_PreservesOrder
// -----------------------------------------------------------------------------
TEST(EventDispatcherTest, Emit_SlowFirstHandler_PreservesOrder) {
    EventDispatcher dispatcher;
    CallLog log;

    dispatcher.on("tick", [&log](const Event& ev) {
        const auto& n = std::get<nlohmann::json>(ev.payload);
        if (n == 1) {
            std::this_thread::sleep_for(50ms);
        }
        log.add("a" + n.dump());
    });
    dispatcher.on("tick", [&log](const Event& ev) {
        log.add("b" + std::get<nlohmann::json>(ev.payload).dump());
    });

    dispatcher.emit("tick", nlohmann::json(1));
    dispatcher.emit("tick", nlohmann::json(2));
    ASSERT_TRUE(dispatcher.wait_idle(2s));

    EXPECT_EQ(log.entries(), (std::vector<std::string>{"a1", "b1", "a2", "b2"}));
}

// -----------------------------------------------------------------------------
// Emit_ThrowingHandler_DoesNotStopOthers
// -----------------------------------------------------------------------------
TEST(EventDispatcherTest, Emit_ThrowingHandler_DoesNotStopOthers) {
    EventDispatcher dispatcher;
    EventRecorder recorder;

    dispatcher.on("ready", [](const Event&) { throw std::runtime_error{"handler bug"}; });
    dispatcher.on("ready", recorder.handler());

    dispatcher.emit("ready");
    dispatcher.emit("ready");

    ASSERT_TRUE(recorder.wait_for(2));
    EXPECT_EQ(recorder.count("ready"), 2u);
}

// -----------------------------------------------------------------------------
// Emit_NonStandardThrow_IsContained
// -----------------------------------------------------------------------------
TEST(EventDispatcherTest, Emit_NonStandardThrow_IsContained) {
    EventDispatcher dispatcher;
    EventRecorder recorder;

    dispatcher.on("ready", [](const Event&) { throw 42; });
    dispatcher.on("ready", recorder.handler());

    dispatcher.emit("ready");
    dispatcher.emit("ready");

    ASSERT_TRUE(recorder.wait_for(2));
    EXPECT_EQ(recorder.count("ready"), 2u);
    EXPECT_TRUE(dispatcher.wait_idle(2s));
}

// -----------------------------------------------------------------------------
// Emit_RunsOffTheCallingThread
// -----------------------------------------------------------------------------
TEST(EventDispatcherTest, Emit_RunsOffTheCallingThread) {
    EventDispatcher dispatcher;
    std::promise<std::thread::id> seen;

    dispatcher.on("ready", [&seen](const Event&) { seen.set_value(std::this_thread::get_id()); });
    dispatcher.emit("ready");

    auto future = seen.get_future();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_NE(future.get(), std::this_thread::get_id());
}

// -----------------------------------------------------------------------------
// Off_RemovesByIdentity
// -----------------------------------------------------------------------------
TEST(EventDispatcherTest, Off_RemovesByIdentity) {
    EventDispatcher dispatcher;
    EventRecorder kept;
    EventRecorder removed;

    dispatcher.on("push", kept.handler());
    auto handle = dispatcher.on("push", removed.handler());
    EXPECT_EQ(dispatcher.handler_count("push"), 2u);

    EXPECT_TRUE(dispatcher.off("push", handle));
    EXPECT_FALSE(dispatcher.off("push", handle));
    EXPECT_FALSE(dispatcher.off("other", handle));
    EXPECT_EQ(dispatcher.handler_count("push"), 1u);

    dispatcher.emit("push");
    ASSERT_TRUE(dispatcher.wait_idle(2s));
    EXPECT_EQ(kept.count("push"), 1u);
    EXPECT_EQ(removed.count("push"), 0u);
}

// -----------------------------------------------------------------------------
// Emit_SnapshotsHandlersAtEmitTime
// -----------------------------------------------------------------------------
TEST(EventDispatcherTest, Emit_SnapshotsHandlersAtEmitTime) {
    EventDispatcher dispatcher;
    std::promise<void> release;
    auto released = release.get_future().share();
    EventRecorder late;

    // Park the worker so the second emit is queued, not delivered.
    dispatcher.on("block", [released](const Event&) { released.wait(); });
    dispatcher.emit("block");

    EventRecorder early;
    dispatcher.on("msg", early.handler());
    dispatcher.emit("msg");
    dispatcher.on("msg", late.handler());

    release.set_value();
    ASSERT_TRUE(dispatcher.wait_idle(2s));
    EXPECT_EQ(early.count("msg"), 1u);
    EXPECT_EQ(late.count("msg"), 0u);
}

// -----------------------------------------------------------------------------
// Emit_WithoutHandlers_IsIdle
// -----------------------------------------------------------------------------
TEST(EventDispatcherTest, Emit_WithoutHandlers_IsIdle) {
    EventDispatcher dispatcher;
    dispatcher.emit("nobody_listens");
    EXPECT_TRUE(dispatcher.wait_idle(100ms));
}

// -----------------------------------------------------------------------------
// Stop_DropsLaterEvents
// -----------------------------------------------------------------------------
TEST(EventDispatcherTest, Stop_DropsLaterEvents) {
    EventDispatcher dispatcher;
    EventRecorder recorder;
    dispatcher.on("ready", recorder.handler());

    dispatcher.stop();
    dispatcher.emit("ready");

    EXPECT_TRUE(dispatcher.wait_idle(100ms));
    EXPECT_FALSE(recorder.wait_for(1, 100ms));
}
