#pragma once

/// @file correlator.hpp
/// @brief Request/response matching by sequence number.
///
/// @par Flow
/// @code
/// caller ── call(opcode, payload) ──► [pending seq=7] ── send ──► Transport
///                                          ▲
/// read loop ── resolve(Response seq=7) ────┘  wakes caller with payload
/// @endcode

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "protocol.hpp"
#include "transport.hpp"

namespace maxwire {

using json = nlohmann::json;


// ═══════════════════════════════════════════════════════════════════════════
// PendingRequest — One In-Flight Request
// ═══════════════════════════════════════════════════════════════════════════

/// Completion slot shared between the waiting caller and the resolver.
///
/// The timer doubles as the wake-up signal: resolving cancels the wait,
/// expiry means the deadline passed.
struct ReplySlot {
    explicit ReplySlot(asio::any_io_executor executor)
        : timer{std::move(executor)}
    {}

    asio::steady_timer timer;
    bool done{false};
    json payload;
    std::exception_ptr error;
};

struct PendingRequest {
    std::uint64_t seq{0};
    int opcode{0};
    std::chrono::steady_clock::time_point issued_at;
    std::shared_ptr<ReplySlot> slot;
};


// ═══════════════════════════════════════════════════════════════════════════
// Correlator — Pending Request Registry
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Owns a mutex and live completion slots referenced by suspended callers
// • Non-copyable, non-movable; owned by the client for its whole lifetime
//
// ═══════════════════════════════════════════════════════════════════════════

/// Matches responses to suspended callers and enforces per-call timeouts.
///
/// The registry outlives individual connections: attach() and detach()
/// swap the transport underneath it across reconnects.
///
/// @par Thread Safety
/// The pending map is mutex-guarded. call(), resolve() and fail_all()
/// must run on the executor passed at construction (the client strand),
/// since they touch the slots' timers.
class Correlator {
public:
    using Duration = std::chrono::milliseconds;

    explicit Correlator(asio::any_io_executor executor,
                        int protocol_version = protocol::kDefaultProtocolVersion);
    ~Correlator() = default;
    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;
    Correlator(Correlator&&) = delete;
    Correlator& operator=(Correlator&&) = delete;

    /// Send a request and suspend until its response arrives.
    ///
    /// @throws protocol::CorrelationTimeout if nothing arrived in time
    /// @throws protocol::ConnectionClosed if no transport is attached or
    ///         the connection dropped while waiting
    /// @throws protocol::ServerError on a non-ok response status
    /// @throws protocol::SendError if the transport rejected the frame
    auto call(int opcode, json payload, Duration timeout) -> asio::awaitable<json>;

    /// Send a request without waiting for (or registering) a response.
    auto notify(int opcode, json payload) -> asio::awaitable<void>;

    /// Complete the pending request with the response's seq.
    /// @return false if no request with that seq was pending
    auto resolve(protocol::Response response) -> bool;

    /// Reject every pending request with ConnectionClosed.
    /// @return number of requests rejected
    auto fail_all() -> std::size_t;

    void attach(std::shared_ptr<Transport> transport);
    void detach();

    void set_protocol_version(int version) noexcept { protocol_version_.store(version); }

    [[nodiscard]] auto pending_count() const -> std::size_t;

private:
    auto allocate_seq() -> std::uint64_t;
    auto current_transport() const -> std::shared_ptr<Transport>;
    void unregister(std::uint64_t seq);

    asio::any_io_executor executor_;
    std::atomic<int> protocol_version_;

    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, PendingRequest> pending_;
    std::uint64_t next_seq_{0};
    std::shared_ptr<Transport> transport_;
};

}  // namespace maxwire
