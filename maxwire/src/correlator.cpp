#include "correlator.hpp"

#include <exception>
#include <utility>

#include <boost/asio/redirect_error.hpp>

#include "errors.hpp"
#include "log.hpp"

namespace maxwire {

Correlator::Correlator(asio::any_io_executor executor, int protocol_version)
    : executor_{std::move(executor)}
    , protocol_version_{protocol_version}
{}


// ═══════════════════════════════════════════════════════════════════════════
// REGISTRY
// ═══════════════════════════════════════════════════════════════════════════

auto Correlator::allocate_seq() -> std::uint64_t {
    // Caller holds mutex_. After a wrap, skip anything still in flight.
    std::uint64_t seq = next_seq_++;
    while (pending_.contains(seq)) {
        seq = next_seq_++;
    }
    return seq;
}

auto Correlator::current_transport() const -> std::shared_ptr<Transport> {
    std::lock_guard lock{mutex_};
    return transport_;
}

void Correlator::unregister(std::uint64_t seq) {
    std::lock_guard lock{mutex_};
    pending_.erase(seq);
}

void Correlator::attach(std::shared_ptr<Transport> transport) {
    std::lock_guard lock{mutex_};
    transport_ = std::move(transport);
}

void Correlator::detach() {
    std::lock_guard lock{mutex_};
    transport_.reset();
}

auto Correlator::pending_count() const -> std::size_t {
    std::lock_guard lock{mutex_};
    return pending_.size();
}


// ═══════════════════════════════════════════════════════════════════════════
// CALL
// ═══════════════════════════════════════════════════════════════════════════

auto Correlator::call(int opcode, json payload, Duration timeout) -> asio::awaitable<json> {
    auto slot = std::make_shared<ReplySlot>(executor_);
    slot->timer.expires_after(timeout);

    protocol::Request request;
    request.opcode = opcode;
    request.payload = std::move(payload);
    request.ver = protocol_version_.load();

    std::shared_ptr<Transport> transport;
    {
        std::lock_guard lock{mutex_};
        if (!transport_) {
            throw protocol::ConnectionClosed{"not connected"};
        }
        transport = transport_;
        request.seq = allocate_seq();
        pending_.emplace(request.seq, PendingRequest{
            request.seq, opcode, std::chrono::steady_clock::now(), slot});
    }

    const auto seq = request.seq;
    MAXWIRE_LOG_T("correlator", "-> seq={} opcode={}", seq, opcode);

    std::exception_ptr send_failure;
    try {
        co_await transport->send(protocol::encode(request));
    } catch (const std::exception&) {
        send_failure = std::current_exception();
    }

    if (send_failure) {
        // fail_all() or a response may have settled the slot while send()
        // was suspended; that outcome wins over the write error.
        bool settled = false;
        {
            std::lock_guard lock{mutex_};
            settled = slot->done;
        }
        if (!settled) {
            unregister(seq);
            std::rethrow_exception(send_failure);
        }
        if (slot->error) {
            std::rethrow_exception(slot->error);
        }
        co_return std::move(slot->payload);
    }

    // The response may already have landed while send() was suspended.
    bool done = false;
    {
        std::lock_guard lock{mutex_};
        done = slot->done;
    }
    if (!done) {
        boost::system::error_code ec;
        co_await slot->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

    {
        std::lock_guard lock{mutex_};
        if (!slot->done) {
            pending_.erase(seq);
            MAXWIRE_LOG_W("correlator", "seq={} opcode={} timed out after {}ms",
                          seq, opcode, timeout.count());
            throw protocol::CorrelationTimeout{seq, opcode};
        }
    }

    if (slot->error) {
        std::rethrow_exception(slot->error);
    }
    co_return std::move(slot->payload);
}

auto Correlator::notify(int opcode, json payload) -> asio::awaitable<void> {
    protocol::Request request;
    request.opcode = opcode;
    request.payload = std::move(payload);
    request.ver = protocol_version_.load();

    std::shared_ptr<Transport> transport;
    {
        std::lock_guard lock{mutex_};
        if (!transport_) {
            throw protocol::ConnectionClosed{"not connected"};
        }
        transport = transport_;
        request.seq = allocate_seq();
    }
    co_await transport->send(protocol::encode(request));
}


// ═══════════════════════════════════════════════════════════════════════════
// COMPLETION
// ═══════════════════════════════════════════════════════════════════════════

auto Correlator::resolve(protocol::Response response) -> bool {
    std::shared_ptr<ReplySlot> slot;
    int opcode = response.opcode;
    {
        std::lock_guard lock{mutex_};
        auto it = pending_.find(response.seq);
        if (it == pending_.end()) {
            MAXWIRE_LOG_D("correlator", "dropping response for unknown seq={} opcode={}",
                          response.seq, response.opcode);
            return false;
        }
        slot = std::move(it->second.slot);
        opcode = it->second.opcode;
        pending_.erase(it);

        slot->done = true;
        if (response.ok()) {
            slot->payload = std::move(response.payload);
        } else {
            slot->error = std::make_exception_ptr(
                protocol::ServerError{response.status, opcode, std::move(response.payload)});
        }
    }

    MAXWIRE_LOG_T("correlator", "<- seq={} opcode={} status={}", response.seq, opcode, response.status);
    slot->timer.cancel();
    return true;
}

auto Correlator::fail_all() -> std::size_t {
    std::unordered_map<std::uint64_t, PendingRequest> failed;
    {
        std::lock_guard lock{mutex_};
        failed.swap(pending_);
        for (auto& [seq, pending] : failed) {
            pending.slot->done = true;
            pending.slot->error = std::make_exception_ptr(protocol::ConnectionClosed{});
        }
    }

    for (auto& [seq, pending] : failed) {
        pending.slot->timer.cancel();
    }
    if (!failed.empty()) {
        MAXWIRE_LOG_D("correlator", "failed {} pending request(s)", failed.size());
    }
    return failed.size();
}

}  // namespace maxwire
