#pragma once

/// @file code_provider.hpp
/// @brief Source of SMS verification codes during interactive login.

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "errors.hpp"

namespace maxwire {

namespace asio = boost::asio;

/// What the provider is being asked for.
struct CodeRequest {
    std::string phone;
    std::size_t attempt{1};

    /// Server message from the previous failed attempt, if any.
    std::optional<std::string> previous_error;
};


// ═══════════════════════════════════════════════════════════════════════════
// CodeProvider — Strategy Interface
// ═══════════════════════════════════════════════════════════════════════════

class CodeProvider {
public:
    virtual ~CodeProvider() = default;

    /// Obtain the code the user received. May suspend for a long time.
    virtual auto provide_code(const CodeRequest& request) -> asio::awaitable<std::string> = 0;

    /// Called by MaxClient::stop(). An outstanding provide_code() should
    /// complete (usually by throwing) soon after. Providers that ignore this
    /// keep stop() from finishing until their code arrives.
    virtual void cancel() {}
};


// ═══════════════════════════════════════════════════════════════════════════
// FunctionCodeProvider — Blocking Callable Adapter
// ═══════════════════════════════════════════════════════════════════════════

/// Runs a blocking callable (e.g. reading stdin) on its own thread so the
/// client's strand keeps serving the socket meanwhile.
///
/// cancel() releases the waiting coroutine at once with AuthError. The
/// callable itself cannot be interrupted: its thread is detached and its
/// eventual result is discarded. Cancel an outstanding request before the
/// io_context it was awaited on is destroyed.
///
/// @par Example
/// @code
/// FunctionCodeProvider stdin_codes{[](const CodeRequest& req) {
///     fmt::print("Code for {}: ", req.phone);
///     std::string code;
///     std::getline(std::cin, code);
///     return code;
/// }};
/// @endcode
class FunctionCodeProvider final : public CodeProvider {
public:
    using Callback = std::function<std::string(const CodeRequest&)>;

    explicit FunctionCodeProvider(Callback callback)
        : callback_{std::make_shared<Callback>(std::move(callback))}
    {}

    FunctionCodeProvider(const FunctionCodeProvider&) = delete;
    FunctionCodeProvider& operator=(const FunctionCodeProvider&) = delete;

    auto provide_code(const CodeRequest& request) -> asio::awaitable<std::string> override {
        auto executor = co_await asio::this_coro::executor;
        auto signal = std::make_shared<asio::steady_timer>(executor, asio::steady_timer::time_point::max());
        auto state = std::make_shared<Pending>();
        state->wake = [executor, signal] {
            asio::post(executor, [signal] { signal->cancel(); });
        };
        {
            std::lock_guard lock{mutex_};
            current_ = state;
        }

        std::thread{[callback = callback_, request, state] {
            try {
                state->settle((*callback)(request), nullptr);
            } catch (const std::exception&) {
                state->settle({}, std::current_exception());
            }
        }}.detach();

        boost::system::error_code ec;
        while (!state->finished()) {
            co_await signal->async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
        {
            std::lock_guard lock{mutex_};
            if (current_ == state) {
                current_.reset();
            }
        }
        co_return state->take();
    }

    void cancel() override {
        std::shared_ptr<Pending> state;
        {
            std::lock_guard lock{mutex_};
            state = std::move(current_);
        }
        if (state) {
            state->settle({}, std::make_exception_ptr(
                protocol::AuthError{"verification code request cancelled"}));
        }
    }

private:
    /// One outstanding request, shared with the worker thread. Only the
    /// first settle() touches the executor, so a worker that finishes after
    /// cancel() never reaches into Asio.
    struct Pending {
        void settle(std::string value, std::exception_ptr failure) {
            std::function<void()> notify;
            {
                std::lock_guard lock{mutex};
                if (done) {
                    return;
                }
                done = true;
                code = std::move(value);
                error = std::move(failure);
                notify = std::move(wake);
                wake = nullptr;
            }
            if (notify) {
                notify();
            }
        }

        [[nodiscard]] auto finished() -> bool {
            std::lock_guard lock{mutex};
            return done;
        }

        auto take() -> std::string {
            std::lock_guard lock{mutex};
            if (error) {
                std::rethrow_exception(error);
            }
            return std::move(code);
        }

        std::mutex mutex;
        bool done{false};
        std::string code;
        std::exception_ptr error;
        std::function<void()> wake;
    };

    std::shared_ptr<Callback> callback_;
    std::mutex mutex_;
    std::shared_ptr<Pending> current_;
};

}  // namespace maxwire
