#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <fmt/core.h>

#include "client_config.hpp"
#include "code_provider.hpp"
#include "max_client.hpp"

namespace asio = boost::asio;

namespace {

auto read_code(const maxwire::CodeRequest& request) -> std::string {
    if (request.previous_error) {
        fmt::print("[MAIN] {}\n", *request.previous_error);
    }
    fmt::print("[MAIN] Verification code for {} (attempt {}): ", request.phone, request.attempt);
    std::fflush(stdout);

    std::string code;
    if (!std::getline(std::cin, code)) {
        throw protocol::AuthError{"no verification code on stdin"};
    }
    return code;
}

void print_chats(const maxwire::MaxClient& client) {
    const auto& cache = client.cache();
    auto chats = cache.chats();
    fmt::print("[MAIN] {} chat(s)\n", chats.size());
    for (const auto& chat : chats) {
        fmt::print("[MAIN]   {:>12}  {:<8} {}\n",
                   chat.id, maxwire::to_string(chat.type), maxwire::display_name(chat, cache));
    }
}

}  // namespace

int main() {
    try {
        // Configuration
        auto cfg = svckit::ClientConfig::from_env();
        if (const char* phone = std::getenv("PHONE"); phone && *phone) {
            cfg = std::move(cfg).with_phone(phone);
        }

        fmt::print("[MAIN] Starting maxwire client\n");
        fmt::print("[MAIN] Endpoint: {}\n", cfg.endpoint().ws_url());
        fmt::print("[MAIN] Session: {}\n", cfg.session_path().string());

        // IO context
        asio::io_context ioc{1};

        // Create client using factory method
        auto client = maxwire::MaxClient::create(ioc, std::move(cfg));
        client->set_code_provider(std::make_shared<maxwire::FunctionCodeProvider>(read_code));

        client->on(maxwire::events::kReady, [&client = *client](const maxwire::Event&) {
            if (auto me = client.current_user()) {
                fmt::print("[MAIN] Ready as {} ({})\n", maxwire::display_name(*me), me->id);
            }
            print_chats(client);
        });

        client->on(maxwire::events::kNewMessage, [&client = *client](const maxwire::Event& ev) {
            const auto& msg = std::get<maxwire::Message>(ev.payload);
            auto sender = client.get_user(msg.sender_id);
            fmt::print("[MAIN] [{}] {}: {}\n",
                       msg.chat_id,
                       sender ? maxwire::display_name(*sender) : fmt::format("User {}", msg.sender_id),
                       msg.text);
        });

        client->on(maxwire::events::kAuthCodeError, [](const maxwire::Event& ev) {
            const auto& details = std::get<nlohmann::json>(ev.payload);
            fmt::print("[MAIN] Code rejected: {}\n", details.value("localizedMessage", std::string{}));
        });

        client->on(maxwire::events::kAuthRequired, [](const maxwire::Event&) {
            fmt::print("[MAIN] Session expired, log in again\n");
        });

        // Signal handling
        asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([client](const boost::system::error_code& ec, int sig) {
            if (!ec) {
                fmt::print("\n[MAIN] Received signal {}, shutting down...\n", sig);
                client->stop();
            }
        });

        int exit_code = EXIT_SUCCESS;
        asio::co_spawn(client->executor(), client->run(),
            [&](std::exception_ptr e) {
                if (e) {
                    try {
                        std::rethrow_exception(e);
                    } catch (const std::exception& ex) {
                        fmt::print(stderr, "[MAIN] Client failed: {}\n", ex.what());
                    }
                    exit_code = EXIT_FAILURE;
                    client->stop();
                }
                signals.cancel();
            });

        // Run event loop
        ioc.run();

        fmt::print("[MAIN] Client shutdown complete\n");
        return exit_code;

    } catch (const std::exception& e) {
        fmt::print(stderr, "[MAIN] Fatal error: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
