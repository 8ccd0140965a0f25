// =============================================================================
// AuthStateMachine Unit Tests
// Validates the phone/code/token flow, rate limiting and token rejection
// =============================================================================

#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <utility>

#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "auth.hpp"
#include "correlator.hpp"
#include "errors.hpp"
#include "event_dispatcher.hpp"
#include "mock_transport.hpp"
#include "session_store.hpp"
#include "test_helpers.hpp"

using namespace maxwire;
using namespace maxwire::test;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

struct Answer {
    int status{protocol::kCmdOk};
    json payload = json::object();
};

class AuthTest : public ::testing::Test {
protected:
    AuthTest()
        : config{svckit::ClientConfig{}
              .with_session_path(dir.file("session.json"))
              .with_auth_timeout(2s)}
        , transport{std::make_shared<MockTransport>(ioc.get_executor())}
        , correlator{ioc.get_executor()}
        , session{config.session_path()}
    {
        transport->open();
        transport->on_send([this](MockTransport&, const protocol::Request& request) {
            auto it = answers.find(request.opcode);
            if (it != answers.end()) {
                correlator.resolve(protocol::Response{request.seq, it->second.status, request.opcode,
                                                      it->second.payload});
            }
        });
        correlator.attach(transport);
        session.load_or_create(config.device());

        dispatcher.on(events::kAuthCodeError, recorder.handler());
        dispatcher.on(events::kAuthLimitExceeded, recorder.handler());
        dispatcher.on(events::kAuthRequired, recorder.handler());
    }

    void make_auth(svckit::ClientConfig cfg) {
        config = std::move(cfg);
        auth = std::make_unique<AuthStateMachine>(config, correlator, session, dispatcher);
    }

    auto machine() -> AuthStateMachine& {
        if (!auth) {
            auth = std::make_unique<AuthStateMachine>(config, correlator, session, dispatcher);
        }
        return *auth;
    }

    void answer_ok(int opcode, json payload) { answers[opcode] = Answer{protocol::kCmdOk, std::move(payload)}; }

    void answer_error(int opcode, const std::string& code, const std::string& message) {
        answers[opcode] = Answer{protocol::kCmdError,
                                 {{"error", code}, {"message", message}, {"localizedMessage", message}}};
    }

    void begin(const std::string& phone = "+79990000000") {
        answer_ok(17, {{"token", "req-1"}});
        run_coro(ioc, ioc.get_executor(), machine().begin_auth(phone));
    }

    asio::io_context ioc;
    TempDir dir;
    svckit::ClientConfig config;
    std::shared_ptr<MockTransport> transport;
    Correlator correlator;
    SessionKeeper session;
    EventRecorder recorder;
    EventDispatcher dispatcher;
    std::unique_ptr<AuthStateMachine> auth;
    std::map<int, Answer> answers;
};

const json kLoginToken = {{"tokenAttrs", {{"LOGIN", {{"token", "tok-abc"}}}}}};

}  // namespace

// -----------------------------------------------------------------------------
// BeginAuth_StoresRequestIdAndPhone
// -----------------------------------------------------------------------------
TEST_F(AuthTest, BeginAuth_StoresRequestIdAndPhone) {
    begin("+79991112233");

    auto state = machine().state();
    ASSERT_TRUE(std::holds_alternative<auth_state::CodeRequested>(state));
    EXPECT_EQ(std::get<auth_state::CodeRequested>(state).request_id, "req-1");
    EXPECT_EQ(session.snapshot().phone, std::optional<std::string>{"+79991112233"});

    auto requests = transport->sent_with_opcode(17);
    ASSERT_EQ(requests.size(), 1u);
    const auto& payload = requests[0].at("payload");
    EXPECT_EQ(payload.at("phone"), "+79991112233");
    EXPECT_EQ(payload.at("type"), "START_AUTH");
    EXPECT_EQ(payload.at("language"), "ru");
}

// -----------------------------------------------------------------------------
// BeginAuth_SendsNavigationEventsAfterRequest
// -----------------------------------------------------------------------------
TEST_F(AuthTest, BeginAuth_SendsNavigationEventsAfterRequest) {
    begin();

    const auto& sent = transport->sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].at("opcode"), 17);
    EXPECT_EQ(sent[1].at("opcode"), 5);

    const auto& events = sent[1].at("payload").at("events");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].at("type"), "COLD_START");
    EXPECT_EQ(events[1].at("type"), "GO");
    EXPECT_EQ(events[1].at("page"), 1);
    EXPECT_EQ(correlator.pending_count(), 0u);
}

// -----------------------------------------------------------------------------
// BeginAuth_NavigationEventsDisabled_SendsOnlyRequest
// -----------------------------------------------------------------------------
TEST_F(AuthTest, BeginAuth_NavigationEventsDisabled_SendsOnlyRequest) {
    make_auth(svckit::ClientConfig{config}.with_navigation_events(false));
    begin();
    EXPECT_EQ(transport->sent().size(), 1u);
}

// -----------------------------------------------------------------------------
// SubmitCode_Success_PersistsToken
// -----------------------------------------------------------------------------
TEST_F(AuthTest, SubmitCode_Success_PersistsToken) {
    begin();
    answer_ok(18, kLoginToken);

    auto token = run_coro(ioc, ioc.get_executor(), machine().submit_code("123456"));

    EXPECT_EQ(token, "tok-abc");
    EXPECT_TRUE(machine().authenticated());

    auto check = transport->sent_with_opcode(18);
    ASSERT_EQ(check.size(), 1u);
    EXPECT_EQ(check[0].at("payload").at("token"), "req-1");
    EXPECT_EQ(check[0].at("payload").at("verifyCode"), "123456");
    EXPECT_EQ(check[0].at("payload").at("authTokenType"), "CHECK_CODE");

    auto on_disk = SessionStore::load(config.session_path());
    ASSERT_TRUE(on_disk.has_value());
    EXPECT_EQ(on_disk->token, std::optional<std::string>{"tok-abc"});
}

// -----------------------------------------------------------------------------
// SubmitCode_Rejected_EmitsCodeErrorAndAllowsRetry
// -----------------------------------------------------------------------------
TEST_F(AuthTest, SubmitCode_Rejected_EmitsCodeErrorAndAllowsRetry) {
    begin();
    answer_error(18, "verify.code.wrong", "Wrong code");

    try {
        (void)run_coro(ioc, ioc.get_executor(), machine().submit_code("000000"));
        FAIL() << "expected AuthError";
    } catch (const protocol::AuthError& e) {
        EXPECT_EQ(e.code(), "verify.code.wrong");
    }
    EXPECT_TRUE(std::holds_alternative<auth_state::CodeRequested>(machine().state()));

    ASSERT_TRUE(recorder.wait_for(1));
    auto event = recorder.events().front();
    EXPECT_EQ(event.name, events::kAuthCodeError);
    const auto& details = std::get<json>(event.payload);
    EXPECT_EQ(details.at("error"), "verify.code.wrong");
    EXPECT_EQ(details.at("localizedMessage"), "Wrong code");

    answer_ok(18, kLoginToken);
    EXPECT_EQ(run_coro(ioc, ioc.get_executor(), machine().submit_code("123456")), "tok-abc");
}

// -----------------------------------------------------------------------------
// RateLimit_GatesFurtherAttempts
// -----------------------------------------------------------------------------
TEST_F(AuthTest, RateLimit_GatesFurtherAttempts) {
    begin();
    answer_error(18, "error.limit.violate", "Too many attempts");

    EXPECT_THROW((void)run_coro(ioc, ioc.get_executor(), machine().submit_code("000000")),
                 protocol::RateLimitError);
    EXPECT_TRUE(std::holds_alternative<auth_state::RateLimited>(machine().state()));

    ASSERT_TRUE(recorder.wait_for(1));
    EXPECT_EQ(recorder.count(events::kAuthLimitExceeded), 1u);

    auto frames_before = transport->sent().size();
    EXPECT_THROW(run_coro(ioc, ioc.get_executor(), machine().begin_auth("+79990000000")),
                 protocol::RateLimitError);
    EXPECT_THROW((void)run_coro(ioc, ioc.get_executor(), machine().submit_code("111111")),
                 protocol::RateLimitError);
    EXPECT_EQ(transport->sent().size(), frames_before);
}

// -----------------------------------------------------------------------------
// RateLimit_AfterCooldown_ResumesWithSameRequestId
// -----------------------------------------------------------------------------
TEST_F(AuthTest, RateLimit_AfterCooldown_ResumesWithSameRequestId) {
    make_auth(svckit::ClientConfig{config}.with_rate_limit_cooldown(0ms));
    begin();
    answer_error(18, "error.limit.violate", "Too many attempts");
    EXPECT_THROW((void)run_coro(ioc, ioc.get_executor(), machine().submit_code("000000")),
                 protocol::RateLimitError);

    answer_ok(18, kLoginToken);
    EXPECT_EQ(run_coro(ioc, ioc.get_executor(), machine().submit_code("123456")), "tok-abc");

    auto check = transport->sent_with_opcode(18);
    ASSERT_EQ(check.size(), 2u);
    EXPECT_EQ(check[1].at("payload").at("token"), "req-1");
}

// -----------------------------------------------------------------------------
// SubmitCode_WithoutRequest_Throws
// -----------------------------------------------------------------------------
TEST_F(AuthTest, SubmitCode_WithoutRequest_Throws) {
    EXPECT_THROW((void)run_coro(ioc, ioc.get_executor(), machine().submit_code("123456")),
                 protocol::AuthError);
    EXPECT_TRUE(transport->sent().empty());
}

// -----------------------------------------------------------------------------
// Resume_Success_ReturnsLoginPayload
// -----------------------------------------------------------------------------
TEST_F(AuthTest, Resume_Success_ReturnsLoginPayload) {
    answer_ok(19, {{"profile", {{"contact", {{"id", 1}}}}}, {"chats", json::array()}});

    auto login = run_coro(ioc, ioc.get_executor(), machine().resume("tok-abc"));

    EXPECT_TRUE(login.contains("profile"));
    EXPECT_TRUE(machine().authenticated());

    auto frames = transport->sent_with_opcode(19);
    ASSERT_EQ(frames.size(), 1u);
    const auto& payload = frames[0].at("payload");
    EXPECT_EQ(payload.at("token"), "tok-abc");
    EXPECT_EQ(payload.at("interactive"), false);
    EXPECT_EQ(payload.at("chatsCount"), 40);
}

// -----------------------------------------------------------------------------
// Resume_TokenRejected_ClearsTokenAndEmitsAuthRequired
// -----------------------------------------------------------------------------
TEST_F(AuthTest, Resume_TokenRejected_ClearsTokenAndEmitsAuthRequired) {
    session.set_token(std::string{"stale"});
    answer_error(19, "login.token", "FAIL_LOGIN_TOKEN");

    EXPECT_THROW((void)run_coro(ioc, ioc.get_executor(), machine().resume("stale")), protocol::AuthError);

    EXPECT_TRUE(std::holds_alternative<auth_state::ReauthRequired>(machine().state()));
    EXPECT_FALSE(session.snapshot().token.has_value());
    auto on_disk = SessionStore::load(config.session_path());
    ASSERT_TRUE(on_disk.has_value());
    EXPECT_FALSE(on_disk->token.has_value());

    ASSERT_TRUE(recorder.wait_for(1));
    EXPECT_EQ(recorder.count(events::kAuthRequired), 1u);
}

// -----------------------------------------------------------------------------
// ConcurrentOperation_IsRejected
// -----------------------------------------------------------------------------
TEST_F(AuthTest, ConcurrentOperation_IsRejected) {
    // No answer for the first request, so it stays in flight.
    std::exception_ptr first_error;
    bool first_done = false;
    asio::co_spawn(ioc, machine().begin_auth("+79990000000"), [&](std::exception_ptr e) {
        first_error = e;
        first_done = true;
    });
    drain(ioc);
    ASSERT_EQ(correlator.pending_count(), 1u);

    EXPECT_THROW(run_coro(ioc, ioc.get_executor(), machine().begin_auth("+79990000000")),
                 protocol::AuthError);

    auto seq = transport->sent_with_opcode(17).at(0).at("seq").get<std::uint64_t>();
    correlator.resolve(protocol::Response{seq, protocol::kCmdOk, 17, {{"token", "req-1"}}});
    ASSERT_TRUE(run_until(ioc, [&] { return first_done; }));
    EXPECT_FALSE(first_error);
    EXPECT_TRUE(std::holds_alternative<auth_state::CodeRequested>(machine().state()));
}

// -----------------------------------------------------------------------------
// BeginAuth_WhileAuthenticated_Throws
// -----------------------------------------------------------------------------
TEST_F(AuthTest, BeginAuth_WhileAuthenticated_Throws) {
    answer_ok(19, json::object());
    (void)run_coro(ioc, ioc.get_executor(), machine().resume("tok-abc"));

    EXPECT_THROW(run_coro(ioc, ioc.get_executor(), machine().begin_auth("+79990000000")),
                 protocol::AuthError);
}
