// =============================================================================
// Client Configuration Unit Tests
// Validates URL parsing, defaults and the builder chain
// =============================================================================

#include <chrono>
#include <stdexcept>

#include <gtest/gtest.h>

#include "client_config.hpp"

using namespace std::chrono_literals;
using svckit::ClientConfig;
using svckit::Endpoint;

// -----------------------------------------------------------------------------
// ParseWss_DefaultsToPort443
// -----------------------------------------------------------------------------
TEST(EndpointTest, ParseWss_DefaultsToPort443) {
    auto ep = Endpoint::parse("wss://ws-api.oneme.ru/websocket");
    EXPECT_EQ(ep.host(), "ws-api.oneme.ru");
    EXPECT_EQ(ep.port(), 443);
    EXPECT_EQ(ep.target(), "/websocket");
    EXPECT_TRUE(ep.use_tls());
    EXPECT_EQ(ep.host_header(), "ws-api.oneme.ru:443");
}

// -----------------------------------------------------------------------------
// ParseWs_ExplicitPortAndNoPath
// -----------------------------------------------------------------------------
TEST(EndpointTest, ParseWs_ExplicitPortAndNoPath) {
    auto ep = Endpoint::parse("ws://127.0.0.1:8080");
    EXPECT_EQ(ep.host(), "127.0.0.1");
    EXPECT_EQ(ep.port(), 8080);
    EXPECT_EQ(ep.target(), "/");
    EXPECT_FALSE(ep.use_tls());
    EXPECT_EQ(ep.ws_url(), "ws://127.0.0.1:8080/");
}

// -----------------------------------------------------------------------------
// ParseInvalid_Throws
// -----------------------------------------------------------------------------
TEST(EndpointTest, ParseInvalid_Throws) {
    EXPECT_THROW(Endpoint::parse("https://web.max.ru"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("wss://host:notaport/x"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("wss://host:70000/x"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("wss:///websocket"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Defaults_MatchOfficialWebClient
// -----------------------------------------------------------------------------
TEST(ClientConfigTest, Defaults_MatchOfficialWebClient) {
    ClientConfig cfg;
    EXPECT_EQ(cfg.endpoint().host(), "ws-api.oneme.ru");
    EXPECT_EQ(cfg.origin(), "https://web.max.ru");
    EXPECT_EQ(cfg.call_timeout(), 10s);
    EXPECT_EQ(cfg.max_code_attempts(), 3u);
    EXPECT_EQ(cfg.chats_count(), 40);
    EXPECT_EQ(cfg.contacts_sync_limit(), 50u);
    EXPECT_EQ(cfg.opcodes().session_init, 6);
    EXPECT_EQ(cfg.opcodes().send_message, 64);
    EXPECT_FALSE(cfg.opcodes().contact_patch.has_value());
    EXPECT_FALSE(cfg.phone().has_value());
    EXPECT_EQ(cfg.device().device_type, "ANDROID");
}

// -----------------------------------------------------------------------------
// Builders_OverrideIndividualFields
// -----------------------------------------------------------------------------
TEST(ClientConfigTest, Builders_OverrideIndividualFields) {
    auto cfg = ClientConfig{}
        .with_url("ws://localhost:9000/ws")
        .with_session_path("state/alice.json")
        .with_call_timeout(250ms)
        .with_phone("+79990000000")
        .with_navigation_events(false);

    EXPECT_EQ(cfg.endpoint().port(), 9000);
    EXPECT_EQ(cfg.session_path().string(), "state/alice.json");
    EXPECT_EQ(cfg.call_timeout(), 250ms);
    ASSERT_TRUE(cfg.phone().has_value());
    EXPECT_EQ(*cfg.phone(), "+79990000000");
    EXPECT_FALSE(cfg.navigation_events());
    EXPECT_EQ(cfg.auth_timeout(), 60s);
}

// -----------------------------------------------------------------------------
// AuthErrorCodes_ClassifyTokenRejectionAndRateLimit
// -----------------------------------------------------------------------------
TEST(ClientConfigTest, AuthErrorCodes_ClassifyTokenRejectionAndRateLimit) {
    ClientConfig cfg;
    const auto& codes = cfg.auth_codes();
    EXPECT_TRUE(codes.is_token_rejection("login.token", ""));
    EXPECT_TRUE(codes.is_token_rejection("", "FAIL_LOGIN_TOKEN"));
    EXPECT_FALSE(codes.is_token_rejection("verify.code.wrong", "Wrong code"));
    EXPECT_TRUE(codes.is_rate_limit("error.limit.violate"));
    EXPECT_FALSE(codes.is_rate_limit("login.token"));
}
