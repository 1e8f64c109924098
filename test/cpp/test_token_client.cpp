#include "catch2/catch.hpp"
#include "spotmcp_auth_errors.hpp"
#include "spotmcp_token_client.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace spotmcp;
using namespace spotmcp::test;

TEST_CASE("Token endpoint request bodies", "[token_client]") {
    TempDir dir;
    auto config = MakeTestConfig(dir.Str(), "http://127.0.0.1:1/api/token", 8888);
    TokenEndpointClient client(config);

    SECTION("Code exchange body carries the verifier and redirect URI") {
        auto form = ParseQueryString(client.BuildCodeExchangeBody("auth-code", "my-verifier"));
        REQUIRE(FindQueryParam(form, "grant_type") == "authorization_code");
        REQUIRE(FindQueryParam(form, "code") == "auth-code");
        REQUIRE(FindQueryParam(form, "redirect_uri") == "http://127.0.0.1:8888/callback");
        REQUIRE(FindQueryParam(form, "client_id") == "abc123");
        REQUIRE(FindQueryParam(form, "code_verifier") == "my-verifier");
        REQUIRE(FindQueryParam(form, "client_secret").empty());
    }

    SECTION("Redirect URI is form encoded") {
        auto body = client.BuildCodeExchangeBody("auth-code", "my-verifier");
        REQUIRE(body.find("redirect_uri=http%3A%2F%2F127.0.0.1%3A8888%2Fcallback") != std::string::npos);
    }

    SECTION("Refresh body") {
        auto form = ParseQueryString(client.BuildRefreshBody("refresh-xyz"));
        REQUIRE(form.size() == 3);
        REQUIRE(FindQueryParam(form, "grant_type") == "refresh_token");
        REQUIRE(FindQueryParam(form, "refresh_token") == "refresh-xyz");
        REQUIRE(FindQueryParam(form, "client_id") == "abc123");
    }
}

TEST_CASE("Token response parsing", "[token_client]") {
    SECTION("Complete response") {
        auto tokens = TokenEndpointClient::ParseTokenResponse(
            R"({"access_token":"at","token_type":"Bearer","expires_in":1800,"refresh_token":"rt","scope":"a b"})");
        REQUIRE(tokens.access_token == "at");
        REQUIRE(tokens.token_type == "Bearer");
        REQUIRE(tokens.expires_in == 1800);
        REQUIRE(tokens.refresh_token == "rt");
        REQUIRE(tokens.scope == "a b");
    }

    SECTION("Defaults for optional fields") {
        auto tokens = TokenEndpointClient::ParseTokenResponse(R"({"access_token":"at"})");
        REQUIRE(tokens.token_type == "Bearer");
        REQUIRE(tokens.expires_in == 3600);
        REQUIRE(tokens.refresh_token.empty());
    }

    SECTION("expires_in given as a string") {
        auto tokens = TokenEndpointClient::ParseTokenResponse(R"({"access_token":"at","expires_in":"120"})");
        REQUIRE(tokens.expires_in == 120);
    }

    SECTION("Invalid responses") {
        REQUIRE_THROWS_AS(TokenEndpointClient::ParseTokenResponse(""), std::runtime_error);
        REQUIRE_THROWS_AS(TokenEndpointClient::ParseTokenResponse("not json"), std::runtime_error);
        REQUIRE_THROWS_AS(TokenEndpointClient::ParseTokenResponse(R"(["at"])"), std::runtime_error);
        REQUIRE_THROWS_AS(TokenEndpointClient::ParseTokenResponse(R"({"token_type":"Bearer"})"), std::runtime_error);
    }

    SECTION("OAuth2 error bodies") {
        REQUIRE(TokenEndpointClient::DescribeErrorResponse(
                    R"({"error":"invalid_grant","error_description":"Invalid authorization code"})") ==
                "invalid_grant: Invalid authorization code");
        REQUIRE(TokenEndpointClient::DescribeErrorResponse(R"({"error":"invalid_client"})") == "invalid_client");
        REQUIRE(TokenEndpointClient::DescribeErrorResponse("Bad Gateway") == "Bad Gateway");
    }
}

TEST_CASE("Token endpoint round trips", "[token_client]") {
    TempDir dir;
    MockTokenServer server;
    auto config = MakeTestConfig(dir.Str(), server.TokenUrl(), 8888);
    TokenEndpointClient client(config);

    SECTION("Code exchange posts a form and parses the tokens") {
        auto tokens = client.ExchangeCode("auth-code", "my-verifier");
        REQUIRE(tokens.access_token == "mock-access-token-0123456789");
        REQUIRE(tokens.refresh_token == "mock-refresh-token-0123456789");
        REQUIRE(server.CodeCalls() == 1);
        REQUIRE(server.RefreshCalls() == 0);
        REQUIRE(server.LastContentType() == "application/x-www-form-urlencoded");

        auto form = server.LastForm();
        REQUIRE(FindQueryParam(form, "code") == "auth-code");
        REQUIRE(FindQueryParam(form, "code_verifier") == "my-verifier");
        REQUIRE(FindQueryParam(form, "code_challenge").empty());
    }

    SECTION("Refresh posts the refresh grant") {
        server.Respond(200, R"({"access_token":"new-access","token_type":"Bearer","expires_in":3600,"scope":"user-read-email"})");
        auto tokens = client.Refresh("refresh-xyz");
        REQUIRE(tokens.access_token == "new-access");
        REQUIRE(tokens.refresh_token.empty());
        REQUIRE(server.RefreshCalls() == 1);
        REQUIRE(FindQueryParam(server.LastForm(), "refresh_token") == "refresh-xyz");
    }

    SECTION("Rejected refresh carries the provider's error") {
        server.Respond(400, R"({"error":"invalid_grant","error_description":"Refresh token revoked"})");
        try {
            client.Refresh("refresh-xyz");
            FAIL("Refresh should have thrown");
        } catch (const AuthException& e) {
            REQUIRE(e.Type() == AuthErrorType::RefreshFailed);
            std::string message = e.what();
            REQUIRE(message.find("invalid_grant") != std::string::npos);
            REQUIRE(message.find("Refresh token revoked") != std::string::npos);
        }
    }

    SECTION("Rejected code exchange") {
        server.Respond(400, R"({"error":"invalid_grant","error_description":"Invalid authorization code"})");
        try {
            client.ExchangeCode("auth-code", "my-verifier");
            FAIL("Exchange should have thrown");
        } catch (const AuthException& e) {
            REQUIRE(e.Type() == AuthErrorType::CodeExchangeFailed);
            REQUIRE(std::string(e.what()).find("Invalid authorization code") != std::string::npos);
        }
    }

    SECTION("Success status with an unusable body") {
        server.Respond(200, R"({"token_type":"Bearer"})");
        REQUIRE_THROWS_AS(client.ExchangeCode("auth-code", "my-verifier"), AuthException);
    }

    SECTION("Empty arguments") {
        REQUIRE_THROWS_AS(client.ExchangeCode("", "my-verifier"), std::invalid_argument);
        REQUIRE_THROWS_AS(client.ExchangeCode("auth-code", ""), std::invalid_argument);
        REQUIRE_THROWS_AS(client.Refresh(""), AuthException);
        REQUIRE(server.TotalCalls() == 0);
    }
}

TEST_CASE("Token endpoint unreachable", "[token_client]") {
    TempDir dir;
    auto port = FindFreePort();
    auto config = MakeTestConfig(dir.Str(), "http://127.0.0.1:" + std::to_string(port) + "/api/token", 8888);
    TokenEndpointClient client(config);

    try {
        client.ExchangeCode("auth-code", "my-verifier");
        FAIL("Exchange should have thrown");
    } catch (const AuthException& e) {
        REQUIRE(e.Type() == AuthErrorType::CodeExchangeFailed);
    }
}
