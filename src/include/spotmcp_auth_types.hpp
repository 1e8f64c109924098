#pragma once

#include <cstdint>
#include <string>

namespace spotmcp {

// Seconds subtracted from a token's lifetime before it counts as usable
constexpr int64_t TOKEN_EXPIRY_BUFFER_SECONDS = 300;

// Seconds since the Unix epoch from the system clock
int64_t CurrentEpochSeconds();

// Parsed token endpoint response, before any expiry bookkeeping
struct TokenResponse {
    std::string access_token;
    std::string token_type;
    int64_t expires_in;
    std::string refresh_token;   // Empty when the provider did not rotate it
    std::string scope;

    TokenResponse() : token_type("Bearer"), expires_in(0) {}
};

// What lives in token-cache.json
struct TokenRecord {
    std::string access_token;
    std::string token_type;
    int64_t expires_in;
    std::string refresh_token;
    std::string scope;
    int64_t expires_at;          // Unix timestamp, computed locally at save time

    TokenRecord() : token_type("Bearer"), expires_in(0), expires_at(0) {}

    bool HasRefreshToken() const { return !refresh_token.empty(); }

    // True once expires_at has passed, no buffer applied
    bool IsExpired(int64_t now) const { return expires_at <= now; }
};

// Outcome of one browser round trip. Either code + state, or error.
struct CallbackResult {
    std::string code;
    std::string state;
    std::string error;

    bool IsError() const { return !error.empty(); }

    static CallbackResult Success(const std::string& code, const std::string& state);
    static CallbackResult Failure(const std::string& error);
};

} // namespace spotmcp
