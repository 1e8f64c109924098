#pragma once

#include "spotmcp_auth_types.hpp"
#include "spotmcp_http_client.hpp"
#include <string>

namespace spotmcp {

// Authenticated handle handed to the Web API layer. Holds the bearer token only.
class ApiClient {
public:
    ApiClient(std::string access_token, std::string token_type, int64_t expires_at, std::string scope);
    explicit ApiClient(const TokenRecord& record);

    const std::string& AccessToken() const { return access_token_; }
    const std::string& TokenType() const { return token_type_; }
    const std::string& Scope() const { return scope_; }
    int64_t ExpiresAt() const { return expires_at_; }

    bool IsExpired() const;
    bool IsExpired(int64_t now) const;

    // "Bearer <token>"
    std::string AuthorizationHeader() const;

    // Sets the Authorization header on an outgoing Web API request
    void Authorize(HttpRequest& request) const;

private:
    std::string access_token_;
    std::string token_type_;
    int64_t expires_at_;
    std::string scope_;
};

} // namespace spotmcp
