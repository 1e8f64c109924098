#pragma once

#include "spotmcp_auth_config.hpp"
#include "spotmcp_auth_types.hpp"
#include "spotmcp_http_client.hpp"
#include <memory>
#include <string>

namespace spotmcp {

// Talks to the OAuth2 token endpoint for a public (secretless) PKCE client.
class TokenEndpointClient {
public:
    explicit TokenEndpointClient(const AuthConfig& config);
    TokenEndpointClient(const AuthConfig& config, std::shared_ptr<HttpClient> http_client);

    // authorization_code grant. Throws AuthException(CodeExchangeFailed).
    TokenResponse ExchangeCode(const std::string& code, const std::string& code_verifier);

    // refresh_token grant. Throws AuthException(RefreshFailed).
    TokenResponse Refresh(const std::string& refresh_token);

    std::string BuildCodeExchangeBody(const std::string& code, const std::string& code_verifier) const;
    std::string BuildRefreshBody(const std::string& refresh_token) const;

    // Requires access_token. token_type defaults to Bearer, expires_in to 3600.
    static TokenResponse ParseTokenResponse(const std::string& response_content);

    // "error: error_description" from an OAuth2 error body, or the raw body
    static std::string DescribeErrorResponse(const std::string& response_content);

private:
    AuthConfig config_;
    std::shared_ptr<HttpClient> http_client_;

    TokenResponse PostForm(const std::string& body, const std::string& grant_type);
};

} // namespace spotmcp
