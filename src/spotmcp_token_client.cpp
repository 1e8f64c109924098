#include "spotmcp_token_client.hpp"
#include "spotmcp_auth_errors.hpp"
#include "spotmcp_tracing.hpp"

#include <stdexcept>
#include <yyjson.h>

namespace spotmcp {

namespace {

const int64_t DEFAULT_EXPIRES_IN = 3600;

HttpParams TokenHttpParams(const AuthConfig& config) {
    HttpParams params;
    params.timeout = static_cast<uint64_t>(config.http_timeout.count());
    return params;
}

std::string GetJsonString(yyjson_val* root, const char* key) {
    auto val = yyjson_obj_get(root, key);
    if (val && yyjson_is_str(val)) {
        return std::string(yyjson_get_str(val), yyjson_get_len(val));
    }
    return std::string();
}

} // anonymous namespace

TokenEndpointClient::TokenEndpointClient(const AuthConfig& config)
    : TokenEndpointClient(config, std::make_shared<HttpClient>(TokenHttpParams(config))) {
}

TokenEndpointClient::TokenEndpointClient(const AuthConfig& config, std::shared_ptr<HttpClient> http_client)
    : config_(config), http_client_(std::move(http_client)) {
}

TokenResponse TokenEndpointClient::ExchangeCode(const std::string& code, const std::string& code_verifier) {
    SPOTMCP_TRACE_INFO("TOKEN_CLIENT", "Exchanging authorization code for tokens");

    if (code.empty()) {
        throw std::invalid_argument("Authorization code cannot be empty");
    }
    if (code_verifier.empty()) {
        throw std::invalid_argument("Code verifier cannot be empty");
    }

    try {
        auto tokens = PostForm(BuildCodeExchangeBody(code, code_verifier), "authorization_code");
        SPOTMCP_TRACE_INFO("TOKEN_CLIENT", "Successfully exchanged code for tokens");
        return tokens;
    } catch (const std::exception& e) {
        SPOTMCP_TRACE_ERROR("TOKEN_CLIENT", "Token exchange failed: " + std::string(e.what()));
        throw AuthException(AuthErrorType::CodeExchangeFailed, "Token exchange failed: " + std::string(e.what()));
    }
}

TokenResponse TokenEndpointClient::Refresh(const std::string& refresh_token) {
    SPOTMCP_TRACE_INFO("TOKEN_CLIENT", "Refreshing access token");

    if (refresh_token.empty()) {
        throw AuthException(AuthErrorType::RefreshFailed, "No refresh token available");
    }

    try {
        auto tokens = PostForm(BuildRefreshBody(refresh_token), "refresh_token");
        SPOTMCP_TRACE_INFO("TOKEN_CLIENT", "Successfully refreshed access token");
        return tokens;
    } catch (const std::exception& e) {
        SPOTMCP_TRACE_WARN("TOKEN_CLIENT", "Token refresh failed: " + std::string(e.what()));
        throw AuthException(AuthErrorType::RefreshFailed, "Token refresh failed: " + std::string(e.what()));
    }
}

TokenResponse TokenEndpointClient::PostForm(const std::string& body, const std::string& grant_type) {
    SPOTMCP_TRACE_DEBUG("TOKEN_CLIENT", "POST " + grant_type + " grant to " + config_.token_url);

    HttpRequest request(HttpMethod::POST, config_.token_url, "application/x-www-form-urlencoded", body);
    request.headers["Accept"] = "application/json";

    auto response = http_client_->SendRequest(request);
    if (!response) {
        throw std::runtime_error("No response received from token endpoint");
    }

    SPOTMCP_TRACE_DEBUG("TOKEN_CLIENT", "Token endpoint response status: " + std::to_string(response->Code()));

    if (response->Code() != 200) {
        throw HttpException(response->Code(), "HTTP " + std::to_string(response->Code()) + ": " +
                                              DescribeErrorResponse(response->Content()));
    }

    return ParseTokenResponse(response->Content());
}

std::string TokenEndpointClient::BuildCodeExchangeBody(const std::string& code, const std::string& code_verifier) const {
    return BuildQueryString({
        {"grant_type", "authorization_code"},
        {"code", code},
        {"redirect_uri", config_.GetRedirectUri()},
        {"client_id", config_.client_id},
        {"code_verifier", code_verifier},
    });
}

std::string TokenEndpointClient::BuildRefreshBody(const std::string& refresh_token) const {
    return BuildQueryString({
        {"grant_type", "refresh_token"},
        {"refresh_token", refresh_token},
        {"client_id", config_.client_id},
    });
}

TokenResponse TokenEndpointClient::ParseTokenResponse(const std::string& response_content) {
    if (response_content.empty()) {
        throw std::runtime_error("Token response content is empty");
    }

    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(response_content.c_str(), response_content.size(), 0), yyjson_doc_free);
    if (!doc) {
        throw std::runtime_error("Token response is not valid JSON");
    }

    auto root = yyjson_doc_get_root(doc.get());
    if (!root || !yyjson_is_obj(root)) {
        throw std::runtime_error("Token response is not a JSON object");
    }

    TokenResponse tokens;
    tokens.access_token = GetJsonString(root, "access_token");
    if (tokens.access_token.empty()) {
        throw std::runtime_error("Token response does not contain an access_token");
    }
    SPOTMCP_TRACE_DEBUG("TOKEN_CLIENT", "Access token: " + SpotmcpTracer::Redact(tokens.access_token));

    auto token_type = GetJsonString(root, "token_type");
    if (!token_type.empty()) {
        tokens.token_type = token_type;
    }

    tokens.refresh_token = GetJsonString(root, "refresh_token");
    if (!tokens.refresh_token.empty()) {
        SPOTMCP_TRACE_DEBUG("TOKEN_CLIENT", "Refresh token: " + SpotmcpTracer::Redact(tokens.refresh_token));
    }

    tokens.scope = GetJsonString(root, "scope");

    tokens.expires_in = DEFAULT_EXPIRES_IN;
    auto expires_in_val = yyjson_obj_get(root, "expires_in");
    if (expires_in_val && yyjson_is_uint(expires_in_val)) {
        tokens.expires_in = static_cast<int64_t>(yyjson_get_uint(expires_in_val));
    } else if (expires_in_val && yyjson_is_sint(expires_in_val)) {
        tokens.expires_in = yyjson_get_sint(expires_in_val);
    } else if (expires_in_val && yyjson_is_str(expires_in_val)) {
        try {
            tokens.expires_in = std::stoll(yyjson_get_str(expires_in_val));
        } catch (const std::exception&) {
            throw std::runtime_error("Token response has a non-numeric expires_in");
        }
    }

    return tokens;
}

std::string TokenEndpointClient::DescribeErrorResponse(const std::string& response_content) {
    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(response_content.c_str(), response_content.size(), 0), yyjson_doc_free);
    auto root = doc ? yyjson_doc_get_root(doc.get()) : nullptr;
    if (!root || !yyjson_is_obj(root)) {
        return response_content;
    }

    auto error = GetJsonString(root, "error");
    auto description = GetJsonString(root, "error_description");
    if (error.empty()) {
        return response_content;
    }
    return description.empty() ? error : error + ": " + description;
}

} // namespace spotmcp
