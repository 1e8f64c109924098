#include "spotmcp_api_client.hpp"
#include <stdexcept>

namespace spotmcp {

ApiClient::ApiClient(std::string access_token, std::string token_type, int64_t expires_at, std::string scope)
    : access_token_(std::move(access_token)),
      token_type_(token_type.empty() ? std::string("Bearer") : std::move(token_type)),
      expires_at_(expires_at),
      scope_(std::move(scope)) {
    if (access_token_.empty()) {
        throw std::invalid_argument("Access token cannot be empty");
    }
}

ApiClient::ApiClient(const TokenRecord& record)
    : ApiClient(record.access_token, record.token_type, record.expires_at, record.scope) {
}

bool ApiClient::IsExpired() const {
    return IsExpired(CurrentEpochSeconds());
}

bool ApiClient::IsExpired(int64_t now) const {
    return expires_at_ <= now;
}

std::string ApiClient::AuthorizationHeader() const {
    // Spotify issues "Bearer"; normalise the casing some providers return
    auto type = token_type_;
    if (type == "bearer" || type == "BEARER") {
        type = "Bearer";
    }
    return type + " " + access_token_;
}

void ApiClient::Authorize(HttpRequest& request) const {
    request.headers["Authorization"] = AuthorizationHeader();
}

} // namespace spotmcp
