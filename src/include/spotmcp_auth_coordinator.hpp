#pragma once

#include "spotmcp_api_client.hpp"
#include "spotmcp_auth_config.hpp"
#include "spotmcp_auth_types.hpp"
#include "spotmcp_token_cache.hpp"
#include "spotmcp_token_client.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace spotmcp {

enum class AuthState {
    Unauthenticated,
    CacheValid,
    CacheRefreshing,
    CacheRefreshFailed,
    FullFlowPending,
    FullFlowExchanging,
    Authenticated
};

std::string AuthStateToString(AuthState state);

// Produces an authenticated ApiClient, preferring the cached token, then a
// refresh, then the interactive browser flow.
class AuthCoordinator {
public:
    using BrowserOpener = std::function<void(const std::string& url)>;

    // Throws AuthException(InvalidConfiguration) for an unusable config
    explicit AuthCoordinator(AuthConfig config);
    AuthCoordinator(AuthConfig config, std::shared_ptr<HttpClient> http_client);

    AuthCoordinator(const AuthCoordinator&) = delete;
    AuthCoordinator& operator=(const AuthCoordinator&) = delete;

    // Blocking. May open a browser and wait for the redirect.
    std::shared_ptr<const ApiClient> Authenticate();

    // No network; throws AuthException(NotAuthenticated) before a successful Authenticate()
    std::shared_ptr<const ApiClient> GetClient() const;

    // Drops the in-memory client. The cache file is left alone.
    void Invalidate();

    AuthState GetState() const;

    // Replaces the system browser launcher
    void SetBrowserOpener(BrowserOpener opener);

    std::string BuildAuthorizationUrl(const std::string& code_challenge, const std::string& state) const;

    const AuthConfig& GetConfig() const { return config_; }
    const TokenCache& GetTokenCache() const { return cache_; }

private:
    AuthConfig config_;
    TokenCache cache_;
    TokenEndpointClient token_client_;
    BrowserOpener browser_opener_;

    // flow_mutex_ serializes Authenticate(); mutex_ guards the members below it
    std::mutex flow_mutex_;
    mutable std::mutex mutex_;
    std::shared_ptr<const ApiClient> client_;
    std::atomic<AuthState> state_;

    std::optional<TokenRecord> TryRefresh(const TokenRecord& stale);
    std::shared_ptr<const ApiClient> RunFullFlow();
    std::shared_ptr<const ApiClient> Adopt(const TokenRecord& record);
    std::shared_ptr<const ApiClient> CurrentClient() const;
    void OpenBrowser(const std::string& url);
    void SetState(AuthState state);
};

} // namespace spotmcp
