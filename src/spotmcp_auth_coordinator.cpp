#include "spotmcp_auth_coordinator.hpp"
#include "spotmcp_auth_errors.hpp"
#include "spotmcp_browser.hpp"
#include "spotmcp_callback_server.hpp"
#include "spotmcp_pkce.hpp"
#include "spotmcp_tracing.hpp"
#include <iostream>

namespace spotmcp {

std::string AuthStateToString(AuthState state) {
    switch (state) {
    case AuthState::Unauthenticated:
        return "Unauthenticated";
    case AuthState::CacheValid:
        return "CacheValid";
    case AuthState::CacheRefreshing:
        return "CacheRefreshing";
    case AuthState::CacheRefreshFailed:
        return "CacheRefreshFailed";
    case AuthState::FullFlowPending:
        return "FullFlowPending";
    case AuthState::FullFlowExchanging:
        return "FullFlowExchanging";
    case AuthState::Authenticated:
        return "Authenticated";
    default:
        return "Unknown";
    }
}

namespace {

AuthConfig ValidatedConfig(AuthConfig config) {
    config.Validate();
    return config;
}

} // anonymous namespace

AuthCoordinator::AuthCoordinator(AuthConfig config)
    : config_(ValidatedConfig(std::move(config))),
      cache_(config_.GetCacheFilePath()),
      token_client_(config_),
      browser_opener_(SpotmcpBrowser::OpenUrl),
      state_(AuthState::Unauthenticated) {
}

AuthCoordinator::AuthCoordinator(AuthConfig config, std::shared_ptr<HttpClient> http_client)
    : config_(ValidatedConfig(std::move(config))),
      cache_(config_.GetCacheFilePath()),
      token_client_(config_, std::move(http_client)),
      browser_opener_(SpotmcpBrowser::OpenUrl),
      state_(AuthState::Unauthenticated) {
}

std::shared_ptr<const ApiClient> AuthCoordinator::Authenticate() {
    std::lock_guard<std::mutex> flow_lock(flow_mutex_);

    auto current = CurrentClient();
    if (current && state_.load() == AuthState::Authenticated && !current->IsExpired()) {
        return current;
    }
    if (current) {
        SPOTMCP_TRACE_INFO("AUTH", "In-memory access token expired, re-evaluating token cache");
        Invalidate();
    }

    auto now = CurrentEpochSeconds();
    auto cached = cache_.Load(now);
    if (cached) {
        if (TokenCache::IsFresh(*cached, now)) {
            SetState(AuthState::CacheValid);
            SPOTMCP_TRACE_INFO("AUTH", "Using cached access token");
            return Adopt(*cached);
        }

        SPOTMCP_TRACE_INFO("AUTH", "Access token expired, refreshing...");
        auto refreshed = TryRefresh(*cached);
        if (refreshed) {
            return Adopt(*refreshed);
        }
    }

    return RunFullFlow();
}

std::optional<TokenRecord> AuthCoordinator::TryRefresh(const TokenRecord& stale) {
    if (!stale.HasRefreshToken()) {
        SPOTMCP_TRACE_INFO("AUTH", "Cached token has no refresh token, starting new auth flow");
        return std::nullopt;
    }

    SetState(AuthState::CacheRefreshing);
    try {
        auto response = token_client_.Refresh(stale.refresh_token);
        return cache_.Save(response);
    } catch (const std::exception& e) {
        SetState(AuthState::CacheRefreshFailed);
        SPOTMCP_TRACE_WARN("AUTH", "Failed to refresh token, starting new auth flow: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::shared_ptr<const ApiClient> AuthCoordinator::RunFullFlow() {
    SetState(AuthState::FullFlowPending);
    SPOTMCP_TRACE_INFO("AUTH", "Starting Spotify authentication...");

    try {
        auto pkce = PkceUtils::GeneratePkcePair();
        auto state = PkceUtils::GenerateState();
        auto auth_url = BuildAuthorizationUrl(pkce.challenge, state);

        // Bind before the browser can redirect to us
        CallbackListener listener(config_.callback_port, AuthConfig::CALLBACK_HOST);
        listener.Start();

        OpenBrowser(auth_url);
        auto result = listener.WaitForResult(config_.callback_timeout);

        if (result.IsError()) {
            throw AuthException(AuthErrorType::CallbackError, "OAuth error: " + result.error);
        }

        if (!PkceUtils::ValidateState(result.state, state)) {
            SPOTMCP_TRACE_ERROR("AUTH", "State mismatch on OAuth callback");
            throw AuthException(AuthErrorType::StateMismatch, "State mismatch - possible CSRF attack");
        }

        SetState(AuthState::FullFlowExchanging);
        auto response = token_client_.ExchangeCode(result.code, pkce.verifier);
        auto record = cache_.Save(response);

        SPOTMCP_TRACE_INFO("AUTH", "Authentication successful!");
        return Adopt(record);
    } catch (const AuthException& e) {
        SetState(AuthState::Unauthenticated);
        SPOTMCP_TRACE_ERROR("AUTH", "Authentication failed (" + AuthErrorTypeToString(e.Type()) + "): " + e.what());
        throw;
    } catch (const std::exception& e) {
        SetState(AuthState::Unauthenticated);
        SPOTMCP_TRACE_ERROR("AUTH", "Authentication failed: " + std::string(e.what()));
        throw;
    }
}

std::shared_ptr<const ApiClient> AuthCoordinator::Adopt(const TokenRecord& record) {
    auto client = std::make_shared<const ApiClient>(record);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client_ = client;
    }
    SetState(AuthState::Authenticated);
    return client;
}

std::shared_ptr<const ApiClient> AuthCoordinator::CurrentClient() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_;
}

void AuthCoordinator::OpenBrowser(const std::string& url) {
    // The prompt goes to stderr: stdout may be a protocol channel
    std::cerr << "If the browser doesn't open, visit: " << url << std::endl;
    SPOTMCP_TRACE_INFO("AUTH", "Authorization URL: " + url);

    BrowserOpener opener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        opener = browser_opener_;
    }
    if (!config_.open_browser || !opener) {
        SPOTMCP_TRACE_INFO("AUTH", "Browser launch disabled, waiting for manual authorization");
        return;
    }

    SPOTMCP_TRACE_INFO("AUTH", "Opening browser for authentication...");
    try {
        opener(url);
    } catch (const std::exception& e) {
        SPOTMCP_TRACE_WARN("AUTH", "Failed to open browser automatically: " + std::string(e.what()));
    }
}

std::string AuthCoordinator::BuildAuthorizationUrl(const std::string& code_challenge, const std::string& state) const {
    auto query = BuildQueryString({
        {"client_id", config_.client_id},
        {"response_type", "code"},
        {"redirect_uri", config_.GetRedirectUri()},
        {"code_challenge_method", "S256"},
        {"code_challenge", code_challenge},
        {"state", state},
        {"scope", config_.GetScopeString()},
    });
    auto separator = config_.authorize_url.find('?') == std::string::npos ? "?" : "&";
    return config_.authorize_url + separator + query;
}

std::shared_ptr<const ApiClient> AuthCoordinator::GetClient() const {
    auto client = CurrentClient();
    if (!client || state_.load() != AuthState::Authenticated) {
        throw AuthException(AuthErrorType::NotAuthenticated, "Not authenticated. Call Authenticate() first.");
    }
    return client;
}

void AuthCoordinator::Invalidate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client_.reset();
    }
    SetState(AuthState::Unauthenticated);
}

AuthState AuthCoordinator::GetState() const {
    return state_.load();
}

void AuthCoordinator::SetBrowserOpener(BrowserOpener opener) {
    std::lock_guard<std::mutex> lock(mutex_);
    browser_opener_ = std::move(opener);
}

void AuthCoordinator::SetState(AuthState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        SPOTMCP_TRACE_DEBUG("AUTH", "State " + AuthStateToString(previous) + " -> " + AuthStateToString(state));
    }
}

} // namespace spotmcp
