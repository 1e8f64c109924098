#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace spotmcp {

// OAuth2 configuration for the authorization-code + PKCE flow against the
// Spotify accounts service (or any provider exposing the same endpoints).
struct AuthConfig {
    static constexpr const char* DEFAULT_AUTHORIZE_URL = "https://accounts.spotify.com/authorize";
    static constexpr const char* DEFAULT_TOKEN_URL = "https://accounts.spotify.com/api/token";
    static constexpr int DEFAULT_CALLBACK_PORT = 8888;
    static constexpr const char* CALLBACK_HOST = "127.0.0.1";
    static constexpr const char* CALLBACK_PATH = "/callback";
    static constexpr const char* CACHE_FILE_NAME = "token-cache.json";

    std::string client_id;
    std::vector<std::string> scopes;
    int callback_port;
    std::string cache_dir;
    std::string authorize_url;
    std::string token_url;

    // Upper bound for the browser round trip; zero waits forever
    std::chrono::seconds callback_timeout;
    std::chrono::milliseconds http_timeout;
    bool open_browser;

    AuthConfig() :
        client_id(""),
        scopes(DefaultScopes()),
        callback_port(DEFAULT_CALLBACK_PORT),
        cache_dir(DefaultCacheDir()),
        authorize_url(DEFAULT_AUTHORIZE_URL),
        token_url(DEFAULT_TOKEN_URL),
        callback_timeout(std::chrono::seconds(300)),
        http_timeout(std::chrono::milliseconds(15000)),
        open_browser(true) {}

    // http://127.0.0.1:<callback_port>/callback
    std::string GetRedirectUri() const;

    // Scopes joined with single spaces
    std::string GetScopeString() const;

    // <cache_dir>/token-cache.json
    std::string GetCacheFilePath() const;

    // Throws AuthException(InvalidConfiguration) on unusable settings
    void Validate() const;

    // Scope set requested by the Spotify MCP server
    static std::vector<std::string> DefaultScopes();

    // $HOME/.spotify-mcp (USERPROFILE on Windows), "./.spotify-mcp" without a home
    static std::string DefaultCacheDir();

    // Reads SPOTIFY_* / SPOTMCP_* variables over the defaults
    static AuthConfig FromEnvironment();

    // Splits a space or comma separated scope list, dropping empty entries
    static std::vector<std::string> ParseScopeList(const std::string& value);
};

// Applies SPOTMCP_TRACE_ENABLED, SPOTMCP_TRACE_LEVEL, SPOTMCP_TRACE_OUTPUT and
// SPOTMCP_TRACE_DIRECTORY to the global tracer.
void ConfigureTracingFromEnvironment();

} // namespace spotmcp
