#include "spotmcp_auth_config.hpp"
#include "spotmcp_auth_errors.hpp"
#include "spotmcp_tracing.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace spotmcp {

namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool IsTruthy(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

int ParseIntSetting(const char* name, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw AuthException(AuthErrorType::InvalidConfiguration,
                            std::string(name) + " must be an integer, got '" + value + "'");
    }
}

} // anonymous namespace

std::string AuthConfig::GetRedirectUri() const {
    return std::string("http://") + CALLBACK_HOST + ":" + std::to_string(callback_port) + CALLBACK_PATH;
}

std::string AuthConfig::GetScopeString() const {
    std::ostringstream joined;
    for (size_t i = 0; i < scopes.size(); ++i) {
        if (i > 0) {
            joined << ' ';
        }
        joined << scopes[i];
    }
    return joined.str();
}

std::string AuthConfig::GetCacheFilePath() const {
    std::filesystem::path path = cache_dir;
    path /= CACHE_FILE_NAME;
    return path.string();
}

void AuthConfig::Validate() const {
    if (client_id.empty()) {
        throw AuthException(AuthErrorType::InvalidConfiguration, "Client ID is required (set SPOTIFY_CLIENT_ID)");
    }
    if (scopes.empty()) {
        throw AuthException(AuthErrorType::InvalidConfiguration, "At least one scope must be requested");
    }
    if (callback_port < 1 || callback_port > 65535) {
        throw AuthException(AuthErrorType::InvalidConfiguration,
                            "Callback port out of range: " + std::to_string(callback_port));
    }
    if (authorize_url.empty() || token_url.empty()) {
        throw AuthException(AuthErrorType::InvalidConfiguration, "Authorization and token endpoint URLs must be set");
    }
    if (cache_dir.empty()) {
        throw AuthException(AuthErrorType::InvalidConfiguration, "Token cache directory must be set");
    }
}

std::vector<std::string> AuthConfig::DefaultScopes() {
    return {
        "user-read-private",
        "user-read-email",
        "user-library-read",
        "user-library-modify",
        "playlist-read-private",
        "playlist-read-collaborative",
        "playlist-modify-public",
        "playlist-modify-private",
        "user-top-read",
        "user-read-recently-played",
        "user-read-playback-state",
        "user-modify-playback-state",
        "user-read-currently-playing",
    };
}

std::string AuthConfig::DefaultCacheDir() {
#ifdef _WIN32
    auto home = GetEnv("USERPROFILE");
#else
    auto home = GetEnv("HOME");
#endif
    std::filesystem::path base = home.empty() ? std::filesystem::path(".") : std::filesystem::path(home);
    return (base / ".spotify-mcp").string();
}

std::vector<std::string> AuthConfig::ParseScopeList(const std::string& value) {
    std::vector<std::string> result;
    std::string current;
    for (char c : value) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                result.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        result.push_back(current);
    }
    return result;
}

AuthConfig AuthConfig::FromEnvironment() {
    AuthConfig config;

    config.client_id = GetEnv("SPOTIFY_CLIENT_ID");

    auto port = GetEnv("SPOTIFY_CALLBACK_PORT");
    if (!port.empty()) {
        config.callback_port = ParseIntSetting("SPOTIFY_CALLBACK_PORT", port);
    }

    auto scopes = GetEnv("SPOTIFY_SCOPES");
    if (!scopes.empty()) {
        config.scopes = ParseScopeList(scopes);
    }

    auto cache_dir = GetEnv("SPOTMCP_CACHE_DIR");
    if (!cache_dir.empty()) {
        config.cache_dir = cache_dir;
    }

    auto authorize_url = GetEnv("SPOTIFY_AUTHORIZE_URL");
    if (!authorize_url.empty()) {
        config.authorize_url = authorize_url;
    }

    auto token_url = GetEnv("SPOTIFY_TOKEN_URL");
    if (!token_url.empty()) {
        config.token_url = token_url;
    }

    auto timeout = GetEnv("SPOTMCP_CALLBACK_TIMEOUT");
    if (!timeout.empty()) {
        auto seconds = ParseIntSetting("SPOTMCP_CALLBACK_TIMEOUT", timeout);
        if (seconds < 0) {
            throw AuthException(AuthErrorType::InvalidConfiguration, "SPOTMCP_CALLBACK_TIMEOUT must not be negative");
        }
        config.callback_timeout = std::chrono::seconds(seconds);
    }

    if (IsTruthy(GetEnv("SPOTMCP_NO_BROWSER"))) {
        config.open_browser = false;
    }

    SPOTMCP_TRACE_DEBUG("AUTH_CONFIG", "Loaded configuration from environment, redirect URI: " + config.GetRedirectUri());
    return config;
}

void ConfigureTracingFromEnvironment() {
    auto& tracer = SpotmcpTracer::Instance();

    auto output = GetEnv("SPOTMCP_TRACE_OUTPUT");
    if (!output.empty()) {
        std::transform(output.begin(), output.end(), output.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        tracer.SetOutputMode(output);
    }

    auto directory = GetEnv("SPOTMCP_TRACE_DIRECTORY");
    if (!directory.empty()) {
        tracer.SetTraceDirectory(directory);
    }

    auto level = GetEnv("SPOTMCP_TRACE_LEVEL");
    if (!level.empty()) {
        tracer.SetLevel(StringToTraceLevel(level));
    }

    auto enabled = GetEnv("SPOTMCP_TRACE_ENABLED");
    if (!enabled.empty()) {
        tracer.SetEnabled(IsTruthy(enabled));
    }
}

} // namespace spotmcp
