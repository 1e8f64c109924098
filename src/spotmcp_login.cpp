#include "spotmcp_auth_config.hpp"
#include "spotmcp_auth_coordinator.hpp"
#include "spotmcp_auth_errors.hpp"
#include "spotmcp_token_cache.hpp"
#include "spotmcp_tracing.hpp"

#include <cstring>
#include <ctime>
#include <iostream>
#include <string>

using namespace spotmcp;

namespace {

const int EXIT_AUTH_FAILED = 1;
const int EXIT_CONFIG_ERROR = 2;

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--status | --logout | --help]\n"
              << "\n"
              << "Without options, signs in to Spotify (cached token, refresh, or browser login).\n"
              << "  --status   Show the cached token state without contacting Spotify\n"
              << "  --logout   Delete the cached tokens\n"
              << "\n"
              << "Environment: SPOTIFY_CLIENT_ID (required), SPOTIFY_CALLBACK_PORT, SPOTIFY_SCOPES,\n"
              << "SPOTMCP_CACHE_DIR, SPOTMCP_CALLBACK_TIMEOUT, SPOTMCP_NO_BROWSER, SPOTMCP_TRACE_*" << std::endl;
}

std::string FormatTimestamp(int64_t epoch_seconds) {
    auto time = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buffer;
}

int ShowStatus(const AuthConfig& config) {
    TokenCache cache(config.GetCacheFilePath());
    auto now = CurrentEpochSeconds();
    auto record = cache.Load(now);

    std::cout << "Token cache: " << cache.GetPath() << std::endl;
    if (!record) {
        std::cout << "Status: not signed in" << std::endl;
        return EXIT_AUTH_FAILED;
    }

    std::cout << "Status: " << (TokenCache::IsFresh(*record, now) ? "valid" : "expired, refreshable") << std::endl;
    std::cout << "Expires: " << FormatTimestamp(record->expires_at) << std::endl;
    std::cout << "Scope: " << record->scope << std::endl;
    return 0;
}

int Logout(const AuthConfig& config) {
    TokenCache cache(config.GetCacheFilePath());
    if (cache.Clear()) {
        std::cout << "Removed cached tokens from " << cache.GetPath() << std::endl;
    } else {
        std::cout << "No cached tokens at " << cache.GetPath() << std::endl;
    }
    return 0;
}

int Login(const AuthConfig& config) {
    AuthCoordinator coordinator(config);
    auto client = coordinator.Authenticate();

    std::cout << "Signed in to Spotify" << std::endl;
    std::cout << "Token type: " << client->TokenType() << std::endl;
    std::cout << "Scope: " << client->Scope() << std::endl;
    std::cout << "Expires: " << FormatTimestamp(client->ExpiresAt()) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string mode;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--status") == 0 || std::strcmp(argv[i], "--logout") == 0) {
            if (!mode.empty()) {
                std::cerr << "Only one of --status and --logout may be given" << std::endl;
                return EXIT_CONFIG_ERROR;
            }
            mode = argv[i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            PrintUsage(argv[0]);
            return EXIT_CONFIG_ERROR;
        }
    }

    AuthConfig config;
    try {
        ConfigureTracingFromEnvironment();
        config = AuthConfig::FromEnvironment();
        if (mode.empty()) {
            config.Validate();
        }
    } catch (const AuthException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    try {
        if (mode == "--status") {
            return ShowStatus(config);
        }
        if (mode == "--logout") {
            return Logout(config);
        }
        return Login(config);
    } catch (const AuthException& e) {
        SPOTMCP_TRACE_ERROR("LOGIN", std::string("Login failed: ") + e.what());
        std::cerr << "Authentication failed (" << AuthErrorTypeToString(e.Type()) << "): " << e.what() << std::endl;
        return e.Type() == AuthErrorType::InvalidConfiguration ? EXIT_CONFIG_ERROR : EXIT_AUTH_FAILED;
    } catch (const std::exception& e) {
        std::cerr << "Authentication failed: " << e.what() << std::endl;
        return EXIT_AUTH_FAILED;
    }
}
