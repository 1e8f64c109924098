#include "spotmcp_auth_errors.hpp"

namespace spotmcp {

std::string AuthErrorTypeToString(AuthErrorType type) {
    switch (type) {
        case AuthErrorType::CacheCorrupt: return "CacheCorrupt";
        case AuthErrorType::RefreshFailed: return "RefreshFailed";
        case AuthErrorType::CallbackError: return "CallbackError";
        case AuthErrorType::CallbackTimeout: return "CallbackTimeout";
        case AuthErrorType::StateMismatch: return "StateMismatch";
        case AuthErrorType::CodeExchangeFailed: return "CodeExchangeFailed";
        case AuthErrorType::PersistenceFailed: return "PersistenceFailed";
        case AuthErrorType::NotAuthenticated: return "NotAuthenticated";
        case AuthErrorType::ListenerFailed: return "ListenerFailed";
        case AuthErrorType::RandomSourceUnavailable: return "RandomSourceUnavailable";
        case AuthErrorType::InvalidConfiguration: return "InvalidConfiguration";
        default: return "Unknown";
    }
}

AuthException::AuthException(AuthErrorType type, const std::string& message)
    : std::runtime_error(message), type_(type) {
}

} // namespace spotmcp
