#pragma once

#include <stdexcept>
#include <string>

namespace spotmcp {

// Failure kinds of the authentication subsystem. Only the terminal kinds
// (CallbackError, CallbackTimeout, StateMismatch, CodeExchangeFailed,
// ListenerFailed, RandomSourceUnavailable) escape AuthCoordinator::Authenticate().
enum class AuthErrorType {
    CacheCorrupt,
    RefreshFailed,
    CallbackError,
    CallbackTimeout,
    StateMismatch,
    CodeExchangeFailed,
    PersistenceFailed,
    NotAuthenticated,
    ListenerFailed,
    RandomSourceUnavailable,
    InvalidConfiguration
};

std::string AuthErrorTypeToString(AuthErrorType type);

class AuthException : public std::runtime_error {
public:
    AuthException(AuthErrorType type, const std::string& message);

    AuthErrorType Type() const { return type_; }

private:
    AuthErrorType type_;
};

} // namespace spotmcp
