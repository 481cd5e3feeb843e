#pragma once

#include <stdexcept>
#include <string>

namespace aiexec {

enum class AuthError {
    kUnauthorized,
    kForbidden,
    kDisabled
};

enum class ValidationError {
    kLimitExceeded,
    kMalformed
};

// Carries a client-safe message next to the error kind.
struct AuthFailure {
    AuthError error;
    std::string message;
};

struct ValidationFailure {
    ValidationError error;
    std::string message;
};

// Thrown only while loading or validating configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

inline const char* ToString(AuthError error) {
    switch (error) {
        case AuthError::kUnauthorized: return "unauthorized";
        case AuthError::kForbidden: return "forbidden";
        case AuthError::kDisabled: return "disabled";
    }
    return "unknown";
}

inline const char* ToString(ValidationError error) {
    switch (error) {
        case ValidationError::kLimitExceeded: return "limit-exceeded";
        case ValidationError::kMalformed: return "malformed";
    }
    return "unknown";
}

} // namespace aiexec
