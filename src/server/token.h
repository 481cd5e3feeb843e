#pragma once

#include "src/server/principal.h"

#include <cstdint>
#include <string>
#include <variant>

namespace aiexec {

struct SessionClaims {
    std::string subject;
    Role role = Role::kStandard;
    int64_t issued_at = 0;
    int64_t expires_at = 0;
    // "su": the account was a superuser when the session was minted.
    bool superuser = false;
    // "al": minted by the auto-login endpoint.
    bool auto_login = false;
};

enum class TokenError {
    kMalformed,
    kUnsupportedAlgorithm,
    kBadSignature,
    kExpired,
    kNotYetValid
};

const char* ToString(TokenError error);

// HS256 JSON Web Tokens signed with the process-wide secret key.
class TokenSigner {
public:
    // Tolerated clock skew when checking iat.
    static constexpr int64_t kLeewaySeconds = 30;

    explicit TokenSigner(std::string secret) : secret_(std::move(secret)) {}

    std::string Issue(const SessionClaims& claims) const;
    std::variant<SessionClaims, TokenError> Verify(const std::string& token, int64_t now) const;

private:
    std::string secret_;
};

// Unix time in seconds.
int64_t NowSeconds();

} // namespace aiexec
