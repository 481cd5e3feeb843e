#pragma once

#include <cstdint>
#include <string>

namespace aiexec {

enum class Role {
    kStandard,
    kSuperuser
};

enum class CredentialKind {
    kNone,
    kApiKey,
    kSessionToken
};

// Where the trust in a principal comes from. Fabricated principals are produced by the
// auto-login skip-auth path without looking at any credential.
enum class Provenance {
    kVerified,
    kFabricated
};

struct Principal {
    std::string id;
    std::string username;
    Role role = Role::kStandard;
    CredentialKind credential = CredentialKind::kNone;
    Provenance provenance = Provenance::kVerified;
    int64_t issued_at = 0;
    int64_t expires_at = 0;
    // Passed the elevated-verification step: the account was re-resolved and is still an
    // active superuser, and the credential itself carries superuser standing.
    bool elevated = false;
    // Session minted by the auto-login endpoint rather than by a password login.
    bool auto_login_session = false;

    bool IsSuperuser() const { return role == Role::kSuperuser; }
    bool IsFabricated() const { return provenance == Provenance::kFabricated; }
};

inline const char* ToString(Role role) {
    return role == Role::kSuperuser ? "superuser" : "standard";
}

inline const char* ToString(CredentialKind kind) {
    switch (kind) {
        case CredentialKind::kNone: return "none";
        case CredentialKind::kApiKey: return "api-key";
        case CredentialKind::kSessionToken: return "session-token";
    }
    return "none";
}

inline const char* ToString(Provenance provenance) {
    return provenance == Provenance::kFabricated ? "fabricated" : "verified";
}

} // namespace aiexec
