#pragma once

#include "src/server/audit.h"
#include "src/server/config.h"
#include "src/server/errors.h"
#include "src/server/identity_store.h"
#include "src/server/principal.h"

#include <string>
#include <variant>

namespace aiexec {

// Credential material extracted from an inbound call. Either field may be empty.
struct AuthRequest {
    std::string api_key;
    std::string bearer_token;
    std::string source_address;
};

// Turns request credentials into a Principal under the auth mode of the given settings
// snapshot. Only in-memory lookups and HMAC work happen here; nothing blocks.
class CredentialVerifier {
public:
    CredentialVerifier(const IdentityStore& store, AuditSink& audit) : store_(store), audit_(audit) {}

    std::variant<Principal, AuthFailure> Verify(const AuthRequest& request, const Settings& settings) const;

private:
    std::variant<Principal, AuthFailure> VerifyApiKey(const std::string& key, std::string* detail) const;
    std::variant<Principal, AuthFailure> VerifySession(const std::string& token, const Settings& settings,
                                                       std::string* detail) const;
    Principal Fabricate(const Settings& settings) const;

    // Re-reads the account behind a resolved credential: it must still exist, be active,
    // and be a superuser for the principal to count as one.
    bool StillActiveSuperuser(const std::string& principal_id) const;

    const IdentityStore& store_;
    AuditSink& audit_;
};

} // namespace aiexec
