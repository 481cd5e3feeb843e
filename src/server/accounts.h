#pragma once

#include "src/server/audit.h"
#include "src/server/config.h"
#include "src/server/errors.h"
#include "src/server/identity_store.h"
#include "src/server/principal.h"

#include <cstdint>
#include <string>
#include <variant>

namespace aiexec {

// A freshly minted API key. The plaintext is only ever returned here; the store keeps
// its digest.
struct IssuedApiKey {
    std::string principal_id;
    std::string username;
    std::string api_key;
};

struct SessionToken {
    std::string principal_id;
    std::string access_token;
    int64_t expires_at = 0;
};

class AccountManager {
public:
    static constexpr const char* kApiKeyPrefix = "sk-";

    AccountManager(IdentityStore& store, AuditSink& audit) : store_(store), audit_(audit) {}

    // Caller must already have passed the privilege gate.
    std::variant<IssuedApiKey, ValidationFailure> CreateSuperuser(const std::string& username,
                                                                  const std::string& password);

    // Unknown user and wrong password are indistinguishable to the caller.
    std::variant<SessionToken, AuthFailure> Login(const std::string& username, const std::string& password,
                                                  const Settings& settings, const std::string& source_address);

    // Session for the default superuser, flagged as an auto-login session. Disabled
    // unless an auto-login mode is configured.
    std::variant<SessionToken, AuthFailure> AutoLogin(const Settings& settings, const std::string& source_address);

    std::variant<IssuedApiKey, AuthFailure> CreateApiKey(const Principal& principal);

    // Creates the configured default superuser in the development profile. A no-op when
    // it already exists; credentials are ignored with a warning in production.
    void BootstrapDefaultSuperuser(const Settings& settings);

private:
    SessionToken IssueSession(const UserAccount& account, bool auto_login, const Settings& settings) const;
    std::string MintApiKey(const std::string& principal_id);
    void Audit(const std::string& event, const std::string& principal_id, const std::string& source_address,
               const std::string& outcome, AuditSeverity severity) const;

    IdentityStore& store_;
    AuditSink& audit_;
};

} // namespace aiexec
