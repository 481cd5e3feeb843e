#pragma once

#include "src/server/principal.h"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace aiexec {

struct UserAccount {
    std::string id;
    std::string username;
    Role role = Role::kStandard;
    bool active = true;
    std::string password_hash;
    int64_t created_at = 0;
};

// What an API key resolves to.
struct PrincipalRecord {
    std::string principal_id;
    std::string username;
    Role role = Role::kStandard;
    bool active = true;
};

// Identity/token store. API keys are only ever handled as SHA-256 digests here.
class IdentityStore {
public:
    virtual ~IdentityStore() = default;

    virtual std::optional<PrincipalRecord> LookupApiKey(const std::string& key_digest) const = 0;
    virtual std::optional<UserAccount> LookupPrincipal(const std::string& id) const = 0;
    virtual std::optional<UserAccount> FindByUsername(const std::string& username) const = 0;

    // False when the username is already taken.
    virtual bool AddAccount(const UserAccount& account) = 0;
    // False when the principal does not exist or the digest is already registered.
    virtual bool AddApiKey(const std::string& key_digest, const std::string& principal_id) = 0;
};

class InMemoryIdentityStore : public IdentityStore {
public:
    std::optional<PrincipalRecord> LookupApiKey(const std::string& key_digest) const override;
    std::optional<UserAccount> LookupPrincipal(const std::string& id) const override;
    std::optional<UserAccount> FindByUsername(const std::string& username) const override;
    bool AddAccount(const UserAccount& account) override;
    bool AddApiKey(const std::string& key_digest, const std::string& principal_id) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, UserAccount> accounts_;
    std::map<std::string, std::string> username_index_;
    std::map<std::string, std::string> api_keys_;
};

} // namespace aiexec
