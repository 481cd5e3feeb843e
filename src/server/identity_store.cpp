#include "src/server/identity_store.h"

#include <mutex>

namespace aiexec {

std::optional<PrincipalRecord> InMemoryIdentityStore::LookupApiKey(const std::string& key_digest) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto key = api_keys_.find(key_digest);
    if (key == api_keys_.end()) return std::nullopt;

    auto account = accounts_.find(key->second);
    if (account == accounts_.end()) return std::nullopt;

    PrincipalRecord record;
    record.principal_id = account->second.id;
    record.username = account->second.username;
    record.role = account->second.role;
    record.active = account->second.active;
    return record;
}

std::optional<UserAccount> InMemoryIdentityStore::LookupPrincipal(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) return std::nullopt;
    return it->second;
}

std::optional<UserAccount> InMemoryIdentityStore::FindByUsername(const std::string& username) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = username_index_.find(username);
    if (it == username_index_.end()) return std::nullopt;
    return accounts_.at(it->second);
}

bool InMemoryIdentityStore::AddAccount(const UserAccount& account) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (username_index_.count(account.username) || accounts_.count(account.id)) return false;

    accounts_[account.id] = account;
    username_index_[account.username] = account.id;
    return true;
}

bool InMemoryIdentityStore::AddApiKey(const std::string& key_digest, const std::string& principal_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!accounts_.count(principal_id) || api_keys_.count(key_digest)) return false;

    api_keys_[key_digest] = principal_id;
    return true;
}

} // namespace aiexec
