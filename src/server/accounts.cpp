#include "src/server/accounts.h"
#include "src/server/crypto.h"
#include "src/server/logger.h"
#include "src/server/token.h"

#include <cctype>

namespace aiexec {

namespace {

constexpr size_t kMaxUsernameLength = 64;
constexpr size_t kMinPasswordLength = 8;
constexpr size_t kApiKeyBytes = 32;

bool ValidUsername(const std::string& username) {
    if (username.empty() || username.size() > kMaxUsernameLength) return false;
    for (unsigned char c : username) {
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.' && c != '@') return false;
    }
    return true;
}

// Stands in for the stored hash of a username that does not exist.
const std::string& UnknownUserHash() {
    static const std::string hash = HashPassword(RandomHex(16));
    return hash;
}

} // namespace

std::variant<IssuedApiKey, ValidationFailure> AccountManager::CreateSuperuser(const std::string& username,
                                                                              const std::string& password) {
    if (!ValidUsername(username)) {
        return ValidationFailure{ValidationError::kMalformed, "Invalid username"};
    }
    if (password.size() < kMinPasswordLength) {
        return ValidationFailure{ValidationError::kMalformed, "Password must be at least 8 characters"};
    }

    UserAccount account;
    account.id = RandomHex(16);
    account.username = username;
    account.role = Role::kSuperuser;
    account.password_hash = HashPassword(password);
    account.created_at = NowSeconds();
    if (account.id.empty() || account.password_hash.empty()) {
        Logger::Error("Failed to derive credentials for new superuser");
        return ValidationFailure{ValidationError::kMalformed, "Could not create account"};
    }
    if (!store_.AddAccount(account)) {
        return ValidationFailure{ValidationError::kMalformed, "Username already exists"};
    }

    IssuedApiKey issued;
    issued.principal_id = account.id;
    issued.username = account.username;
    issued.api_key = MintApiKey(account.id);
    if (issued.api_key.empty()) {
        return ValidationFailure{ValidationError::kMalformed, "Could not create API key"};
    }

    Logger::Info("Created superuser ", username);
    Audit("account.create-superuser", account.id, "", "created", AuditSeverity::kInfo);
    return issued;
}

std::variant<SessionToken, AuthFailure> AccountManager::Login(const std::string& username,
                                                              const std::string& password,
                                                              const Settings& settings,
                                                              const std::string& source_address) {
    auto account = store_.FindByUsername(username);
    // Unknown users pay for the same key derivation as known ones.
    bool matched = VerifyPassword(password, account ? account->password_hash : UnknownUserHash());
    if (!account || !account->active || !matched) {
        Audit("auth.login", account ? account->id : "", source_address, "unauthorized", AuditSeverity::kWarning);
        return AuthFailure{AuthError::kUnauthorized, "Incorrect username or password"};
    }

    Audit("auth.login", account->id, source_address, "success", AuditSeverity::kInfo);
    return IssueSession(*account, false, settings);
}

std::variant<SessionToken, AuthFailure> AccountManager::AutoLogin(const Settings& settings,
                                                                  const std::string& source_address) {
    if (!settings.AutoLoginEnabled()) {
        Audit("auth.auto-login", "", source_address, "disabled", AuditSeverity::kWarning);
        return AuthFailure{AuthError::kDisabled, "Auto-login is disabled"};
    }

    auto account = store_.FindByUsername(settings.auth.default_superuser);
    if (!account || !account->active) {
        Audit("auth.auto-login", "", source_address, "unauthorized", AuditSeverity::kWarning);
        return AuthFailure{AuthError::kUnauthorized, "Default superuser is not available"};
    }

    Logger::Warn("Auto-login session issued for ", account->username);
    Audit("auth.auto-login", account->id, source_address, "success", AuditSeverity::kWarning);
    return IssueSession(*account, true, settings);
}

std::variant<IssuedApiKey, AuthFailure> AccountManager::CreateApiKey(const Principal& principal) {
    if (principal.IsFabricated()) {
        return AuthFailure{AuthError::kForbidden, "API keys require a verified principal"};
    }
    auto account = store_.LookupPrincipal(principal.id);
    if (!account || !account->active) {
        return AuthFailure{AuthError::kUnauthorized, "Unknown principal"};
    }

    IssuedApiKey issued;
    issued.principal_id = account->id;
    issued.username = account->username;
    issued.api_key = MintApiKey(account->id);
    if (issued.api_key.empty()) {
        return AuthFailure{AuthError::kForbidden, "Could not create API key"};
    }
    Audit("account.create-api-key", account->id, "", "created", AuditSeverity::kInfo);
    return issued;
}

void AccountManager::BootstrapDefaultSuperuser(const Settings& settings) {
    const AuthSettings& auth = settings.auth;
    if (!settings.IsDevelopment()) {
        if (!auth.default_superuser_password.empty()) {
            Logger::Warn("AIEXEC_SUPERUSER_PASSWORD is ignored in the production profile");
        }
        return;
    }
    if (auth.default_superuser.empty() || store_.FindByUsername(auth.default_superuser)) {
        return;
    }

    auto created = CreateSuperuser(auth.default_superuser, auth.default_superuser_password);
    if (auto* failure = std::get_if<ValidationFailure>(&created)) {
        Logger::Error("Could not create default superuser: ", failure->message);
        return;
    }
    Logger::Warn("Created development superuser '", auth.default_superuser, "' with the configured password");
}

SessionToken AccountManager::IssueSession(const UserAccount& account, bool auto_login,
                                          const Settings& settings) const {
    SessionClaims claims;
    claims.subject = account.id;
    claims.role = account.role;
    claims.issued_at = NowSeconds();
    claims.expires_at = claims.issued_at + settings.auth.session_ttl_seconds;
    claims.superuser = account.role == Role::kSuperuser;
    claims.auto_login = auto_login;

    SessionToken session;
    session.principal_id = account.id;
    session.access_token = TokenSigner(settings.auth.secret_key).Issue(claims);
    session.expires_at = claims.expires_at;
    return session;
}

std::string AccountManager::MintApiKey(const std::string& principal_id) {
    std::string random = RandomHex(kApiKeyBytes);
    if (random.empty()) {
        Logger::Error("Random source unavailable while minting API key");
        return "";
    }
    std::string key = kApiKeyPrefix + random;
    if (!store_.AddApiKey(Sha256Hex(key), principal_id)) {
        Logger::Error("Failed to register API key for ", principal_id);
        return "";
    }
    return key;
}

void AccountManager::Audit(const std::string& event, const std::string& principal_id,
                           const std::string& source_address, const std::string& outcome,
                           AuditSeverity severity) const {
    AuditEntry entry;
    entry.event = event;
    entry.principal_id = principal_id;
    entry.source_address = source_address;
    entry.outcome = outcome;
    entry.severity = severity;
    RecordAudit(audit_, entry);
}

} // namespace aiexec
