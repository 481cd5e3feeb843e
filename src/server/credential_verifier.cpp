#include "src/server/credential_verifier.h"
#include "src/server/crypto.h"
#include "src/server/logger.h"
#include "src/server/token.h"

namespace aiexec {

namespace {

constexpr const char* kEvent = "auth.verify";

AuthFailure Unauthorized(const std::string& message) {
    return AuthFailure{AuthError::kUnauthorized, message};
}

} // namespace

std::variant<Principal, AuthFailure> CredentialVerifier::Verify(const AuthRequest& request,
                                                                const Settings& settings) const {
    AuditEntry entry;
    entry.event = kEvent;
    entry.source_address = request.source_address;

    if (settings.auth.mode == AuthMode::kAutoLoginSkipAuth) {
        Principal principal = Fabricate(settings);
        Logger::Warn("Auth bypassed: auto-login skip-auth issued a fabricated superuser principal for ",
                     request.source_address.empty() ? "unknown source" : request.source_address);
        entry.principal_id = principal.id;
        entry.outcome = "fabricated";
        entry.severity = AuditSeverity::kWarning;
        entry.detail = "credentials not inspected";
        RecordAudit(audit_, entry);
        return principal;
    }

    std::string detail;
    std::variant<Principal, AuthFailure> result;
    if (!request.api_key.empty()) {
        result = VerifyApiKey(request.api_key, &detail);
    } else if (!request.bearer_token.empty()) {
        result = VerifySession(request.bearer_token, settings, &detail);
    } else {
        detail = "no credential presented";
        result = Unauthorized("Missing credentials");
    }

    if (auto* principal = std::get_if<Principal>(&result)) {
        entry.principal_id = principal->id;
        entry.outcome = "success";
        entry.detail = std::string(ToString(principal->credential)) + " role=" + ToString(principal->role) +
                       (principal->elevated ? " elevated" : "");
    } else {
        entry.outcome = "unauthorized";
        entry.severity = AuditSeverity::kWarning;
        entry.detail = detail;
    }
    RecordAudit(audit_, entry);
    return result;
}

std::variant<Principal, AuthFailure> CredentialVerifier::VerifyApiKey(const std::string& key,
                                                                      std::string* detail) const {
    auto record = store_.LookupApiKey(Sha256Hex(key));
    if (!record) {
        *detail = "unknown api key";
        return Unauthorized("Invalid API key");
    }
    if (!record->active) {
        *detail = "inactive principal";
        return Unauthorized("Invalid API key");
    }

    Principal principal;
    principal.id = record->principal_id;
    principal.username = record->username;
    principal.credential = CredentialKind::kApiKey;
    principal.issued_at = NowSeconds();
    if (record->role == Role::kSuperuser && StillActiveSuperuser(record->principal_id)) {
        principal.role = Role::kSuperuser;
        principal.elevated = true;
    }
    return principal;
}

std::variant<Principal, AuthFailure> CredentialVerifier::VerifySession(const std::string& token,
                                                                       const Settings& settings,
                                                                       std::string* detail) const {
    int64_t now = NowSeconds();
    TokenSigner signer(settings.auth.secret_key);
    auto verified = signer.Verify(token, now);
    if (auto* error = std::get_if<TokenError>(&verified)) {
        *detail = ToString(*error);
        return Unauthorized(*error == TokenError::kExpired ? "Session expired" : "Invalid session token");
    }
    const SessionClaims& claims = std::get<SessionClaims>(verified);

    auto account = store_.LookupPrincipal(claims.subject);
    if (!account || !account->active) {
        *detail = "session subject unknown or inactive";
        return Unauthorized("Invalid session token");
    }

    Principal principal;
    principal.id = account->id;
    principal.username = account->username;
    principal.credential = CredentialKind::kSessionToken;
    principal.issued_at = claims.issued_at;
    principal.expires_at = claims.expires_at;
    principal.auto_login_session = claims.auto_login;

    // A session never grants more than the account currently has.
    if (claims.role == Role::kSuperuser && account->role == Role::kSuperuser) {
        principal.role = Role::kSuperuser;
        bool fresh = now - claims.issued_at <= settings.auth.elevated_max_age_seconds;
        principal.elevated = claims.superuser && !claims.auto_login && fresh &&
                             StillActiveSuperuser(account->id);
    }
    return principal;
}

Principal CredentialVerifier::Fabricate(const Settings& settings) const {
    Principal principal;
    principal.username = settings.auth.default_superuser;
    principal.id = "auto-login:" + settings.auth.default_superuser;
    if (auto account = store_.FindByUsername(settings.auth.default_superuser)) {
        principal.id = account->id;
    }
    principal.role = Role::kSuperuser;
    principal.credential = CredentialKind::kNone;
    principal.provenance = Provenance::kFabricated;
    principal.issued_at = NowSeconds();
    principal.auto_login_session = true;
    return principal;
}

bool CredentialVerifier::StillActiveSuperuser(const std::string& principal_id) const {
    auto account = store_.LookupPrincipal(principal_id);
    return account && account->active && account->role == Role::kSuperuser;
}

} // namespace aiexec
