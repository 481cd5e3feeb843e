#include "src/server/privilege_gate.h"

namespace aiexec {

const char* ToString(PrivilegedOperation operation) {
    switch (operation) {
        case PrivilegedOperation::kCreateSuperuser: return "create-superuser";
        case PrivilegedOperation::kToggleSuperuserCli: return "toggle-superuser-cli";
        case PrivilegedOperation::kChangeAuthMode: return "change-auth-mode";
    }
    return "unknown";
}

std::optional<AuthFailure> PrivilegeGate::CheckEnabled(PrivilegedOperation operation, const Settings& settings,
                                                       const std::string& source_address) const {
    if (operation == PrivilegedOperation::kCreateSuperuser && !settings.auth.superuser_cli_enabled) {
        std::optional<AuthFailure> failure = AuthFailure{AuthError::kDisabled, "Superuser creation is disabled"};
        Audit(operation, "", source_address, failure);
        return failure;
    }
    return std::nullopt;
}

std::optional<AuthFailure> PrivilegeGate::Authorize(const Principal& principal, PrivilegedOperation operation,
                                                    const Settings& settings,
                                                    const std::string& source_address) const {
    if (auto disabled = CheckEnabled(operation, settings, source_address)) {
        return disabled;
    }

    std::optional<AuthFailure> failure;
    if (principal.IsFabricated() || !principal.IsSuperuser() || !principal.elevated ||
        principal.auto_login_session) {
        failure = AuthFailure{AuthError::kForbidden, "Elevated superuser credentials required"};
    }
    Audit(operation, principal.id, source_address, failure);
    return failure;
}

void PrivilegeGate::Audit(PrivilegedOperation operation, const std::string& principal_id,
                          const std::string& source_address, const std::optional<AuthFailure>& failure) const {
    AuditEntry entry;
    entry.event = std::string("privileged.") + ToString(operation);
    entry.source_address = source_address;
    entry.principal_id = principal_id;
    entry.outcome = failure ? ToString(failure->error) : "allowed";
    entry.severity = failure ? AuditSeverity::kWarning : AuditSeverity::kInfo;
    RecordAudit(audit_, entry);
}

} // namespace aiexec
