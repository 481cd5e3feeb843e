#pragma once

#include "src/server/audit.h"
#include "src/server/config.h"
#include "src/server/errors.h"
#include "src/server/principal.h"

#include <optional>
#include <string>

namespace aiexec {

enum class PrivilegedOperation {
    kCreateSuperuser,
    kToggleSuperuserCli,
    kChangeAuthMode
};

const char* ToString(PrivilegedOperation operation);

// Superuser-only operations. nullopt means allowed.
class PrivilegeGate {
public:
    explicit PrivilegeGate(AuditSink& audit) : audit_(audit) {}

    // The capability switch alone, without looking at any credential. Callers run this
    // before credential verification so a disabled capability answers the same way for
    // every caller.
    std::optional<AuthFailure> CheckEnabled(PrivilegedOperation operation, const Settings& settings,
                                            const std::string& source_address) const;

    std::optional<AuthFailure> Authorize(const Principal& principal, PrivilegedOperation operation,
                                         const Settings& settings, const std::string& source_address) const;

private:
    void Audit(PrivilegedOperation operation, const std::string& principal_id,
               const std::string& source_address, const std::optional<AuthFailure>& failure) const;

    AuditSink& audit_;
};

} // namespace aiexec
