#pragma once

#include "src/server/admission.h"
#include "src/server/audit.h"
#include "src/server/config.h"
#include "src/server/errors.h"
#include "src/server/precheck.h"
#include "src/server/principal.h"
#include "src/server/sandbox.h"

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace aiexec {

enum class ExecutionStatus {
    kSuccess,
    kCompileError,
    kRuntimeError,
    kTimeout,
    kResourceExceeded,
    kRejectedBusy
};

const char* ToString(ExecutionStatus status);

// Zero means "server default".
struct RequestedLimits {
    int64_t cpu_time_ms = 0;
    int64_t wall_time_ms = 0;
    int64_t memory_bytes = 0;
};

struct CodeSubmission {
    std::string language;
    std::string code;
    std::string entry_point = "run";
    google::protobuf::ListValue args;
    google::protobuf::Struct kwargs;
    RequestedLimits limits;
    bool network = false;
    std::string source_address;
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::kRuntimeError;
    std::optional<google::protobuf::Value> value;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::string error;
    std::vector<Diagnostic> diagnostics;
    bool policy_violation = false;

    int64_t elapsed_ms = 0;
    int64_t cpu_time_ms = 0;
    int64_t max_rss_kb = 0;
};

// Validates and scans a submission, then admits it to an execution slot in which the
// toolchain pre-check and the sandbox run both happen. Taking a Principal means the
// caller already went through the credential verifier.
class CodeExecutor {
public:
    CodeExecutor(SandboxRuntime& runtime, PreChecker& prechecker, ExecutionSlots& slots, AuditSink& audit)
        : runtime_(runtime), prechecker_(prechecker), slots_(slots), audit_(audit) {}

    std::variant<ExecutionResult, ValidationFailure> ValidateAndRun(const Principal& principal,
                                                                    const CodeSubmission& submission,
                                                                    const Settings& settings);

    // min(requested, maximum) per limit, defaults where nothing was requested.
    static ResourceLimits EffectiveLimits(const RequestedLimits& requested, const SandboxSettings& settings);

private:
    std::optional<ValidationFailure> Validate(const CodeSubmission& submission, const Settings& settings) const;
    void Audit(const Principal& principal, const CodeSubmission& submission, const std::string& outcome,
               AuditSeverity severity, const std::string& detail) const;

    SandboxRuntime& runtime_;
    PreChecker& prechecker_;
    ExecutionSlots& slots_;
    AuditSink& audit_;
};

} // namespace aiexec
