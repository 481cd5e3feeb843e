#include "src/server/executor.h"
#include "src/server/crypto.h"
#include "src/server/logger.h"

#include <algorithm>
#include <chrono>

namespace aiexec {

namespace {

ExecutionStatus FromRaw(RawStatus status) {
    switch (status) {
        case RawStatus::kSuccess: return ExecutionStatus::kSuccess;
        case RawStatus::kCompileError: return ExecutionStatus::kCompileError;
        case RawStatus::kRuntimeError: return ExecutionStatus::kRuntimeError;
        case RawStatus::kTimeout: return ExecutionStatus::kTimeout;
        case RawStatus::kResourceExceeded: return ExecutionStatus::kResourceExceeded;
    }
    return ExecutionStatus::kRuntimeError;
}

ValidationFailure Malformed(const std::string& message) {
    return ValidationFailure{ValidationError::kMalformed, message};
}

ValidationFailure TooLarge(const std::string& message) {
    return ValidationFailure{ValidationError::kLimitExceeded, message};
}

int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSuccess: return "success";
        case ExecutionStatus::kCompileError: return "compile-error";
        case ExecutionStatus::kRuntimeError: return "runtime-error";
        case ExecutionStatus::kTimeout: return "timeout";
        case ExecutionStatus::kResourceExceeded: return "resource-exceeded";
        case ExecutionStatus::kRejectedBusy: return "rejected-busy";
    }
    return "runtime-error";
}

ResourceLimits CodeExecutor::EffectiveLimits(const RequestedLimits& requested, const SandboxSettings& settings) {
    ResourceLimits limits = settings.default_limits;
    const ResourceLimits& max = settings.max_limits;

    if (requested.cpu_time_ms > 0) {
        limits.cpu_time_ms = std::min(requested.cpu_time_ms, max.cpu_time_ms);
    }
    if (requested.wall_time_ms > 0) {
        limits.wall_time_ms = std::min(requested.wall_time_ms, max.wall_time_ms);
    }
    if (requested.memory_bytes > 0) {
        limits.memory_bytes = std::min(static_cast<uint64_t>(requested.memory_bytes), max.memory_bytes);
    }
    return limits;
}

std::optional<ValidationFailure> CodeExecutor::Validate(const CodeSubmission& submission,
                                                        const Settings& settings) const {
    const SandboxSettings& sandbox = settings.sandbox;

    auto strategy = MakeStrategy(submission.language);
    if (!strategy) {
        return Malformed("Unsupported language '" + submission.language + "'");
    }
    if (!IsIdentifier(submission.entry_point)) {
        return Malformed("Entry point must be an identifier");
    }
    if (submission.code.empty()) {
        return Malformed("Source is empty");
    }
    if (submission.code.size() > sandbox.max_source_bytes) {
        return TooLarge("Source exceeds " + std::to_string(sandbox.max_source_bytes) + " bytes");
    }
    if (submission.args.ByteSizeLong() + submission.kwargs.ByteSizeLong() > sandbox.max_args_bytes) {
        return TooLarge("Arguments exceed " + std::to_string(sandbox.max_args_bytes) + " bytes");
    }

    const RequestedLimits& limits = submission.limits;
    if (limits.cpu_time_ms < 0 || limits.wall_time_ms < 0 || limits.memory_bytes < 0) {
        return Malformed("Resource limits must not be negative");
    }
    const ResourceLimits& max = sandbox.max_limits;
    if (limits.cpu_time_ms > max.cpu_time_ms) {
        return TooLarge("CPU time limit exceeds the server maximum of " + std::to_string(max.cpu_time_ms) + " ms");
    }
    if (limits.wall_time_ms > max.wall_time_ms) {
        return TooLarge("Wall-clock limit exceeds the server maximum of " + std::to_string(max.wall_time_ms) + " ms");
    }
    if (static_cast<uint64_t>(limits.memory_bytes) > max.memory_bytes) {
        return TooLarge("Memory limit exceeds the server maximum of " + std::to_string(max.memory_bytes) + " bytes");
    }
    if (submission.network && !sandbox.network_allowed) {
        return TooLarge("Network access is not permitted on this server");
    }

    SandboxJob probe;
    probe.kwargs = submission.kwargs;
    std::string argument_error = strategy->CheckArguments(probe);
    if (!argument_error.empty()) {
        return Malformed(argument_error);
    }
    return std::nullopt;
}

std::variant<ExecutionResult, ValidationFailure> CodeExecutor::ValidateAndRun(const Principal& principal,
                                                                              const CodeSubmission& submission,
                                                                              const Settings& settings) {
    auto start = std::chrono::steady_clock::now();

    if (auto failure = Validate(submission, settings)) {
        Audit(principal, submission, ToString(failure->error), AuditSeverity::kWarning, failure->message);
        return *failure;
    }

    SandboxJob job;
    job.language = submission.language;
    job.code = submission.code;
    job.entry_point = submission.entry_point;
    job.args = submission.args;
    job.kwargs = submission.kwargs;
    job.limits = EffectiveLimits(submission.limits, settings.sandbox);
    job.allow_network = submission.network;

    ExecutionResult result;
    auto reject_unparsable = [&](std::vector<Diagnostic> diagnostics) {
        result.status = ExecutionStatus::kCompileError;
        result.error = "pre-check failed: " + FormatDiagnostic(diagnostics.front());
        result.diagnostics = std::move(diagnostics);
        result.elapsed_ms = ElapsedMs(start);
        Audit(principal, submission, ToString(result.status), AuditSeverity::kInfo, "");
        return result;
    };

    // The structural scan is in-process and linear; everything that starts a process
    // happens under a slot.
    std::vector<Diagnostic> diagnostics = MakeStrategy(job.language)->Scan(job.code, job.entry_point);
    if (!diagnostics.empty()) {
        return reject_unparsable(std::move(diagnostics));
    }

    auto slot = slots_.Acquire(std::chrono::milliseconds(settings.sandbox.queue_wait_ms));
    if (!slot) {
        Logger::Warn("No execution slot available for ", principal.id, "; rejecting submission");
        result.status = ExecutionStatus::kRejectedBusy;
        result.error = "server is busy; retry later";
        result.elapsed_ms = ElapsedMs(start);
        Audit(principal, submission, ToString(result.status), AuditSeverity::kWarning, "");
        return result;
    }

    diagnostics = prechecker_.Check(job);
    if (!diagnostics.empty()) {
        return reject_unparsable(std::move(diagnostics));
    }

    RawOutcome outcome = runtime_.Execute(job);

    result.status = FromRaw(outcome.status);
    result.value = std::move(outcome.value);
    result.stdout_data = std::move(outcome.stdout_data);
    result.stderr_data = std::move(outcome.stderr_data);
    result.stdout_truncated = outcome.stdout_truncated;
    result.stderr_truncated = outcome.stderr_truncated;
    result.error = std::move(outcome.error);
    result.diagnostics = std::move(outcome.diagnostics);
    result.policy_violation = outcome.policy_violation;
    result.elapsed_ms = outcome.elapsed_ms;
    result.cpu_time_ms = outcome.cpu_time_ms;
    result.max_rss_kb = outcome.max_rss_kb;

    if (result.policy_violation) {
        Audit(principal, submission, "policy-violation", AuditSeverity::kCritical, result.error);
    } else {
        Audit(principal, submission, ToString(result.status), AuditSeverity::kInfo, "");
    }
    return result;
}

void CodeExecutor::Audit(const Principal& principal, const CodeSubmission& submission, const std::string& outcome,
                         AuditSeverity severity, const std::string& detail) const {
    AuditEntry entry;
    entry.event = "code.execute";
    entry.source_address = submission.source_address;
    entry.principal_id = principal.id;
    entry.outcome = outcome;
    entry.severity = severity;
    entry.detail = "language=" + submission.language +
                   " bytes=" + std::to_string(submission.code.size()) +
                   " sha256=" + Sha256Hex(submission.code).substr(0, 16) +
                   " provenance=" + ToString(principal.provenance);
    if (!detail.empty()) {
        entry.detail += " " + detail;
    }
    RecordAudit(audit_, entry);
}

} // namespace aiexec
