#pragma once

#include "src/server/config.h"
#include "src/server/isolation.h"
#include "src/server/precheck.h"
#include "src/server/process.h"
#include "src/server/sanitizer.h"

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aiexec {

// One unit of work for the runtime. Limits are already clamped to server maxima.
struct SandboxJob {
    std::string language;
    std::string code;
    std::string entry_point;
    google::protobuf::ListValue args;
    google::protobuf::Struct kwargs;
    ResourceLimits limits;
    bool allow_network = false;
};

enum class RawStatus {
    kSuccess,
    kCompileError,
    kRuntimeError,
    kTimeout,
    kResourceExceeded
};

const char* ToString(RawStatus status);

struct RawOutcome {
    RawStatus status = RawStatus::kRuntimeError;
    std::optional<google::protobuf::Value> value;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    // Sanitized; safe to hand to clients.
    std::string error;
    std::vector<Diagnostic> diagnostics;
    // The process was killed by the syscall filter.
    bool policy_violation = false;

    int64_t elapsed_ms = 0;
    int64_t cpu_time_ms = 0;
    int64_t max_rss_kb = 0;
};

// Host executables the strategies run, resolved once at startup.
struct HostToolchain {
    std::string python;
    std::vector<std::string> python_prefixes;
    std::string cxx;
    std::vector<std::string> cxx_prefixes;
};

HostToolchain ProbeToolchain(const SandboxSettings& settings);

// Files and commands for one language inside a scratch directory.
class LanguageStrategy {
public:
    virtual ~LanguageStrategy() = default;

    virtual std::string Name() const = 0;
    virtual std::string SourceName() const = 0;
    virtual bool Available(const HostToolchain& toolchain) const = 0;

    // Empty when the arguments suit this language's calling convention.
    virtual std::string CheckArguments(const SandboxJob& job) const = 0;

    virtual std::vector<Diagnostic> Scan(const std::string& code, const std::string& entry_point) const = 0;

    // Syntax-only toolchain invocation reading the submission from stdin.
    virtual ProcessOptions SyntaxCheck(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                                       const SandboxJob& job) const = 0;

    // Reported when the syntax check fails without a diagnostic pointing into the submission.
    virtual std::string UnattributedFailure(const std::string& entry_point) const = 0;

    virtual bool Stage(const ScratchDirectory& scratch, const SandboxJob& job) const = 0;

    // Build step, if the language has one.
    virtual std::optional<ProcessOptions> Build(const HostToolchain& toolchain, const ScratchDirectory& scratch) const = 0;

    virtual ProcessOptions Run(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                               const SandboxJob& job) const = 0;
};

class PythonStrategy : public LanguageStrategy {
public:
    std::string Name() const override { return "python"; }
    std::string SourceName() const override { return "submission.py"; }
    bool Available(const HostToolchain& toolchain) const override { return !toolchain.python.empty(); }
    std::string CheckArguments(const SandboxJob& job) const override;
    std::vector<Diagnostic> Scan(const std::string& code, const std::string& entry_point) const override;
    ProcessOptions SyntaxCheck(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                               const SandboxJob& job) const override;
    std::string UnattributedFailure(const std::string& entry_point) const override;
    bool Stage(const ScratchDirectory& scratch, const SandboxJob& job) const override;
    std::optional<ProcessOptions> Build(const HostToolchain& toolchain, const ScratchDirectory& scratch) const override;
    ProcessOptions Run(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                       const SandboxJob& job) const override;
};

class CppStrategy : public LanguageStrategy {
public:
    std::string Name() const override { return "cpp"; }
    std::string SourceName() const override { return "submission.cpp"; }
    bool Available(const HostToolchain& toolchain) const override { return !toolchain.cxx.empty(); }
    std::string CheckArguments(const SandboxJob& job) const override;
    std::vector<Diagnostic> Scan(const std::string& code, const std::string& entry_point) const override;
    ProcessOptions SyntaxCheck(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                               const SandboxJob& job) const override;
    std::string UnattributedFailure(const std::string& entry_point) const override;
    bool Stage(const ScratchDirectory& scratch, const SandboxJob& job) const override;
    std::optional<ProcessOptions> Build(const HostToolchain& toolchain, const ScratchDirectory& scratch) const override;
    ProcessOptions Run(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                       const SandboxJob& job) const override;

    // Translation unit compiled for a submission: prologue, user code, generated main.
    static std::string Program(const std::string& code, const std::string& entry_point);
};

// nullptr for unknown languages. "python"/"py" and "cpp"/"c++".
std::unique_ptr<LanguageStrategy> MakeStrategy(const std::string& language);

// Static pre-check run before a submission is admitted.
class PreChecker {
public:
    virtual ~PreChecker() = default;
    virtual std::vector<Diagnostic> Check(const SandboxJob& job) = 0;
};

class SandboxRuntime {
public:
    virtual ~SandboxRuntime() = default;
    virtual RawOutcome Execute(const SandboxJob& job) = 0;
};

// Maps a finished process onto an outcome. `limits` are the ones the process ran under.
RawOutcome ClassifyProcess(const ProcessResult& result, const ResourceLimits& limits,
                           const ErrorSanitizer& sanitizer);

// Process-per-execution runtime: fresh scratch directory, rlimits, seccomp, and namespaces
// and Landlock where the host allows them.
class ProcessSandbox : public SandboxRuntime, public PreChecker {
public:
    // Probes the host, sweeps stale scratch directories, and fails when a required
    // isolation feature is missing.
    static std::unique_ptr<ProcessSandbox> Create(const SandboxSettings& settings, std::string* error);

    // Literal values that must never appear in client-visible errors.
    void AddSecret(const std::string& value) { sanitizer_.AddSecret(value); }

    RawOutcome Execute(const SandboxJob& job) override;
    std::vector<Diagnostic> Check(const SandboxJob& job) override;

    const HostToolchain& toolchain() const { return toolchain_; }
    const IsolationCapabilities& capabilities() const { return capabilities_; }

private:
    ProcessSandbox(SandboxSettings settings, HostToolchain toolchain, IsolationCapabilities capabilities);

    std::unique_ptr<IsolationPlan> PlanFor(const ScratchDirectory& scratch, bool allow_network,
                                           std::string* error) const;
    ErrorSanitizer SanitizerFor(const ScratchDirectory& scratch) const;
    RawOutcome Unavailable(const std::string& reason) const;

    SandboxSettings settings_;
    HostToolchain toolchain_;
    IsolationCapabilities capabilities_;
    std::vector<std::string> readonly_paths_;
    ErrorSanitizer sanitizer_;
};

} // namespace aiexec
