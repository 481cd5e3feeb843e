#include "src/server/sandbox.h"
#include "src/server/logger.h"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace aiexec {

namespace fs = std::filesystem;

namespace {

constexpr const char* kArgsFile = "args.json";
constexpr const char* kProgramFile = "program.cpp";
constexpr const char* kBinaryFile = "program";
constexpr const char* kHarnessLabel = "aiexec_harness.cpp";
constexpr const char* kSandboxPath = "/usr/local/bin:/usr/bin:/bin";

// Runs the submission file and reports the entry point's outcome on fd 3.
constexpr const char* kPythonHarness = R"PY(
import errno, inspect, json, os, sys, traceback

SOURCE = "submission.py"

def emit(payload):
    data = json.dumps(payload, allow_nan=False).encode("utf-8")
    with os.fdopen(3, "wb") as channel:
        channel.write(data)

def failure(exc):
    line = None
    if isinstance(exc, SyntaxError) and exc.filename == SOURCE:
        line = exc.lineno
    tb = exc.__traceback__
    while tb is not None:
        if tb.tb_frame.f_code.co_filename == SOURCE:
            line = tb.tb_lineno
        tb = tb.tb_next
    kind = type(exc).__name__
    if isinstance(exc, OSError) and exc.errno == errno.EFBIG:
        kind = "FileSizeExceeded"
    return {"ok": False, "type": kind, "message": str(exc), "line": line}

def main():
    entry = sys.argv[1]
    with open(SOURCE, encoding="utf-8") as handle:
        source = handle.read()
    with open("args.json", encoding="utf-8") as handle:
        call = json.load(handle)
    namespace = {"__name__": "__submission__", "__file__": SOURCE}
    try:
        exec(compile(source, SOURCE, "exec"), namespace)
        target = namespace.get(entry)
        if not callable(target):
            raise NameError("entry point '%s' is not defined" % entry)
        value = target(*call.get("args", []), **call.get("kwargs", {}))
        if inspect.isawaitable(value):
            import asyncio
            value = asyncio.run(value)
    except BaseException as exc:
        traceback.print_exc()
        sys.stdout.flush()
        emit(failure(exc))
        return 1
    sys.stdout.flush()
    try:
        emit({"ok": True, "value": value})
    except (TypeError, ValueError):
        emit({"ok": True, "value": repr(value), "repr": True})
    return 0

sys.exit(main())
)PY";

constexpr const char* kPythonSyntaxCheck = R"PY(
import ast, sys

entry = sys.argv[1]
try:
    tree = ast.parse(sys.stdin.buffer.read(), "submission.py")
except (SyntaxError, ValueError) as exc:
    sys.stderr.write("submission.py:%d:%d: error: %s\n" % (
        getattr(exc, "lineno", None) or 1, getattr(exc, "offset", None) or 1, getattr(exc, "msg", str(exc))))
    sys.exit(1)

for node in tree.body:
    if isinstance(node, (ast.FunctionDef, ast.AsyncFunctionDef, ast.ClassDef)) and node.name == entry:
        sys.exit(0)
    if isinstance(node, ast.Assign) and any(isinstance(t, ast.Name) and t.id == entry for t in node.targets):
        sys.exit(0)
    if isinstance(node, ast.AnnAssign) and isinstance(node.target, ast.Name) and node.target.id == entry:
        sys.exit(0)
sys.stderr.write("submission.py:1:1: error: entry point '%s' is not defined at module level\n" % entry)
sys.exit(1)
)PY";

constexpr const char* kCppPrologue = R"CPP(#include <string>
#include <vector>
#line 1 "submission.cpp"
)CPP";

// @ENTRY@ is replaced by the validated entry point name.
constexpr const char* kCppHarness = R"CPP(
#line 1 "aiexec_harness.cpp"
#include <cmath>
#include <cxxabi.h>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <map>
#include <new>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <unistd.h>

namespace aiexec_harness {

template <typename T> struct IsVector : std::false_type {};
template <typename T, typename A> struct IsVector<std::vector<T, A>> : std::true_type {};
template <typename T> struct IsMap : std::false_type {};
template <typename V, typename C, typename A> struct IsMap<std::map<std::string, V, C, A>> : std::true_type {};

inline void EncodeString(std::ostream& out, std::string_view text) {
    static const char* hex = "0123456789abcdef";
    out << '"';
    for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (u < 0x20) out << "\\u00" << hex[u >> 4] << hex[u & 15];
                else out << c;
        }
    }
    out << '"';
}

template <typename T>
void Encode(std::ostream& out, const T& value) {
    if constexpr (std::is_same<T, bool>::value) {
        out << (value ? "true" : "false");
    } else if constexpr (std::is_same<T, char>::value) {
        EncodeString(out, std::string(1, value));
    } else if constexpr (std::is_integral<T>::value) {
        out << +value;
    } else if constexpr (std::is_floating_point<T>::value) {
        if (!std::isfinite(value)) out << "null";
        else out << std::setprecision(17) << value;
    } else if constexpr (std::is_convertible<const T&, std::string_view>::value) {
        EncodeString(out, std::string_view(value));
    } else if constexpr (IsVector<T>::value) {
        out << '[';
        bool first = true;
        for (const auto& item : value) {
            if (!first) out << ',';
            first = false;
            Encode(out, static_cast<const typename T::value_type&>(item));
        }
        out << ']';
    } else if constexpr (IsMap<T>::value) {
        out << '{';
        bool first = true;
        for (const auto& [key, item] : value) {
            if (!first) out << ',';
            first = false;
            EncodeString(out, key);
            out << ':';
            Encode(out, item);
        }
        out << '}';
    } else {
        static_assert(sizeof(T) == 0, "return type of the entry point cannot be reported");
    }
}

template <typename V, typename... None>
auto Invoke(const V& args, int) -> decltype(::@ENTRY@(args)) {
    return ::@ENTRY@(args);
}

template <typename V, typename... None>
auto Invoke(const V&, long) -> decltype(::@ENTRY@(std::declval<None>()...)) {
    return ::@ENTRY@(std::declval<None>()...);
}

template <typename V>
std::string RunEntry(const V& args) {
    std::ostringstream out;
    using Result = decltype(Invoke(args, 0));
    if constexpr (std::is_void<Result>::value) {
        Invoke(args, 0);
        out << R"({"ok":true,"value":null})";
    } else {
        const auto& value = Invoke(args, 0);
        out << R"({"ok":true,"value":)";
        Encode(out, value);
        out << '}';
    }
    return out.str();
}

inline std::string TypeName(const std::exception& e) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(typeid(e).name(), nullptr, nullptr, &status);
    std::string name = status == 0 && demangled ? demangled : typeid(e).name();
    std::free(demangled);
    return name;
}

inline std::string Failure(const std::string& type, const std::string& message) {
    std::ostringstream out;
    out << R"({"ok":false,"type":)";
    EncodeString(out, type);
    out << R"(,"message":)";
    EncodeString(out, message);
    out << '}';
    return out.str();
}

inline void Report(const std::string& payload) {
    size_t offset = 0;
    while (offset < payload.size()) {
        ssize_t written = ::write(3, payload.data() + offset, payload.size() - offset);
        if (written <= 0) return;
        offset += static_cast<size_t>(written);
    }
}

} // namespace aiexec_harness

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string report;
    int status = 0;
    try {
        report = aiexec_harness::RunEntry(args);
    } catch (const std::bad_alloc&) {
        report = R"({"ok":false,"type":"std::bad_alloc","message":"std::bad_alloc"})";
        status = 1;
    } catch (const std::exception& e) {
        report = aiexec_harness::Failure(aiexec_harness::TypeName(e), e.what());
        status = 1;
    } catch (...) {
        report = aiexec_harness::Failure("unknown", "non-standard exception");
        status = 1;
    }
    std::cout.flush();
    std::cerr.flush();
    aiexec_harness::Report(report);
    return status;
}
)CPP";

std::string ToJson(const google::protobuf::Message& message) {
    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(message, &json);
    if (!status.ok()) {
        Logger::Error("Failed to encode sandbox arguments: ", status.ToString());
        return "";
    }
    return json;
}

std::vector<std::string> SandboxEnvironment(const ScratchDirectory& scratch) {
    return {
        std::string("PATH=") + kSandboxPath,
        "HOME=" + scratch.path(),
        "TMPDIR=" + scratch.path(),
        "LANG=C.UTF-8",
        "PYTHONHASHSEED=0",
        "PYTHONDONTWRITEBYTECODE=1",
    };
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string SignalName(int signal) {
    switch (signal) {
        case SIGSEGV: return "SIGSEGV";
        case SIGABRT: return "SIGABRT";
        case SIGFPE: return "SIGFPE";
        case SIGBUS: return "SIGBUS";
        case SIGILL: return "SIGILL";
        case SIGKILL: return "SIGKILL";
        case SIGTERM: return "SIGTERM";
        case SIGPIPE: return "SIGPIPE";
        default: return "signal " + std::to_string(signal);
    }
}

std::string MiB(uint64_t bytes) {
    return std::to_string(bytes / (1024 * 1024)) + " MiB";
}

// Resource usage decides. The program writes its own stderr, so a runtime's out-of-memory
// message only counts for an abnormal exit that already used half the ceiling.
bool LooksOutOfMemory(const ProcessResult& result, const ResourceLimits& limits) {
    uint64_t peak = result.max_rss_kb > 0 ? static_cast<uint64_t>(result.max_rss_kb) * 1024 : 0;
    if (peak >= limits.memory_bytes) {
        return true;
    }

    bool abnormal = result.term_signal == SIGABRT || (result.term_signal == 0 && result.exit_code != 0);
    if (!abnormal || peak < limits.memory_bytes / 2) {
        return false;
    }
    const std::string& err = result.stderr_data;
    return err.find("MemoryError") != std::string::npos ||
           err.find("std::bad_alloc") != std::string::npos ||
           err.find("Cannot allocate memory") != std::string::npos ||
           err.find("out of memory") != std::string::npos;
}

const google::protobuf::Value* Field(const google::protobuf::Struct& message, const char* name) {
    auto it = message.fields().find(name);
    return it == message.fields().end() ? nullptr : &it->second;
}

void CopyUsage(const ProcessResult& result, RawOutcome* outcome) {
    outcome->elapsed_ms = result.elapsed_ms;
    outcome->cpu_time_ms = result.cpu_time_ms;
    outcome->max_rss_kb = result.max_rss_kb;
}

} // namespace

const char* ToString(RawStatus status) {
    switch (status) {
        case RawStatus::kSuccess: return "success";
        case RawStatus::kCompileError: return "compile-error";
        case RawStatus::kRuntimeError: return "runtime-error";
        case RawStatus::kTimeout: return "timeout";
        case RawStatus::kResourceExceeded: return "resource-exceeded";
    }
    return "runtime-error";
}

HostToolchain ProbeToolchain(const SandboxSettings& settings) {
    HostToolchain toolchain;

    std::string python = Process::ResolveExecutable(settings.python_interpreter);
    if (python.empty()) {
        Logger::Warn("Python interpreter '", settings.python_interpreter, "' not found; python submissions disabled");
    } else {
        // Version managers install shims; run the interpreter once to find the real one.
        ProcessOptions options;
        options.argv = {python, "-I", "-c",
                        "import sys; print(sys.executable); print(sys.base_prefix); print(sys.prefix)"};
        for (const char* name : {"PATH", "HOME", "PYENV_ROOT", "PYENV_VERSION"}) {
            if (const char* value = getenv(name)) options.env.push_back(std::string(name) + "=" + value);
        }
        options.working_directory = "/";
        options.limits = settings.precheck_limits;

        ProcessResult result = Process::Run(options);
        std::istringstream lines(result.stdout_data);
        std::string executable;
        std::getline(lines, executable);
        if (!result.Succeeded() || executable.empty() || executable[0] != '/') {
            Logger::Warn("Python interpreter '", python, "' failed to start; python submissions disabled");
        } else {
            toolchain.python = executable;
            toolchain.python_prefixes.push_back(fs::path(executable).parent_path().string());
            std::string prefix;
            while (std::getline(lines, prefix)) {
                if (!prefix.empty() && prefix[0] == '/') toolchain.python_prefixes.push_back(prefix);
            }
            Logger::Info("Python interpreter: ", toolchain.python);
        }
    }

    std::string cxx = Process::ResolveExecutable(settings.cxx_compiler);
    if (cxx.empty()) {
        Logger::Warn("C++ compiler '", settings.cxx_compiler, "' not found; cpp submissions disabled");
    } else {
        toolchain.cxx = cxx;
        std::error_code ec;
        fs::path real = fs::canonical(cxx, ec);
        if (!ec && real.has_parent_path()) {
            fs::path prefix = real.parent_path().parent_path();
            if (!prefix.empty() && prefix != "/") toolchain.cxx_prefixes.push_back(prefix.string());
        }
        Logger::Info("C++ compiler: ", toolchain.cxx);
    }
    return toolchain;
}

std::string PythonStrategy::CheckArguments(const SandboxJob&) const {
    return "";
}

std::vector<Diagnostic> PythonStrategy::Scan(const std::string& code, const std::string& entry_point) const {
    return ScanPythonSource(code, entry_point);
}

ProcessOptions PythonStrategy::SyntaxCheck(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                                           const SandboxJob& job) const {
    ProcessOptions options;
    options.argv = {toolchain.python, "-I", "-B", "-c", kPythonSyntaxCheck, job.entry_point};
    options.env = SandboxEnvironment(scratch);
    options.working_directory = scratch.path();
    options.stdin_data = job.code;
    return options;
}

std::string PythonStrategy::UnattributedFailure(const std::string&) const {
    return "syntax check failed";
}

bool PythonStrategy::Stage(const ScratchDirectory& scratch, const SandboxJob& job) const {
    google::protobuf::Struct call;
    auto& fields = *call.mutable_fields();
    *fields["args"].mutable_list_value() = job.args;
    *fields["kwargs"].mutable_struct_value() = job.kwargs;

    std::string args = ToJson(call);
    return !args.empty() && scratch.WriteFile(SourceName(), job.code) && scratch.WriteFile(kArgsFile, args);
}

std::optional<ProcessOptions> PythonStrategy::Build(const HostToolchain&, const ScratchDirectory&) const {
    return std::nullopt;
}

ProcessOptions PythonStrategy::Run(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                                   const SandboxJob& job) const {
    ProcessOptions options;
    options.argv = {toolchain.python, "-I", "-B", "-c", kPythonHarness, job.entry_point};
    options.env = SandboxEnvironment(scratch);
    options.working_directory = scratch.path();
    return options;
}

std::string CppStrategy::CheckArguments(const SandboxJob& job) const {
    if (job.kwargs.fields_size() > 0) {
        return "C++ entry points take positional arguments only";
    }
    return "";
}

std::vector<Diagnostic> CppStrategy::Scan(const std::string& code, const std::string& entry_point) const {
    return ScanCppSource(code, entry_point);
}

std::string CppStrategy::Program(const std::string& code, const std::string& entry_point) {
    std::string harness = kCppHarness;
    ReplaceAll(harness, "@ENTRY@", entry_point);
    return kCppPrologue + code + "\n" + harness;
}

ProcessOptions CppStrategy::SyntaxCheck(const HostToolchain& toolchain, const ScratchDirectory& scratch,
                                        const SandboxJob& job) const {
    ProcessOptions options;
    options.argv = {toolchain.cxx, "-fsyntax-only", "-std=c++17", "-fdiagnostics-color=never",
                    "-fmax-errors=20", "-x", "c++", "-"};
    options.env = SandboxEnvironment(scratch);
    options.working_directory = scratch.path();
    options.stdin_data = Program(job.code, job.entry_point);
    return options;
}

std::string CppStrategy::UnattributedFailure(const std::string& entry_point) const {
    return "entry point '" + entry_point + "' must take no arguments or a const std::vector<std::string>& "
           "and return void, bool, a number, a string, or a vector or string-keyed map of those";
}

bool CppStrategy::Stage(const ScratchDirectory& scratch, const SandboxJob& job) const {
    return scratch.WriteFile(kProgramFile, Program(job.code, job.entry_point));
}

std::optional<ProcessOptions> CppStrategy::Build(const HostToolchain& toolchain,
                                                 const ScratchDirectory& scratch) const {
    ProcessOptions options;
    options.argv = {toolchain.cxx, "-std=c++17", "-O1", "-pipe", "-fdiagnostics-color=never",
                    "-fmax-errors=20", kProgramFile, "-o", kBinaryFile};
    options.env = SandboxEnvironment(scratch);
    options.working_directory = scratch.path();
    return options;
}

ProcessOptions CppStrategy::Run(const HostToolchain&, const ScratchDirectory& scratch,
                                const SandboxJob& job) const {
    ProcessOptions options;
    options.argv = {scratch.PathOf(kBinaryFile)};
    for (const auto& value : job.args.values()) {
        options.argv.push_back(value.kind_case() == google::protobuf::Value::kStringValue ? value.string_value()
                                                                                          : ToJson(value));
    }
    options.env = SandboxEnvironment(scratch);
    options.working_directory = scratch.path();
    return options;
}

std::unique_ptr<LanguageStrategy> MakeStrategy(const std::string& language) {
    if (language == "python" || language == "py") {
        return std::make_unique<PythonStrategy>();
    } else if (language == "cpp" || language == "c++") {
        return std::make_unique<CppStrategy>();
    }
    return nullptr;
}

RawOutcome ClassifyProcess(const ProcessResult& result, const ResourceLimits& limits,
                           const ErrorSanitizer& sanitizer) {
    RawOutcome outcome;
    outcome.stdout_data = sanitizer.Redact(result.stdout_data);
    outcome.stderr_data = sanitizer.Redact(result.stderr_data);
    outcome.stdout_truncated = result.stdout_truncated;
    outcome.stderr_truncated = result.stderr_truncated;
    CopyUsage(result, &outcome);

    if (result.term_signal == SIGSYS) {
        outcome.status = RawStatus::kRuntimeError;
        outcome.policy_violation = true;
        outcome.error = "execution terminated: blocked system call";
        return outcome;
    }
    if (result.timed_out) {
        outcome.status = RawStatus::kTimeout;
        outcome.error = "wall-clock limit of " + std::to_string(limits.wall_time_ms) + " ms exceeded";
        return outcome;
    }
    if (result.term_signal == SIGXCPU ||
        (result.term_signal == SIGKILL && result.cpu_time_ms >= limits.cpu_time_ms)) {
        outcome.status = RawStatus::kTimeout;
        outcome.error = "CPU time limit of " + std::to_string(limits.cpu_time_ms) + " ms exceeded";
        return outcome;
    }
    if (result.term_signal == SIGXFSZ) {
        outcome.status = RawStatus::kResourceExceeded;
        outcome.error = "file size limit of " + MiB(limits.file_size_bytes) + " exceeded";
        return outcome;
    }

    if (result.result_truncated) {
        outcome.status = RawStatus::kRuntimeError;
        outcome.error = "return value exceeds the result size limit";
        return outcome;
    }

    if (!result.result.empty()) {
        google::protobuf::Struct report;
        if (!google::protobuf::util::JsonStringToMessage(result.result, &report).ok()) {
            outcome.status = RawStatus::kRuntimeError;
            outcome.error = "return value could not be decoded";
            return outcome;
        }

        const google::protobuf::Value* ok = Field(report, "ok");
        if (ok && ok->bool_value()) {
            outcome.status = RawStatus::kSuccess;
            if (const google::protobuf::Value* value = Field(report, "value")) {
                outcome.value = *value;
            }
            return outcome;
        }

        const google::protobuf::Value* type = Field(report, "type");
        const google::protobuf::Value* message = Field(report, "message");
        const google::protobuf::Value* line = Field(report, "line");
        std::string kind = type ? type->string_value() : "Error";

        if (kind == "MemoryError" || kind == "std::bad_alloc") {
            outcome.status = RawStatus::kResourceExceeded;
            outcome.error = "memory limit of " + MiB(limits.memory_bytes) + " exceeded";
            return outcome;
        }
        if (kind == "FileSizeExceeded") {
            outcome.status = RawStatus::kResourceExceeded;
            outcome.error = "file size limit of " + MiB(limits.file_size_bytes) + " exceeded";
            return outcome;
        }

        std::string description = kind;
        if (message && !message->string_value().empty()) description += ": " + message->string_value();
        if (line && line->kind_case() == google::protobuf::Value::kNumberValue) {
            description += " (line " + std::to_string(static_cast<int64_t>(line->number_value())) + ")";
        }
        outcome.status = RawStatus::kRuntimeError;
        outcome.error = sanitizer.Sanitize(description);
        return outcome;
    }

    if (LooksOutOfMemory(result, limits)) {
        outcome.status = RawStatus::kResourceExceeded;
        outcome.error = "memory limit of " + MiB(limits.memory_bytes) + " exceeded";
        return outcome;
    }

    outcome.status = RawStatus::kRuntimeError;
    if (result.term_signal != 0) {
        outcome.error = "terminated by " + SignalName(result.term_signal);
    } else if (result.exit_code != 0) {
        outcome.error = "process exited with status " + std::to_string(result.exit_code);
    } else {
        outcome.error = "entry point did not report a result";
    }
    return outcome;
}

ProcessSandbox::ProcessSandbox(SandboxSettings settings, HostToolchain toolchain,
                               IsolationCapabilities capabilities)
    : settings_(std::move(settings)), toolchain_(std::move(toolchain)), capabilities_(capabilities) {
    readonly_paths_ = SystemReadonlyPaths();
    for (const auto& group : {toolchain_.python_prefixes, toolchain_.cxx_prefixes}) {
        for (const std::string& path : group) {
            if (std::find(readonly_paths_.begin(), readonly_paths_.end(), path) == readonly_paths_.end()) {
                readonly_paths_.push_back(path);
            }
        }
    }
}

std::unique_ptr<ProcessSandbox> ProcessSandbox::Create(const SandboxSettings& settings, std::string* error) {
    IsolationCapabilities capabilities = ProbeIsolation();

    if (!capabilities.seccomp) {
        *error = "seccomp filtering is not available on this kernel";
        return nullptr;
    }
    if (settings.namespaces == IsolationRequirement::kRequired && !capabilities.user_namespaces) {
        *error = "user namespaces are required but not available";
        return nullptr;
    }
    if (settings.landlock == IsolationRequirement::kRequired && capabilities.landlock_abi <= 0) {
        *error = "Landlock is required but not available";
        return nullptr;
    }
    if (settings.namespaces == IsolationRequirement::kPreferred && !capabilities.user_namespaces) {
        Logger::Warn("User namespaces unavailable; sandboxed processes share the host network namespace");
    }
    if (settings.landlock == IsolationRequirement::kPreferred && capabilities.landlock_abi <= 0) {
        Logger::Warn("Landlock unavailable; filesystem access is limited by permissions only");
    }
    if (settings.network_allowed) {
        Logger::Warn("Network access may be granted to sandboxed code on request");
    }

    Process::SweepStaleDirectories(settings.scratch_root);

    HostToolchain toolchain = ProbeToolchain(settings);
    return std::unique_ptr<ProcessSandbox>(new ProcessSandbox(settings, std::move(toolchain), capabilities));
}

std::unique_ptr<IsolationPlan> ProcessSandbox::PlanFor(const ScratchDirectory& scratch, bool allow_network,
                                                       std::string* error) const {
    IsolationPolicy policy;
    policy.namespaces = settings_.namespaces != IsolationRequirement::kDisabled && capabilities_.user_namespaces;
    policy.namespaces_required = settings_.namespaces == IsolationRequirement::kRequired;
    policy.landlock = settings_.landlock != IsolationRequirement::kDisabled && capabilities_.landlock_abi > 0;
    policy.allow_network = allow_network;
    policy.readonly_paths = readonly_paths_;
    policy.writable_paths = {scratch.path()};
    return IsolationPlan::Prepare(policy, error);
}

ErrorSanitizer ProcessSandbox::SanitizerFor(const ScratchDirectory& scratch) const {
    ErrorSanitizer sanitizer = sanitizer_;
    sanitizer.AddReplacement(scratch.path(), "<scratch>");
    sanitizer.AddReplacement(settings_.scratch_root, "<scratch-root>");
    return sanitizer;
}

RawOutcome ProcessSandbox::Unavailable(const std::string& reason) const {
    Logger::Error("Execution environment unavailable: ", reason);
    RawOutcome outcome;
    outcome.status = RawStatus::kRuntimeError;
    outcome.error = "execution environment unavailable";
    return outcome;
}

std::vector<Diagnostic> ProcessSandbox::Check(const SandboxJob& job) {
    auto strategy = MakeStrategy(job.language);
    if (!strategy) {
        return {Diagnostic{0, 0, "unsupported language"}};
    }

    std::vector<Diagnostic> diagnostics = strategy->Scan(job.code, job.entry_point);
    if (!diagnostics.empty() || !strategy->Available(toolchain_)) {
        return diagnostics;
    }

    // A helper that cannot start leaves the decision to the run, which reports the
    // environment as unavailable.
    auto scratch = ScratchDirectory::Create(settings_.scratch_root);
    if (!scratch) {
        Logger::Error("Pre-check skipped: no scratch directory");
        return diagnostics;
    }
    std::string plan_error;
    auto plan = PlanFor(*scratch, false, &plan_error);
    if (!plan) {
        Logger::Error("Pre-check skipped: ", plan_error);
        return diagnostics;
    }

    ProcessOptions options = strategy->SyntaxCheck(toolchain_, *scratch, job);
    options.limits = settings_.precheck_limits;
    options.output_cap_bytes = settings_.output_cap_bytes;
    options.isolation = plan.get();

    ProcessResult result = Process::Run(options);
    if (!result.started) {
        Logger::Error("Pre-check helper failed to start: ", result.setup_error);
        return diagnostics;
    }
    if (result.Succeeded()) {
        return diagnostics;
    }
    if (result.timed_out || result.term_signal != 0) {
        return {Diagnostic{0, 0, "syntax check exceeded its resource limits"}};
    }

    ErrorSanitizer sanitizer = SanitizerFor(*scratch);
    diagnostics = ParseToolDiagnostics(result.stderr_data, strategy->SourceName());
    if (diagnostics.empty()) {
        diagnostics.push_back(Diagnostic{0, 0, strategy->UnattributedFailure(job.entry_point)});
    }
    for (Diagnostic& diagnostic : diagnostics) {
        diagnostic.message = sanitizer.Sanitize(diagnostic.message);
    }
    return diagnostics;
}

RawOutcome ProcessSandbox::Execute(const SandboxJob& job) {
    auto strategy = MakeStrategy(job.language);
    if (!strategy || !strategy->Available(toolchain_)) {
        return Unavailable("no toolchain for language '" + job.language + "'");
    }

    auto scratch = ScratchDirectory::Create(settings_.scratch_root);
    if (!scratch) {
        return Unavailable("could not create a scratch directory");
    }
    ErrorSanitizer sanitizer = SanitizerFor(*scratch);

    if (!strategy->Stage(*scratch, job)) {
        return Unavailable("could not stage the submission");
    }

    std::string plan_error;
    auto plan = PlanFor(*scratch, job.allow_network, &plan_error);
    if (!plan) {
        return Unavailable(plan_error);
    }

    if (auto build = strategy->Build(toolchain_, *scratch)) {
        build->limits = settings_.build_limits;
        build->output_cap_bytes = settings_.output_cap_bytes;
        build->isolation = plan.get();

        ProcessResult built = Process::Run(*build);
        if (!built.started) {
            return Unavailable(built.setup_error);
        }
        if (!built.Succeeded()) {
            RawOutcome outcome;
            outcome.status = RawStatus::kCompileError;
            CopyUsage(built, &outcome);
            if (built.timed_out || built.term_signal != 0) {
                outcome.error = "compilation exceeded its resource limits";
                return outcome;
            }
            outcome.diagnostics = ParseToolDiagnostics(built.stderr_data, strategy->SourceName());
            for (Diagnostic& diagnostic : outcome.diagnostics) {
                diagnostic.message = sanitizer.Sanitize(diagnostic.message);
            }
            if (outcome.diagnostics.empty()) {
                bool harness = !ParseToolDiagnostics(built.stderr_data, kHarnessLabel).empty();
                outcome.error = harness ? strategy->UnattributedFailure(job.entry_point)
                                        : "compilation failed: no definition for entry point '" + job.entry_point + "'";
            } else {
                outcome.error = "compilation failed";
            }
            return outcome;
        }
    }

    ProcessOptions run = strategy->Run(toolchain_, *scratch, job);
    run.limits = job.limits;
    run.output_cap_bytes = settings_.output_cap_bytes;
    run.result_channel = true;
    run.result_cap_bytes = settings_.result_cap_bytes;
    run.isolation = plan.get();

    ProcessResult result = Process::Run(run);
    if (!result.started) {
        return Unavailable(result.setup_error);
    }

    RawOutcome outcome = ClassifyProcess(result, job.limits, sanitizer);
    if (outcome.policy_violation) {
        Logger::Critical("Sandboxed ", job.language, " process killed by the syscall filter; context torn down");
    }
    return outcome;
}

} // namespace aiexec
