#include <gtest/gtest.h>

#include "src/server/sandbox.h"
#include "tests/test_support.h"

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <memory>
#include <thread>

using namespace aiexec;

namespace fs = std::filesystem;

namespace {

ResourceLimits TestLimits() {
    ResourceLimits limits;
    limits.cpu_time_ms = 2000;
    limits.wall_time_ms = 5000;
    limits.memory_bytes = 256ull << 20;
    limits.file_size_bytes = 16ull << 20;
    return limits;
}

ProcessResult Exited(int code, const std::string& report = "") {
    ProcessResult result;
    result.started = true;
    result.exit_code = code;
    result.result = report;
    return result;
}

ProcessResult Signalled(int signal) {
    ProcessResult result;
    result.started = true;
    result.term_signal = signal;
    return result;
}

} // namespace

TEST(ClassifyProcessTest, SuccessCarriesTheReportedValue) {
    ErrorSanitizer sanitizer;
    RawOutcome outcome = ClassifyProcess(Exited(0, R"({"ok":true,"value":[1,"two"]})"), TestLimits(), sanitizer);
    EXPECT_EQ(outcome.status, RawStatus::kSuccess);
    ASSERT_TRUE(outcome.value.has_value());
    ASSERT_EQ(outcome.value->list_value().values_size(), 2);
    EXPECT_EQ(outcome.value->list_value().values(1).string_value(), "two");
    EXPECT_TRUE(outcome.error.empty());
}

TEST(ClassifyProcessTest, SyscallFilterKillIsAPolicyViolation) {
    ErrorSanitizer sanitizer;
    RawOutcome outcome = ClassifyProcess(Signalled(SIGSYS), TestLimits(), sanitizer);
    EXPECT_EQ(outcome.status, RawStatus::kRuntimeError);
    EXPECT_TRUE(outcome.policy_violation);
    EXPECT_EQ(outcome.error, "execution terminated: blocked system call");
}

TEST(ClassifyProcessTest, LimitsMapToTimeoutAndResourceExceeded) {
    ErrorSanitizer sanitizer;
    ResourceLimits limits = TestLimits();

    ProcessResult wall = Signalled(SIGKILL);
    wall.timed_out = true;
    RawOutcome timed_out = ClassifyProcess(wall, limits, sanitizer);
    EXPECT_EQ(timed_out.status, RawStatus::kTimeout);
    EXPECT_EQ(timed_out.error, "wall-clock limit of 5000 ms exceeded");

    ProcessResult cpu = Signalled(SIGKILL);
    cpu.cpu_time_ms = 3000;
    RawOutcome cpu_outcome = ClassifyProcess(cpu, limits, sanitizer);
    EXPECT_EQ(cpu_outcome.status, RawStatus::kTimeout);
    EXPECT_EQ(cpu_outcome.error, "CPU time limit of 2000 ms exceeded");

    EXPECT_EQ(ClassifyProcess(Signalled(SIGXCPU), limits, sanitizer).status, RawStatus::kTimeout);

    RawOutcome fsize = ClassifyProcess(Signalled(SIGXFSZ), limits, sanitizer);
    EXPECT_EQ(fsize.status, RawStatus::kResourceExceeded);
    EXPECT_EQ(fsize.error, "file size limit of 16 MiB exceeded");

    RawOutcome memory = ClassifyProcess(Exited(1, R"({"ok":false,"type":"MemoryError","message":""})"), limits,
                                        sanitizer);
    EXPECT_EQ(memory.status, RawStatus::kResourceExceeded);
    EXPECT_EQ(memory.error, "memory limit of 256 MiB exceeded");

    ProcessResult aborted = Signalled(SIGABRT);
    aborted.stderr_data = "terminate called after throwing an instance of 'std::bad_alloc'";
    aborted.max_rss_kb = 200 * 1024;
    EXPECT_EQ(ClassifyProcess(aborted, limits, sanitizer).status, RawStatus::kResourceExceeded);

    ProcessResult killed = Signalled(SIGKILL);
    killed.max_rss_kb = 256 * 1024;
    EXPECT_EQ(ClassifyProcess(killed, limits, sanitizer).status, RawStatus::kResourceExceeded);
}

TEST(ClassifyProcessTest, ProgramCannotClaimMemoryExhaustionThroughStderr) {
    ErrorSanitizer sanitizer;
    ResourceLimits limits = TestLimits();

    ProcessResult faked = Exited(1);
    faked.stderr_data = "Traceback (most recent call last):\nMemoryError\n";
    faked.max_rss_kb = 9 * 1024;
    RawOutcome outcome = ClassifyProcess(faked, limits, sanitizer);
    EXPECT_EQ(outcome.status, RawStatus::kRuntimeError);
    EXPECT_EQ(outcome.error, "process exited with status 1");

    ProcessResult clean = Exited(0);
    clean.stderr_data = "out of memory\n";
    clean.max_rss_kb = 200 * 1024;
    EXPECT_EQ(ClassifyProcess(clean, limits, sanitizer).status, RawStatus::kRuntimeError);
}

TEST(ClassifyProcessTest, ReportedExceptionIsSanitized) {
    ErrorSanitizer sanitizer;
    sanitizer.AddSecret("hunter2hunter2");
    RawOutcome outcome = ClassifyProcess(
        Exited(1, R"({"ok":false,"type":"FileNotFoundError","message":"No such file: '/etc/app.conf'","line":3})"),
        TestLimits(), sanitizer);
    EXPECT_EQ(outcome.status, RawStatus::kRuntimeError);
    EXPECT_EQ(outcome.error, "FileNotFoundError: No such file: '<path>' (line 3)");

    RawOutcome leaked = ClassifyProcess(
        Exited(1, R"({"ok":false,"type":"KeyError","message":"hunter2hunter2"})"), TestLimits(), sanitizer);
    EXPECT_EQ(leaked.error, "KeyError: <redacted>");
}

TEST(ClassifyProcessTest, MissingOrBrokenReport) {
    ErrorSanitizer sanitizer;
    ResourceLimits limits = TestLimits();

    EXPECT_EQ(ClassifyProcess(Exited(0), limits, sanitizer).error, "entry point did not report a result");
    EXPECT_EQ(ClassifyProcess(Exited(2), limits, sanitizer).error, "process exited with status 2");
    EXPECT_EQ(ClassifyProcess(Signalled(SIGSEGV), limits, sanitizer).error, "terminated by SIGSEGV");
    EXPECT_EQ(ClassifyProcess(Exited(0, "{not json"), limits, sanitizer).error, "return value could not be decoded");

    ProcessResult oversized = Exited(0, "{\"ok\":true");
    oversized.result_truncated = true;
    EXPECT_EQ(ClassifyProcess(oversized, limits, sanitizer).error, "return value exceeds the result size limit");
}

TEST(ClassifyProcessTest, OutputIsRedactedButKeepsOrdinaryPaths) {
    ErrorSanitizer sanitizer;
    sanitizer.AddSecret("hunter2hunter2");
    ProcessResult result = Exited(0, R"({"ok":true,"value":null})");
    result.stdout_data = "password hunter2hunter2 in /usr/share/doc\n";
    RawOutcome outcome = ClassifyProcess(result, TestLimits(), sanitizer);
    EXPECT_EQ(outcome.stdout_data, "password <redacted> in /usr/share/doc\n");
}

TEST(LanguageStrategyTest, ResolvesLanguageAliases) {
    ASSERT_NE(MakeStrategy("python"), nullptr);
    EXPECT_EQ(MakeStrategy("py")->Name(), "python");
    EXPECT_EQ(MakeStrategy("cpp")->Name(), "cpp");
    EXPECT_EQ(MakeStrategy("c++")->SourceName(), "submission.cpp");
    EXPECT_EQ(MakeStrategy("ruby"), nullptr);
}

TEST(LanguageStrategyTest, CppTakesPositionalArgumentsOnly) {
    SandboxJob job;
    job.language = "cpp";
    EXPECT_TRUE(MakeStrategy("cpp")->CheckArguments(job).empty());
    (*job.kwargs.mutable_fields())["n"].set_number_value(1);
    EXPECT_FALSE(MakeStrategy("cpp")->CheckArguments(job).empty());
    EXPECT_TRUE(MakeStrategy("python")->CheckArguments(job).empty());
}

TEST(LanguageStrategyTest, CppProgramWrapsSubmissionWithLineMarkers) {
    std::string program = CppStrategy::Program("int solve() { return 1; }\n", "solve");
    EXPECT_NE(program.find("#line 1 \"submission.cpp\"\nint solve() { return 1; }"), std::string::npos);
    EXPECT_NE(program.find("::solve("), std::string::npos);
    EXPECT_EQ(program.find("@ENTRY@"), std::string::npos);
    EXPECT_NE(program.find("int main("), std::string::npos);
}

// Runs real submissions; skipped where the host cannot provide the sandbox.
class ProcessSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_root_ = (fs::temp_directory_path() / ("aiexec_sandbox_test_" + std::to_string(getpid()))).string();
        Settings settings = LoadSettings(test::MapEnv({
            {"AIEXEC_SECRET_KEY", test::kTestSecret},
            {"AIEXEC_SCRATCH_ROOT", scratch_root_},
        }));
        std::string error;
        sandbox_ = ProcessSandbox::Create(settings.sandbox, &error);
        if (!sandbox_) {
            GTEST_SKIP() << "sandbox unavailable: " << error;
        }
        if (sandbox_->toolchain().python.empty()) {
            GTEST_SKIP() << "no Python interpreter on this host";
        }
    }

    void TearDown() override {
        sandbox_.reset();
        std::error_code ec;
        fs::remove_all(scratch_root_, ec);
    }

    static SandboxJob Python(const std::string& code) {
        SandboxJob job;
        job.language = "python";
        job.code = code;
        job.entry_point = "run";
        job.limits = TestLimits();
        return job;
    }

    bool ScratchRootIsEmpty() const {
        std::error_code ec;
        return !fs::exists(scratch_root_, ec) || fs::is_empty(scratch_root_, ec);
    }

    std::string scratch_root_;
    std::unique_ptr<ProcessSandbox> sandbox_;
};

TEST_F(ProcessSandboxTest, ReturnsValueAndOutput) {
    SandboxJob job = Python("def run(a, b=0):\n    print('adding')\n    return a + b\n");
    job.args.add_values()->set_number_value(40);
    (*job.kwargs.mutable_fields())["b"].set_number_value(2);

    RawOutcome outcome = sandbox_->Execute(job);
    ASSERT_EQ(outcome.status, RawStatus::kSuccess) << outcome.error << "\n" << outcome.stderr_data;
    ASSERT_TRUE(outcome.value.has_value());
    EXPECT_EQ(outcome.value->number_value(), 42);
    EXPECT_EQ(outcome.stdout_data, "adding\n");
    EXPECT_TRUE(ScratchRootIsEmpty());
}

TEST_F(ProcessSandboxTest, RepeatedSubmissionsAreIndependent) {
    SandboxJob job = Python(
        "import os\n"
        "def run():\n"
        "    existed = os.path.exists('state.txt')\n"
        "    open('state.txt', 'w').write('x')\n"
        "    return existed\n");
    for (int i = 0; i < 2; ++i) {
        RawOutcome outcome = sandbox_->Execute(job);
        ASSERT_EQ(outcome.status, RawStatus::kSuccess) << outcome.error;
        EXPECT_FALSE(outcome.value->bool_value());
    }
}

TEST_F(ProcessSandboxTest, ConcurrentSubmissionsDoNotSeeEachOther) {
    SandboxJob job = Python(
        "import os, time\n"
        "def run(tag):\n"
        "    open('mine_' + tag, 'w').write(tag)\n"
        "    time.sleep(0.3)\n"
        "    return sorted(n for n in os.listdir('.') if n.startswith('mine_'))\n");
    SandboxJob first = job;
    first.args.add_values()->set_string_value("a");
    SandboxJob second = job;
    second.args.add_values()->set_string_value("b");

    RawOutcome first_outcome;
    RawOutcome second_outcome;
    std::thread worker([&] { first_outcome = sandbox_->Execute(first); });
    second_outcome = sandbox_->Execute(second);
    worker.join();

    ASSERT_EQ(first_outcome.status, RawStatus::kSuccess) << first_outcome.error;
    ASSERT_EQ(second_outcome.status, RawStatus::kSuccess) << second_outcome.error;
    ASSERT_EQ(first_outcome.value->list_value().values_size(), 1);
    EXPECT_EQ(first_outcome.value->list_value().values(0).string_value(), "mine_a");
    ASSERT_EQ(second_outcome.value->list_value().values_size(), 1);
    EXPECT_EQ(second_outcome.value->list_value().values(0).string_value(), "mine_b");
}

TEST_F(ProcessSandboxTest, ExceptionBecomesRuntimeError) {
    RawOutcome outcome = sandbox_->Execute(Python("def run():\n    raise ValueError('boom')\n"));
    EXPECT_EQ(outcome.status, RawStatus::kRuntimeError);
    EXPECT_NE(outcome.error.find("ValueError: boom"), std::string::npos) << outcome.error;
    EXPECT_NE(outcome.error.find("(line 2)"), std::string::npos) << outcome.error;
    EXPECT_FALSE(outcome.policy_violation);
}

TEST_F(ProcessSandboxTest, InfiniteLoopTimesOutAndLeavesNothingBehind) {
    SandboxJob job = Python("def run():\n    while True:\n        pass\n");
    job.limits.wall_time_ms = 1000;
    job.limits.cpu_time_ms = 5000;

    RawOutcome outcome = sandbox_->Execute(job);
    EXPECT_EQ(outcome.status, RawStatus::kTimeout);
    EXPECT_EQ(outcome.error, "wall-clock limit of 1000 ms exceeded");
    EXPECT_LT(outcome.elapsed_ms, 5000);
    EXPECT_TRUE(ScratchRootIsEmpty());
}

TEST_F(ProcessSandboxTest, MemoryLimitIsEnforced) {
    SandboxJob job = Python("def run():\n    data = bytearray(1024 * 1024 * 1024)\n    return len(data)\n");
    RawOutcome outcome = sandbox_->Execute(job);
    EXPECT_EQ(outcome.status, RawStatus::kResourceExceeded) << outcome.error;
}

TEST_F(ProcessSandboxTest, NetworkIsUnavailableByDefault) {
    RawOutcome outcome = sandbox_->Execute(Python(
        "import socket\n"
        "def run():\n"
        "    s = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
        "    s.connect(('127.0.0.1', 9))\n"
        "    return 'connected'\n"));
    EXPECT_NE(outcome.status, RawStatus::kSuccess);
}

TEST_F(ProcessSandboxTest, HostUnixSocketsAreUnreachable) {
    std::string path = scratch_root_ + "_host.sock";
    int listener = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    ASSERT_GE(listener, 0) << strerror(errno);
    sockaddr_un addr = {};
    addr.sun_family = AF_UNIX;
    ASSERT_LT(path.size(), sizeof(addr.sun_path));
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    unlink(path.c_str());
    ASSERT_EQ(bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0) << strerror(errno);
    ASSERT_EQ(listen(listener, 4), 0) << strerror(errno);

    SandboxJob job = Python(
        "import socket\n"
        "def run(path):\n"
        "    s = socket.socket(socket.AF_UNIX, socket.SOCK_STREAM)\n"
        "    s.connect(path)\n"
        "    s.sendall(b'hello-from-sandbox')\n"
        "    return 'connected'\n");
    job.args.add_values()->set_string_value(path);
    RawOutcome outcome = sandbox_->Execute(job);

    EXPECT_EQ(outcome.status, RawStatus::kRuntimeError);
    EXPECT_NE(outcome.error.find("PermissionError"), std::string::npos) << outcome.error;
    int accepted = accept(listener, nullptr, nullptr);
    int accept_error = errno;
    EXPECT_LT(accepted, 0);
    EXPECT_EQ(accept_error, EAGAIN);

    close(listener);
    unlink(path.c_str());
}

TEST_F(ProcessSandboxTest, SocketPairsStillWork) {
    RawOutcome outcome = sandbox_->Execute(Python(
        "import socket\n"
        "def run():\n"
        "    a, b = socket.socketpair()\n"
        "    a.sendall(b'ping')\n"
        "    return b.recv(4).decode()\n"));
    ASSERT_EQ(outcome.status, RawStatus::kSuccess) << outcome.error << "\n" << outcome.stderr_data;
    EXPECT_EQ(outcome.value->string_value(), "ping");
}

TEST_F(ProcessSandboxTest, HostFilesAndOtherScratchDirectoriesAreUnreadable) {
    auto other = ScratchDirectory::Create(scratch_root_);
    ASSERT_NE(other, nullptr);
    ASSERT_TRUE(other->WriteFile("data.txt", "tenant-A-data"));

    SandboxJob job = Python(
        "def run(paths):\n"
        "    seen = []\n"
        "    for p in paths:\n"
        "        try:\n"
        "            with open(p) as f:\n"
        "                seen.append(f.read())\n"
        "        except OSError:\n"
        "            seen.append(None)\n"
        "    return seen\n");
    auto* paths = job.args.add_values()->mutable_list_value();
    paths->add_values()->set_string_value(other->PathOf("data.txt"));
    paths->add_values()->set_string_value("/etc/passwd");

    RawOutcome outcome = sandbox_->Execute(job);
    ASSERT_EQ(outcome.status, RawStatus::kSuccess) << outcome.error << "\n" << outcome.stderr_data;
    ASSERT_EQ(outcome.value->list_value().values_size(), 2);
    EXPECT_EQ(outcome.value->list_value().values(0).kind_case(), google::protobuf::Value::kNullValue);
    EXPECT_EQ(outcome.value->list_value().values(1).kind_case(), google::protobuf::Value::kNullValue);
}

TEST_F(ProcessSandboxTest, CheckReportsSyntaxErrorsWithPosition) {
    auto scanned = sandbox_->Check(Python("def run():\n    return (1 +\n"));
    ASSERT_EQ(scanned.size(), 1u);
    EXPECT_EQ(scanned[0].line, 2);

    // Balanced but not valid Python: only the toolchain check sees this.
    auto parsed = sandbox_->Check(Python("def run():\n    return 1 +\n"));
    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].line, 2);

    EXPECT_TRUE(sandbox_->Check(Python("def run():\n    return 1\n")).empty());
    EXPECT_TRUE(ScratchRootIsEmpty());
}

TEST_F(ProcessSandboxTest, CheckRejectsUnknownLanguage) {
    SandboxJob job = Python("x");
    job.language = "cobol";
    auto diagnostics = sandbox_->Check(job);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].message, "unsupported language");
}

TEST_F(ProcessSandboxTest, CompilesAndRunsCpp) {
    if (sandbox_->toolchain().cxx.empty()) {
        GTEST_SKIP() << "no C++ compiler on this host";
    }
    SandboxJob job;
    job.language = "cpp";
    job.code = "#include <vector>\nint run(const std::vector<std::string>& args) { return 40 + static_cast<int>(args.size()); }\n";
    job.entry_point = "run";
    job.args.add_values()->set_string_value("x");
    job.args.add_values()->set_string_value("y");
    job.limits = TestLimits();
    job.limits.wall_time_ms = 30000;
    job.limits.cpu_time_ms = 10000;

    RawOutcome outcome = sandbox_->Execute(job);
    ASSERT_EQ(outcome.status, RawStatus::kSuccess) << outcome.error << "\n" << outcome.stderr_data;
    EXPECT_EQ(outcome.value->number_value(), 42);
}
