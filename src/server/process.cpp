#include "src/server/process.h"
#include "src/server/isolation.h"
#include "src/server/logger.h"

#include <fstream>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <mutex>

namespace aiexec {

namespace fs = std::filesystem;

namespace {

constexpr const char* kScratchPrefix = "run_";
constexpr int kResultFd = 3;
// Time allowed to drain pipes once the process group has been killed.
constexpr int64_t kDrainGraceMs = 500;

enum class SetupStage : int {
    kDup = 1,
    kNamespaces,
    kLimits,
    kChdir,
    kPrivileges,
    kLandlock,
    kSeccomp,
    kExec
};

struct SetupFailure {
    int stage;
    int error;
};

const char* StageName(int stage) {
    switch (static_cast<SetupStage>(stage)) {
        case SetupStage::kDup: return "redirecting descriptors";
        case SetupStage::kNamespaces: return "entering namespaces";
        case SetupStage::kLimits: return "applying resource limits";
        case SetupStage::kChdir: return "changing directory";
        case SetupStage::kPrivileges: return "dropping privileges";
        case SetupStage::kLandlock: return "restricting filesystem";
        case SetupStage::kSeccomp: return "installing syscall filter";
        case SetupStage::kExec: return "executing";
    }
    return "setting up";
}

[[noreturn]] void FailChild(int status_fd, SetupStage stage, int error) {
    SetupFailure failure{static_cast<int>(stage), error};
    ssize_t ignored = write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

int SetLimit(int resource, rlim_t value) {
    struct rlimit limit;
    limit.rlim_cur = value;
    limit.rlim_max = value;
    return setrlimit(resource, &limit) < 0 ? errno : 0;
}

int ApplyLimits(const ResourceLimits& limits) {
    // Soft CPU limit raises SIGXCPU; the hard limit one second later is a SIGKILL.
    rlim_t cpu_seconds = static_cast<rlim_t>((limits.cpu_time_ms + 999) / 1000);
    struct rlimit cpu_limit;
    cpu_limit.rlim_cur = std::max<rlim_t>(cpu_seconds, 1);
    cpu_limit.rlim_max = cpu_limit.rlim_cur + 1; // Grace period
    if (setrlimit(RLIMIT_CPU, &cpu_limit) < 0) return errno;

    if (int err = SetLimit(RLIMIT_AS, limits.memory_bytes)) return err;
    if (int err = SetLimit(RLIMIT_FSIZE, limits.file_size_bytes)) return err;
    if (int err = SetLimit(RLIMIT_NOFILE, limits.open_files)) return err;
    if (int err = SetLimit(RLIMIT_CORE, 0)) return err;
#ifdef __linux__
    if (int err = SetLimit(RLIMIT_NPROC, limits.max_processes)) return err;
#endif
    return 0;
}

void CloseDescriptorsFrom(int first, int keep) {
#ifdef SYS_close_range
    bool closed;
    if (keep < first) {
        closed = syscall(SYS_close_range, first, ~0U, 0) == 0;
    } else {
        closed = (keep == first || syscall(SYS_close_range, first, keep - 1, 0) == 0) &&
                 syscall(SYS_close_range, keep + 1, ~0U, 0) == 0;
    }
    if (closed) return;
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) max_fd = 1024;
    for (int fd = first; fd < max_fd; fd++) {
        if (fd != keep) close(fd);
    }
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void ClosePipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Reads whatever is available; returns false once the write end is closed.
bool DrainInto(int fd, CappedBuffer& buffer) {
    char chunk[4096];
    for (;;) {
        ssize_t bytes = read(fd, chunk, sizeof(chunk));
        if (bytes > 0) {
            buffer.Append(chunk, static_cast<size_t>(bytes));
            continue;
        }
        if (bytes == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

int64_t TimevalMs(const struct timeval& tv) {
    return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

bool ProcessExists(pid_t pid) {
    return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace

void CappedBuffer::Append(const char* data, size_t size) {
    size_t room = data_.size() < cap_ ? cap_ - data_.size() : 0;
    size_t take = std::min(room, size);
    data_.append(data, take);
    omitted_ += size - take;
}

std::string CappedBuffer::Render() const {
    if (!truncated()) return data_;
    return data_ + "\n[output truncated: " + std::to_string(omitted_) + " bytes omitted]";
}

ScratchDirectory::~ScratchDirectory() {
    Process::RemoveDirectory(path_);
}

std::unique_ptr<ScratchDirectory> ScratchDirectory::Create(const std::string& root) {
    std::string path = Process::CreateTempDirectory(root);
    if (path.empty()) return nullptr;
    return std::unique_ptr<ScratchDirectory>(new ScratchDirectory(path));
}

bool ScratchDirectory::WriteFile(const std::string& name, const std::string& content) const {
    return Process::WriteFile(PathOf(name), content);
}

std::string Process::CreateTempDirectory(const std::string& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        Logger::Error("Failed to create scratch root ", root, ": ", ec.message());
        return "";
    }

    std::string template_str = root + "/" + kScratchPrefix + std::to_string(getpid()) + "_XXXXXX";
    std::vector<char> buffer(template_str.begin(), template_str.end());
    buffer.push_back('\0');

    char* path = mkdtemp(buffer.data());
    if (!path) {
        Logger::Error("Failed to create temporary directory: ", strerror(errno));
        return "";
    }
    Logger::Debug("Created temporary directory: ", path);
    return std::string(path);
}

bool Process::RemoveDirectory(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return false;

    fs::remove_all(path, ec);
    if (ec) {
        Logger::Error("Failed to remove directory: ", path, " - ", ec.message());
        return false;
    }
    Logger::Debug("Removed directory: ", path);
    return true;
}

bool Process::WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        Logger::Error("Failed to open file for writing: ", path);
        return false;
    }
    out << content;
    out.close();
    return static_cast<bool>(out);
}

int Process::SweepStaleDirectories(const std::string& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return 0;

    int removed = 0;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind(kScratchPrefix, 0) != 0) continue;

        // run_<pid>_XXXXXX
        size_t start = std::strlen(kScratchPrefix);
        size_t end = name.find('_', start);
        if (end == std::string::npos) continue;

        pid_t owner = static_cast<pid_t>(std::atol(name.substr(start, end - start).c_str()));
        if (owner <= 0 || owner == getpid() || ProcessExists(owner)) continue;

        if (RemoveDirectory(entry.path().string())) removed++;
    }
    if (removed) {
        Logger::Warn("Removed ", removed, " stale scratch directories from ", root);
    }
    return removed;
}

std::string Process::ResolveExecutable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? fs::absolute(name).string() : "";
    }

    const char* path_env = getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t pos = 0;
    while (pos <= search.size()) {
        size_t next = search.find(':', pos);
        if (next == std::string::npos) next = search.size();
        std::string dir = search.substr(pos, next - pos);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + name;
            if (access(candidate.c_str(), X_OK) == 0) return candidate;
        }
        pos = next + 1;
    }
    return "";
}

ProcessResult Process::Run(const ProcessOptions& options) {
    ProcessResult result;

    // A child dying before it read its stdin must surface as EPIPE, not kill the server.
    static std::once_flag ignore_sigpipe;
    std::call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });

    if (options.argv.empty() || options.argv[0].empty() || options.argv[0][0] != '/') {
        result.setup_error = "Executable path must be absolute";
        return result;
    }

    // Everything the child touches is built before fork.
    std::vector<char*> c_argv;
    for (const auto& arg : options.argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    std::vector<char*> c_env;
    for (const auto& var : options.env) {
        c_env.push_back(const_cast<char*>(var.c_str()));
    }
    c_env.push_back(nullptr);

    const char* workdir = options.working_directory.empty() ? nullptr : options.working_directory.c_str();
    const IsolationPlan* isolation = options.isolation;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int result_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(stdin_pipe, O_CLOEXEC) == -1 || pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        pipe2(stderr_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1 ||
        (options.result_channel && pipe2(result_pipe, O_CLOEXEC) == -1)) {
        Logger::Error("Failed to create pipes: ", strerror(errno));
        result.setup_error = "Failed to create pipes";
        ClosePipe(stdin_pipe);
        ClosePipe(stdout_pipe);
        ClosePipe(stderr_pipe);
        ClosePipe(result_pipe);
        ClosePipe(status_pipe);
        return result;
    }

    pid_t parent_pid = getpid();
    auto start_time = std::chrono::steady_clock::now();

    pid_t pid = fork();
    if (pid == -1) {
        Logger::Error("Failed to fork: ", strerror(errno));
        result.setup_error = "Failed to fork";
        ClosePipe(stdin_pipe);
        ClosePipe(stdout_pipe);
        ClosePipe(stderr_pipe);
        ClosePipe(result_pipe);
        ClosePipe(status_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on.
        int status_fd = status_pipe[1];

        setpgid(0, 0);
        prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0);
        signal(SIGPIPE, SIG_DFL);
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
        if (getppid() != parent_pid) _exit(127);

        // Targets 0-2 are never sources since every pipe end is above 2.
        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
            FailChild(status_fd, SetupStage::kDup, errno);
        }
        if (options.result_channel) {
            if (result_pipe[1] == kResultFd) {
                if (fcntl(kResultFd, F_SETFD, 0) < 0) FailChild(status_fd, SetupStage::kDup, errno);
            } else {
                if (status_fd == kResultFd) {
                    int moved = fcntl(status_fd, F_DUPFD_CLOEXEC, kResultFd + 1);
                    if (moved < 0) _exit(127);
                    status_fd = moved;
                }
                if (dup2(result_pipe[1], kResultFd) < 0) FailChild(status_fd, SetupStage::kDup, errno);
            }
        }

        if (isolation) {
            if (int err = isolation->EnterNamespaces()) FailChild(status_fd, SetupStage::kNamespaces, err);
        }

        if (options.limits) {
            if (int err = ApplyLimits(*options.limits)) FailChild(status_fd, SetupStage::kLimits, err);
        }

        if (workdir && chdir(workdir) != 0) {
            FailChild(status_fd, SetupStage::kChdir, errno);
        }

        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
            FailChild(status_fd, SetupStage::kPrivileges, errno);
        }
        prctl(PR_SET_DUMPABLE, 0, 0, 0, 0);

        if (isolation) {
            if (int err = isolation->RestrictFilesystem()) FailChild(status_fd, SetupStage::kLandlock, err);
        }

        CloseDescriptorsFrom(options.result_channel ? kResultFd + 1 : STDERR_FILENO + 1, status_fd);

        if (isolation) {
            if (int err = isolation->InstallSyscallFilter()) FailChild(status_fd, SetupStage::kSeccomp, err);
        }

        execve(c_argv[0], c_argv.data(), c_env.data());
        FailChild(status_fd, SetupStage::kExec, errno);
    }

    // Parent process
    setpgid(pid, pid);

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);
    if (options.result_channel) close(result_pipe[1]);

    // The status pipe reaches EOF on a successful exec (close-on-exec) or carries the failure.
    SetupFailure failure{0, 0};
    ssize_t status_bytes;
    do {
        status_bytes = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        if (options.result_channel) close(result_pipe[0]);

        result.setup_error = std::string("Failed while ") + StageName(failure.stage) + ": " + strerror(failure.error);
        Logger::Error("Child setup failed for ", options.argv[0], ": ", result.setup_error);
        return result;
    }
    result.started = true;

    CappedBuffer stdout_buffer(options.output_cap_bytes);
    CappedBuffer stderr_buffer(options.output_cap_bytes);
    CappedBuffer result_buffer(options.result_cap_bytes);

    int stdin_fd = stdin_pipe[1];
    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    int result_fd = options.result_channel ? result_pipe[0] : -1;
    size_t stdin_offset = 0;

    SetNonBlocking(stdout_fd);
    SetNonBlocking(stderr_fd);
    if (result_fd >= 0) SetNonBlocking(result_fd);
    SetNonBlocking(stdin_fd);

    if (options.stdin_data.empty()) {
        close(stdin_fd);
        stdin_fd = -1;
    }

    bool has_deadline = options.limits.has_value();
    auto deadline = start_time + std::chrono::milliseconds(has_deadline ? options.limits->wall_time_ms : 0);

    bool exited = false;
    int status = 0;
    struct rusage usage {};
    std::chrono::steady_clock::time_point drain_deadline;
    bool draining = false;

    auto kill_group = [&]() {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
    };

    while (stdout_fd >= 0 || stderr_fd >= 0 || result_fd >= 0 || !exited) {
        auto now = std::chrono::steady_clock::now();

        if (!exited && has_deadline && now >= deadline) {
            result.timed_out = true;
            kill_group();
        }
        if (draining && now >= drain_deadline) {
            break;
        }

        if (!exited) {
            pid_t waited = wait4(pid, &status, WNOHANG, &usage);
            if (waited == pid) {
                exited = true;
                // Nothing started by the submission may outlive it.
                kill(-pid, SIGKILL);
                draining = true;
                drain_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kDrainGraceMs);
            } else if (result.timed_out) {
                while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {}
                exited = true;
                draining = true;
                drain_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kDrainGraceMs);
            }
        }

        struct pollfd fds[4];
        int nfds = 0;
        int stdout_idx = -1, stderr_idx = -1, result_idx = -1, stdin_idx = -1;
        if (stdout_fd >= 0) { fds[nfds] = {stdout_fd, POLLIN, 0}; stdout_idx = nfds++; }
        if (stderr_fd >= 0) { fds[nfds] = {stderr_fd, POLLIN, 0}; stderr_idx = nfds++; }
        if (result_fd >= 0) { fds[nfds] = {result_fd, POLLIN, 0}; result_idx = nfds++; }
        if (stdin_fd >= 0) { fds[nfds] = {stdin_fd, POLLOUT, 0}; stdin_idx = nfds++; }

        if (nfds == 0) {
            if (exited) break;
            // All pipes closed but the process still runs; wait for it or the deadline.
            usleep(10 * 1000);
            continue;
        }

        int timeout_ms = 50;
        if (has_deadline && !exited) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            timeout_ms = static_cast<int>(std::clamp<int64_t>(remaining, 0, 50));
        }

        int activity = poll(fds, nfds, timeout_ms);
        if (activity < 0) {
            if (errno == EINTR) continue;
            Logger::Error("Poll error: ", strerror(errno));
            kill_group();
            break;
        }
        if (activity == 0) continue;

        if (stdout_idx >= 0 && fds[stdout_idx].revents) {
            if (!DrainInto(stdout_fd, stdout_buffer)) { close(stdout_fd); stdout_fd = -1; }
        }
        if (stderr_idx >= 0 && fds[stderr_idx].revents) {
            if (!DrainInto(stderr_fd, stderr_buffer)) { close(stderr_fd); stderr_fd = -1; }
        }
        if (result_idx >= 0 && fds[result_idx].revents) {
            if (!DrainInto(result_fd, result_buffer)) { close(result_fd); result_fd = -1; }
        }
        if (stdin_idx >= 0 && fds[stdin_idx].revents) {
            if (fds[stdin_idx].revents & (POLLERR | POLLHUP)) {
                close(stdin_fd);
                stdin_fd = -1;
            } else {
                ssize_t written = write(stdin_fd, options.stdin_data.data() + stdin_offset,
                                        options.stdin_data.size() - stdin_offset);
                if (written > 0) {
                    stdin_offset += static_cast<size_t>(written);
                } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
                    stdin_offset = options.stdin_data.size();
                }
                if (stdin_offset >= options.stdin_data.size()) {
                    close(stdin_fd);
                    stdin_fd = -1;
                }
            }
        }
    }

    if (!exited) {
        kill_group();
        while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {}
    }
    if (stdin_fd >= 0) close(stdin_fd);
    if (stdout_fd >= 0) close(stdout_fd);
    if (stderr_fd >= 0) close(stderr_fd);
    if (result_fd >= 0) close(result_fd);

    auto end_time = std::chrono::steady_clock::now();
    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    result.cpu_time_ms = TimevalMs(usage.ru_utime) + TimevalMs(usage.ru_stime);
    result.max_rss_kb = usage.ru_maxrss;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    result.stdout_data = stdout_buffer.Render();
    result.stderr_data = stderr_buffer.Render();
    result.stdout_truncated = stdout_buffer.truncated();
    result.stderr_truncated = stderr_buffer.truncated();
    result.result = result_buffer.data();
    result.result_truncated = result_buffer.truncated();
    return result;
}

} // namespace aiexec
