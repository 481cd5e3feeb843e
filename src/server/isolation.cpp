#include "src/server/isolation.h"
#include "src/server/logger.h"

#include <linux/audit.h>
#include <linux/seccomp.h>
#include <sched.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>

#ifndef SECCOMP_RET_KILL_PROCESS
#define SECCOMP_RET_KILL_PROCESS 0x80000000U
#endif

// Distribution headers may predate Landlock.
#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

namespace aiexec {

namespace {

namespace fs = std::filesystem;

#if defined(__x86_64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#else
#error "No seccomp filter for this architecture"
#endif

// The child points stdio and the result channel at 0-3 before it restricts itself, so the
// ruleset must live above them.
constexpr int kLowestRulesetFd = 10;

constexpr uint32_t kLandlockCreateRulesetVersion = 1u << 0;
constexpr int kLandlockRulePathBeneath = 1;

struct LandlockRulesetAttr {
    uint64_t handled_access_fs;
};

struct LandlockPathBeneathAttr {
    uint64_t allowed_access;
    int32_t parent_fd;
} __attribute__((packed));

constexpr uint64_t kFsExecute = 1ull << 0;
constexpr uint64_t kFsWriteFile = 1ull << 1;
constexpr uint64_t kFsReadFile = 1ull << 2;
constexpr uint64_t kFsReadDir = 1ull << 3;
constexpr uint64_t kFsRemoveDir = 1ull << 4;
constexpr uint64_t kFsRemoveFile = 1ull << 5;
constexpr uint64_t kFsMakeChar = 1ull << 6;
constexpr uint64_t kFsMakeDir = 1ull << 7;
constexpr uint64_t kFsMakeReg = 1ull << 8;
constexpr uint64_t kFsMakeSock = 1ull << 9;
constexpr uint64_t kFsMakeFifo = 1ull << 10;
constexpr uint64_t kFsMakeBlock = 1ull << 11;
constexpr uint64_t kFsMakeSym = 1ull << 12;
constexpr uint64_t kFsRefer = 1ull << 13;
constexpr uint64_t kFsTruncate = 1ull << 14;

constexpr uint64_t kAccessRead = kFsExecute | kFsReadFile | kFsReadDir;
constexpr uint64_t kAccessWrite = kFsWriteFile | kFsRemoveDir | kFsRemoveFile | kFsMakeChar |
                                  kFsMakeDir | kFsMakeReg | kFsMakeSock | kFsMakeFifo |
                                  kFsMakeBlock | kFsMakeSym | kFsRefer | kFsTruncate;
// Rights that make sense on a non-directory.
constexpr uint64_t kAccessFile = kFsExecute | kFsWriteFile | kFsReadFile | kFsTruncate;

constexpr uint32_t kNamespaceCloneFlags = CLONE_NEWNS | CLONE_NEWCGROUP | CLONE_NEWUTS |
                                          CLONE_NEWIPC | CLONE_NEWUSER | CLONE_NEWPID |
                                          CLONE_NEWNET;

int LandlockAbi() {
    static const int abi = [] {
        long ret = syscall(__NR_landlock_create_ruleset, nullptr, 0, kLandlockCreateRulesetVersion);
        return ret < 0 ? 0 : static_cast<int>(ret);
    }();
    return abi;
}

uint64_t HandledAccess(int abi) {
    uint64_t handled = kAccessRead | kAccessWrite;
    if (abi < 2) handled &= ~kFsRefer;
    if (abi < 3) handled &= ~kFsTruncate;
    return handled;
}

// Escape-class calls: a submission issuing one of these is killed on the spot.
std::vector<int> KilledSyscalls() {
    return {
        __NR_ptrace,
        __NR_process_vm_readv,
        __NR_process_vm_writev,
        __NR_mount,
        __NR_umount2,
        __NR_pivot_root,
        __NR_chroot,
        __NR_setns,
        __NR_unshare,
        __NR_kexec_load,
#ifdef __NR_kexec_file_load
        __NR_kexec_file_load,
#endif
        __NR_init_module,
        __NR_finit_module,
        __NR_delete_module,
        __NR_bpf,
        __NR_perf_event_open,
        __NR_keyctl,
        __NR_add_key,
        __NR_request_key,
        __NR_userfaultfd,
        __NR_reboot,
        __NR_swapon,
        __NR_swapoff,
        __NR_open_by_handle_at,
        __NR_name_to_handle_at,
#ifdef __NR_iopl
        __NR_iopl,
#endif
#ifdef __NR_ioperm
        __NR_ioperm,
#endif
        __NR_acct,
        __NR_settimeofday,
        __NR_clock_settime,
        __NR_clock_adjtime,
        __NR_adjtimex,
        __NR_quotactl,
        __NR_syslog,
        __NR_vhangup,
        __NR_fanotify_init,
#ifdef __NR_open_tree
        __NR_open_tree,
        __NR_move_mount,
        __NR_fsopen,
        __NR_fsconfig,
        __NR_fsmount,
        __NR_fspick,
#endif
    };
}

// Calls that fail with EPERM: leaving the process group would let a descendant outlive
// the execution.
std::vector<int> RefusedSyscalls() {
    return {
        __NR_setsid,
        __NR_setpgid,
#ifdef __NR_io_uring_setup
        __NR_io_uring_setup,
        __NR_io_uring_enter,
        __NR_io_uring_register,
#endif
    };
}

std::vector<sock_filter> BuildFilter(bool allow_network) {
    std::vector<sock_filter> f;
    auto stmt = [&](uint16_t code, uint32_t k) {
        f.push_back(sock_filter{code, 0, 0, k});
    };
    auto jump = [&](uint16_t code, uint32_t k, uint8_t jt, uint8_t jf) {
        f.push_back(sock_filter{code, jt, jf, k});
    };

    const uint32_t kill = SECCOMP_RET_KILL_PROCESS;
    const uint32_t allow = SECCOMP_RET_ALLOW;

    stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch));
    jump(BPF_JMP | BPF_JEQ | BPF_K, kAuditArch, 1, 0);
    stmt(BPF_RET | BPF_K, kill);

    stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr));
#if defined(__x86_64__) && defined(__X32_SYSCALL_BIT)
    jump(BPF_JMP | BPF_JGE | BPF_K, __X32_SYSCALL_BIT, 0, 1);
    stmt(BPF_RET | BPF_K, kill);
#endif

    for (int nr : KilledSyscalls()) {
        jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 1);
        stmt(BPF_RET | BPF_K, kill);
    }
    for (int nr : RefusedSyscalls()) {
        jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 1);
        stmt(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA));
    }

#ifdef __NR_clone3
    // clone3 takes its flags through memory we cannot inspect; ENOSYS makes libc fall back.
    jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_clone3, 0, 1);
    stmt(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (ENOSYS & SECCOMP_RET_DATA));
#endif

    // clone() creating namespaces
    jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_clone, 0, 4);
    stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args[0]));
    jump(BPF_JMP | BPF_JSET | BPF_K, kNamespaceCloneFlags, 0, 1);
    stmt(BPF_RET | BPF_K, kill);
    stmt(BPF_RET | BPF_K, allow);

    // Unix sockets reach host services by path or abstract name, which neither Landlock nor
    // the network namespace covers, so socket(AF_UNIX) is refused even when network access
    // was granted. socketpair() stays available.
    const uint32_t refuse_socket = SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA);
    if (allow_network) {
        jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_socket, 0, 4);
        stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args[0]));
        jump(BPF_JMP | BPF_JEQ | BPF_K, AF_UNIX, 0, 1);
        stmt(BPF_RET | BPF_K, refuse_socket);
        stmt(BPF_RET | BPF_K, allow);
    } else {
        jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_socket, 0, 1);
        stmt(BPF_RET | BPF_K, refuse_socket);
    }

    stmt(BPF_RET | BPF_K, allow);
    return f;
}

// Async-signal-safe: used between fork and exec.
int WriteProcFile(const char* path, const std::string& content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return errno;
    ssize_t written = write(fd, content.data(), content.size());
    int err = written < 0 ? errno : 0;
    close(fd);
    return err;
}

bool AddLandlockRule(int ruleset_fd, const std::string& path, bool writable, uint64_t handled,
                     bool required, std::string* error) {
    LandlockPathBeneathAttr beneath = {};

    beneath.parent_fd = open(path.c_str(), O_PATH | O_CLOEXEC);
    if (beneath.parent_fd < 0) {
        if (!required && errno == ENOENT) return true;
        *error = "Failed to open '" + path + "': " + strerror(errno);
        return false;
    }

    struct stat sb;
    if (fstat(beneath.parent_fd, &sb) < 0) {
        *error = "Failed to stat '" + path + "': " + strerror(errno);
        close(beneath.parent_fd);
        return false;
    }

    beneath.allowed_access = kAccessRead;
    if (writable) {
        beneath.allowed_access |= kAccessWrite;
    }
    if (!S_ISDIR(sb.st_mode)) {
        beneath.allowed_access &= kAccessFile;
    }
    beneath.allowed_access &= handled;

    long ret = syscall(__NR_landlock_add_rule, ruleset_fd, kLandlockRulePathBeneath, &beneath, 0);
    int saved = errno;
    close(beneath.parent_fd);
    if (ret < 0) {
        *error = "Failed to add Landlock rule for '" + path + "': " + strerror(saved);
        return false;
    }
    return true;
}

} // namespace

IsolationCapabilities ProbeIsolation() {
    IsolationCapabilities caps;

    caps.landlock_abi = LandlockAbi();
    caps.seccomp = prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;

    std::string uid_map = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
    std::string gid_map = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";

    pid_t pid = fork();
    if (pid == 0) {
        if (unshare(CLONE_NEWUSER | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS) < 0) _exit(1);
        if (WriteProcFile("/proc/self/setgroups", "deny") != 0) _exit(2);
        if (WriteProcFile("/proc/self/uid_map", uid_map) != 0) _exit(3);
        if (WriteProcFile("/proc/self/gid_map", gid_map) != 0) _exit(4);
        _exit(0);
    } else if (pid > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        caps.user_namespaces = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    } else {
        Logger::Warn("Failed to fork isolation probe: ", strerror(errno));
    }

    Logger::Info("Isolation probe: user namespaces=", caps.user_namespaces ? "yes" : "no",
                 ", landlock ABI=", caps.landlock_abi,
                 ", seccomp=", caps.seccomp ? "yes" : "no");
    return caps;
}

IsolationPlan::~IsolationPlan() {
    if (landlock_fd_ >= 0) {
        close(landlock_fd_);
    }
}

std::unique_ptr<IsolationPlan> IsolationPlan::Prepare(const IsolationPolicy& policy, std::string* error) {
    std::unique_ptr<IsolationPlan> plan(new IsolationPlan());

    plan->namespaces_ = policy.namespaces;
    plan->namespaces_required_ = policy.namespaces_required;
    plan->allow_network_ = policy.allow_network;
    plan->uid_map_ = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
    plan->gid_map_ = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";

    if (policy.landlock) {
        int abi = LandlockAbi();
        if (abi <= 0) {
            *error = "Landlock is not available on this kernel";
            return nullptr;
        }

        LandlockRulesetAttr attr = {};
        attr.handled_access_fs = HandledAccess(abi);

        long fd = syscall(__NR_landlock_create_ruleset, &attr, sizeof(attr), 0);
        if (fd < 0) {
            *error = std::string("Failed to create Landlock ruleset: ") + strerror(errno);
            return nullptr;
        }
        int ruleset = fcntl(static_cast<int>(fd), F_DUPFD_CLOEXEC, kLowestRulesetFd);
        int saved = errno;
        close(static_cast<int>(fd));
        if (ruleset < 0) {
            *error = std::string("Failed to move Landlock ruleset: ") + strerror(saved);
            return nullptr;
        }
        plan->landlock_fd_ = ruleset;

        for (const std::string& path : policy.readonly_paths) {
            if (!AddLandlockRule(plan->landlock_fd_, path, false, attr.handled_access_fs, false, error))
                return nullptr;
        }
        for (const std::string& path : policy.writable_paths) {
            if (!AddLandlockRule(plan->landlock_fd_, path, true, attr.handled_access_fs, true, error))
                return nullptr;
        }
    }

    plan->filter_ = BuildFilter(policy.allow_network);
    return plan;
}

int IsolationPlan::EnterNamespaces() const {
    if (!namespaces_) return 0;

    int flags = CLONE_NEWUSER | CLONE_NEWIPC | CLONE_NEWUTS;
    if (!allow_network_) {
        flags |= CLONE_NEWNET;
    }

    if (unshare(flags) < 0) {
        return namespaces_required_ ? errno : 0;
    }

    // Unmapped IDs cannot create files, so map ourselves onto ourselves.
    int err = WriteProcFile("/proc/self/setgroups", "deny");
    if (!err) err = WriteProcFile("/proc/self/uid_map", uid_map_);
    if (!err) err = WriteProcFile("/proc/self/gid_map", gid_map_);
    return err;
}

int IsolationPlan::RestrictFilesystem() const {
    if (landlock_fd_ < 0) return 0;

    if (syscall(__NR_landlock_restrict_self, landlock_fd_, 0) < 0) {
        return errno;
    }
    close(landlock_fd_);
    return 0;
}

int IsolationPlan::InstallSyscallFilter() const {
    sock_fprog prog = {};
    prog.len = static_cast<unsigned short>(filter_.size());
    prog.filter = const_cast<sock_filter*>(filter_.data());

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) < 0) {
        return errno;
    }
    return 0;
}

std::vector<std::string> SystemReadonlyPaths() {
    static const char* const kCandidates[] = {
        "/usr", "/lib", "/lib64", "/lib32", "/bin", "/sbin",
        "/etc/ld.so.cache", "/etc/ld.so.conf", "/etc/ld.so.conf.d",
        "/etc/localtime", "/etc/alternatives",
        "/dev/urandom", "/dev/zero",
    };

    std::vector<std::string> paths;
    std::error_code ec;
    for (const char* candidate : kCandidates) {
        if (fs::exists(candidate, ec)) {
            paths.emplace_back(candidate);
        }
    }
    return paths;
}

} // namespace aiexec
