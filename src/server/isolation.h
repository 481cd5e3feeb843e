#pragma once

#include <linux/filter.h>

#include <memory>
#include <string>
#include <vector>

namespace aiexec {

struct IsolationCapabilities {
    bool user_namespaces = false;
    int landlock_abi = 0;
    bool seccomp = false;
};

// Tests what the running kernel lets an unprivileged process do. Forks once.
IsolationCapabilities ProbeIsolation();

struct IsolationPolicy {
    bool namespaces = false;
    bool namespaces_required = false;
    bool landlock = false;
    bool allow_network = false;
    std::vector<std::string> readonly_paths;
    std::vector<std::string> writable_paths;
};

// Everything the child needs to confine itself, computed in the parent so that the
// child only issues raw system calls between fork and exec.
class IsolationPlan {
public:
    ~IsolationPlan();

    IsolationPlan(const IsolationPlan&) = delete;
    IsolationPlan& operator=(const IsolationPlan&) = delete;

    // Returns nullptr and fills `error` when a requested feature cannot be set up.
    static std::unique_ptr<IsolationPlan> Prepare(const IsolationPolicy& policy, std::string* error);

    // Child-side steps, in this order. Each returns 0 or an errno value.
    int EnterNamespaces() const;
    int RestrictFilesystem() const;
    int InstallSyscallFilter() const;

    int landlock_fd() const { return landlock_fd_; }
    bool allows_network() const { return allow_network_; }

private:
    IsolationPlan() = default;

    bool namespaces_ = false;
    bool namespaces_required_ = false;
    bool allow_network_ = false;
    std::string uid_map_;
    std::string gid_map_;
    int landlock_fd_ = -1;
    std::vector<sock_filter> filter_;
};

// Default read-only locations for interpreters and toolchains, filtered to existing paths.
std::vector<std::string> SystemReadonlyPaths();

} // namespace aiexec
