#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aiexec {

class IsolationPlan;

struct ResourceLimits {
    int64_t cpu_time_ms = 2000;
    int64_t wall_time_ms = 5000;
    uint64_t memory_bytes = 256ull * 1024 * 1024;
    uint64_t file_size_bytes = 16ull * 1024 * 1024;
    unsigned long max_processes = 64; // Prevent fork bombs
    unsigned long open_files = 64;
};

// Keeps the first `cap` bytes of a stream and counts the rest.
class CappedBuffer {
public:
    explicit CappedBuffer(size_t cap) : cap_(cap) {}

    void Append(const char* data, size_t size);

    bool truncated() const { return omitted_ > 0; }
    size_t omitted() const { return omitted_; }
    const std::string& data() const { return data_; }

    // Captured bytes followed by a truncation marker when anything was dropped.
    std::string Render() const;

private:
    size_t cap_;
    size_t omitted_ = 0;
    std::string data_;
};

// Per-execution temporary directory, removed with everything inside on destruction.
class ScratchDirectory {
public:
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    // Returns nullptr (and logs) when the directory cannot be created.
    static std::unique_ptr<ScratchDirectory> Create(const std::string& root);

    const std::string& path() const { return path_; }
    std::string PathOf(const std::string& name) const { return path_ + "/" + name; }

    bool WriteFile(const std::string& name, const std::string& content) const;

private:
    explicit ScratchDirectory(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

struct ProcessOptions {
    // argv[0] must be an absolute path; no PATH search happens in the child.
    std::vector<std::string> argv;
    std::vector<std::string> env;
    std::string working_directory;
    std::string stdin_data;
    std::optional<ResourceLimits> limits;
    size_t output_cap_bytes = 64 * 1024;
    // When set, the child gets a pipe on fd 3 whose contents land in ProcessResult::result.
    bool result_channel = false;
    size_t result_cap_bytes = 1024 * 1024;
    const IsolationPlan* isolation = nullptr;
};

struct ProcessResult {
    bool started = false;
    std::string setup_error;

    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::string result;
    bool result_truncated = false;

    int64_t elapsed_ms = 0;
    int64_t cpu_time_ms = 0;
    int64_t max_rss_kb = 0;

    bool Succeeded() const { return started && term_signal == 0 && exit_code == 0; }
};

class Process {
public:
    static std::string CreateTempDirectory(const std::string& root);
    static bool RemoveDirectory(const std::string& path);
    static bool WriteFile(const std::string& path, const std::string& content);

    // Removes scratch directories left behind by processes that no longer exist.
    static int SweepStaleDirectories(const std::string& root);

    // Absolute path of an executable, searching PATH for bare names. Empty when not found.
    static std::string ResolveExecutable(const std::string& name);

    // Runs a command in its own process group. The wall-clock limit (when limits are set)
    // is authoritative: at expiry, or as soon as the main process exits, the whole group
    // is killed so nothing outlives the call.
    static ProcessResult Run(const ProcessOptions& options);
};

} // namespace aiexec
