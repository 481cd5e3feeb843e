#pragma once

#include "src/server/audit.h"
#include "src/server/config.h"
#include "src/server/logger.h"
#include "src/server/sandbox.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace aiexec::test {

constexpr const char* kTestSecret = "0123456789abcdef0123456789abcdef-test-secret";

class RecordingAuditSink : public AuditSink {
public:
    void Record(const AuditEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<AuditEntry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    bool Has(const std::string& event, const std::string& outcome) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(entries_.begin(), entries_.end(), [&](const AuditEntry& entry) {
            return entry.event == event && entry.outcome == outcome;
        });
    }

private:
    mutable std::mutex mutex_;
    std::vector<AuditEntry> entries_;
};

// Routes Logger output into memory for the lifetime of the object.
class LogCapture {
public:
    LogCapture() {
        Logger::SetSink([this](LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.emplace_back(level, message);
        });
    }
    ~LogCapture() { Logger::SetSink(nullptr); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    int Count(LogLevel level, const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count_if(lines_.begin(), lines_.end(), [&](const auto& line) {
            return line.first == level && line.second.find(needle) != std::string::npos;
        }));
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<LogLevel, std::string>> lines_;
};

// Records the jobs it receives and answers with a preset outcome.
class FakeRuntime : public SandboxRuntime {
public:
    RawOutcome Execute(const SandboxJob& job) override {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(job);
        return outcome_;
    }

    void set_outcome(RawOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_ = std::move(outcome);
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

    SandboxJob last_job() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.back();
    }

private:
    mutable std::mutex mutex_;
    RawOutcome outcome_;
    std::vector<SandboxJob> jobs_;
};

// Structural scan only, no toolchain.
class NativePreChecker : public PreChecker {
public:
    std::vector<Diagnostic> Check(const SandboxJob& job) override {
        auto strategy = MakeStrategy(job.language);
        if (!strategy) return {Diagnostic{0, 0, "unsupported language"}};
        return strategy->Scan(job.code, job.entry_point);
    }
};

inline RawOutcome SuccessOutcome(double value) {
    RawOutcome outcome;
    outcome.status = RawStatus::kSuccess;
    google::protobuf::Value result;
    result.set_number_value(value);
    outcome.value = result;
    outcome.stdout_data = "hello\n";
    return outcome;
}

inline EnvLookup MapEnv(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

inline Settings ProductionSettings() {
    return LoadSettings(MapEnv({{"AIEXEC_SECRET_KEY", kTestSecret}}));
}

inline Settings DevelopmentSettings(AuthMode mode) {
    return LoadSettings(MapEnv({
        {"AIEXEC_PROFILE", "development"},
        {"AIEXEC_SECRET_KEY", kTestSecret},
        {"AIEXEC_AUTH_MODE", ToString(mode)},
    }));
}

} // namespace aiexec::test
