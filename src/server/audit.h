#pragma once

#include <cstdint>
#include <mutex>
#include <string>

namespace aiexec {

enum class AuditSeverity {
    kInfo,
    kWarning,
    kCritical
};

struct AuditEntry {
    int64_t timestamp = 0;
    std::string event;
    std::string source_address;
    std::string principal_id;
    std::string outcome;
    AuditSeverity severity = AuditSeverity::kInfo;
    std::string detail;
};

// Sink for audit events. Implementations must accept concurrent Record calls.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void Record(const AuditEntry& entry) = 0;
};

// Writes one log line per entry through Logger, at a level matching the severity.
class LoggingAuditSink : public AuditSink {
public:
    void Record(const AuditEntry& entry) override;

private:
    std::mutex mutex_;
    uint64_t sequence_ = 0;
};

const char* ToString(AuditSeverity severity);

// Fills the timestamp and hands the entry to the sink.
void RecordAudit(AuditSink& sink, AuditEntry entry);

} // namespace aiexec
