#include "src/server/audit.h"
#include "src/server/logger.h"
#include "src/server/token.h"

#include <sstream>

namespace aiexec {

const char* ToString(AuditSeverity severity) {
    switch (severity) {
        case AuditSeverity::kInfo: return "info";
        case AuditSeverity::kWarning: return "warning";
        case AuditSeverity::kCritical: return "critical";
    }
    return "info";
}

void LoggingAuditSink::Record(const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream line;
    line << "[AUDIT #" << ++sequence_ << "] ts=" << entry.timestamp
         << " event=" << entry.event
         << " outcome=" << entry.outcome
         << " severity=" << ToString(entry.severity)
         << " source=" << (entry.source_address.empty() ? "-" : entry.source_address)
         << " principal=" << (entry.principal_id.empty() ? "-" : entry.principal_id);
    if (!entry.detail.empty()) {
        line << " detail=\"" << entry.detail << "\"";
    }

    switch (entry.severity) {
        case AuditSeverity::kInfo: Logger::Info(line.str()); break;
        case AuditSeverity::kWarning: Logger::Warn(line.str()); break;
        case AuditSeverity::kCritical: Logger::Critical(line.str()); break;
    }
}

void RecordAudit(AuditSink& sink, AuditEntry entry) {
    if (entry.timestamp == 0) {
        entry.timestamp = NowSeconds();
    }
    sink.Record(entry);
}

} // namespace aiexec
