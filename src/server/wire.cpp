#include "src/server/wire.h"

namespace aiexec {

CodeSubmission FromProto(const rpc::ValidateCodeRequest& request) {
    CodeSubmission submission;
    submission.language = request.language();
    submission.code = request.code();
    if (!request.entry_point().empty()) {
        submission.entry_point = request.entry_point();
    }
    submission.args = request.args();
    submission.kwargs = request.kwargs();
    submission.limits.cpu_time_ms = request.limits().cpu_time_ms();
    submission.limits.wall_time_ms = request.limits().wall_time_ms();
    submission.limits.memory_bytes = request.limits().memory_bytes();
    submission.network = request.network();
    return submission;
}

rpc::ExecutionStatus ToProto(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSuccess: return rpc::SUCCESS;
        case ExecutionStatus::kCompileError: return rpc::COMPILE_ERROR;
        case ExecutionStatus::kRuntimeError: return rpc::RUNTIME_ERROR;
        case ExecutionStatus::kTimeout: return rpc::TIMEOUT;
        case ExecutionStatus::kResourceExceeded: return rpc::RESOURCE_EXCEEDED;
        case ExecutionStatus::kRejectedBusy: return rpc::REJECTED_BUSY;
    }
    return rpc::EXECUTION_STATUS_UNSPECIFIED;
}

int HttpStatus(ExecutionStatus status) {
    return status == ExecutionStatus::kRejectedBusy ? 429 : 200;
}

rpc::ValidateCodeResponse ToProto(const ExecutionResult& result) {
    rpc::ValidateCodeResponse response;
    response.set_status_code(HttpStatus(result.status));
    response.set_status(ToProto(result.status));
    if (result.value) {
        *response.mutable_value() = *result.value;
    }
    response.set_stdout_text(result.stdout_data);
    response.set_stderr_text(result.stderr_data);
    response.set_stdout_truncated(result.stdout_truncated);
    response.set_stderr_truncated(result.stderr_truncated);
    response.set_error(result.error);
    for (const Diagnostic& diagnostic : result.diagnostics) {
        rpc::Diagnostic* out = response.add_diagnostics();
        out->set_line(diagnostic.line);
        out->set_column(diagnostic.column);
        out->set_message(diagnostic.message);
    }
    response.set_elapsed_ms(result.elapsed_ms);
    response.mutable_usage()->set_cpu_time_ms(result.cpu_time_ms);
    response.mutable_usage()->set_max_rss_kb(result.max_rss_kb);
    return response;
}

} // namespace aiexec
