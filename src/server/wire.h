#pragma once

#include "proto/aiexec.pb.h"
#include "src/server/executor.h"

namespace aiexec {

CodeSubmission FromProto(const rpc::ValidateCodeRequest& request);

rpc::ExecutionStatus ToProto(ExecutionStatus status);
rpc::ValidateCodeResponse ToProto(const ExecutionResult& result);

// 200 for every execution outcome except backpressure, which is 429.
int HttpStatus(ExecutionStatus status);

} // namespace aiexec
