#pragma once

#include "proto/aiexec.grpc.pb.h"
#include "src/server/gateway.h"

#include <grpcpp/grpcpp.h>

namespace aiexec {

grpc::Status ToStatus(const CallError& error);

// Pulls "x-api-key", "authorization: Bearer ..." and the peer address out of a call.
CallContext ExtractCallContext(const grpc::CallbackServerContext* context);

// ValidateCode verifies the caller on the RPC thread and moves execution onto a worker.
class CodeExecutorService final : public rpc::CodeExecutor::CallbackService {
public:
    explicit CodeExecutorService(Gateway& gateway) : gateway_(gateway) {}

    grpc::ServerUnaryReactor* ValidateCode(grpc::CallbackServerContext* context,
                                           const rpc::ValidateCodeRequest* request,
                                           rpc::ValidateCodeResponse* response) override;

private:
    Gateway& gateway_;
};

class AdminService final : public rpc::Admin::CallbackService {
public:
    explicit AdminService(Gateway& gateway) : gateway_(gateway) {}

    grpc::ServerUnaryReactor* CreateSuperuser(grpc::CallbackServerContext* context,
                                              const rpc::CreateSuperuserRequest* request,
                                              rpc::CreateSuperuserResponse* response) override;
    grpc::ServerUnaryReactor* SetSuperuserCliEnabled(grpc::CallbackServerContext* context,
                                                     const rpc::SetSuperuserCliEnabledRequest* request,
                                                     rpc::SetSuperuserCliEnabledResponse* response) override;
    grpc::ServerUnaryReactor* SetAuthMode(grpc::CallbackServerContext* context,
                                          const rpc::SetAuthModeRequest* request,
                                          rpc::SetAuthModeResponse* response) override;

private:
    Gateway& gateway_;
};

class AuthService final : public rpc::Auth::CallbackService {
public:
    explicit AuthService(Gateway& gateway) : gateway_(gateway) {}

    grpc::ServerUnaryReactor* Login(grpc::CallbackServerContext* context, const rpc::LoginRequest* request,
                                    rpc::SessionResponse* response) override;
    grpc::ServerUnaryReactor* AutoLogin(grpc::CallbackServerContext* context, const rpc::AutoLoginRequest* request,
                                        rpc::SessionResponse* response) override;
    grpc::ServerUnaryReactor* CreateApiKey(grpc::CallbackServerContext* context,
                                           const rpc::CreateApiKeyRequest* request,
                                           rpc::CreateApiKeyResponse* response) override;

private:
    Gateway& gateway_;
};

} // namespace aiexec
