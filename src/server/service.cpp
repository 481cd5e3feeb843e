#include "src/server/service.h"
#include "src/server/logger.h"

#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace aiexec {

namespace {

std::string MetadataValue(const grpc::CallbackServerContext* context, const std::string& key) {
    const auto& metadata = context->client_metadata();
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return "";
    }
    return std::string(it->second.data(), it->second.size());
}

// Finishes a unary call synchronously with whatever the gateway produced.
template <typename Response>
grpc::ServerUnaryReactor* Respond(grpc::CallbackServerContext* context, Reply<Response> reply, Response* response) {
    grpc::ServerUnaryReactor* reactor = context->DefaultReactor();
    if (reply.error) {
        reactor->Finish(ToStatus(*reply.error));
    } else {
        *response = std::move(reply.response);
        reactor->Finish(grpc::Status::OK);
    }
    return reactor;
}

class ValidateCodeReactor : public grpc::ServerUnaryReactor {
public:
    ValidateCodeReactor(Gateway& gateway, Principal principal, CallContext call,
                        std::shared_ptr<const Settings> settings, const rpc::ValidateCodeRequest* request,
                        rpc::ValidateCodeResponse* response)
        : gateway_(gateway), principal_(std::move(principal)), call_(std::move(call)),
          settings_(std::move(settings)), request_(request), response_(response) {
        std::lock_guard<std::mutex> lock(start_mutex_);
        worker_thread_ = std::thread([this]() {
            {
                // worker_thread_ must be assigned before OnDone can look at it.
                std::lock_guard<std::mutex> started(start_mutex_);
            }
            Logger::Info("Starting execution for language: ", request_->language());
            auto reply = gateway_.Execute(principal_, call_, *request_, *settings_);
            if (reply.error) {
                Logger::Warn("Submission rejected: ", reply.error->message);
                Finish(ToStatus(*reply.error));
                return;
            }
            *response_ = std::move(reply.response);
            Finish(grpc::Status::OK);
        });
    }

    void OnDone() override {
        if (worker_thread_.get_id() == std::this_thread::get_id()) {
            worker_thread_.detach();
        } else if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
        delete this;
    }

    void OnCancel() override {
        Logger::Warn("ValidateCode cancelled by client ", call_.peer, "; the sandbox runs to its own limits");
    }

private:
    Gateway& gateway_;
    Principal principal_;
    CallContext call_;
    std::shared_ptr<const Settings> settings_;
    const rpc::ValidateCodeRequest* request_;
    rpc::ValidateCodeResponse* response_;
    std::mutex start_mutex_;
    std::thread worker_thread_;
};

} // namespace

grpc::Status ToStatus(const CallError& error) {
    switch (error.code) {
        case CallError::Code::kUnauthenticated:
            return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, error.message);
        case CallError::Code::kPermissionDenied:
            return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, error.message);
        case CallError::Code::kFailedPrecondition:
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, error.message);
        case CallError::Code::kInvalidArgument:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error.message);
        case CallError::Code::kOutOfRange:
            return grpc::Status(grpc::StatusCode::OUT_OF_RANGE, error.message);
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, error.message);
}

CallContext ExtractCallContext(const grpc::CallbackServerContext* context) {
    CallContext call;
    call.api_key = MetadataValue(context, "x-api-key");
    std::string authorization = MetadataValue(context, "authorization");
    const std::string prefix = "Bearer ";
    if (authorization.compare(0, prefix.size(), prefix) == 0) {
        call.bearer_token = authorization.substr(prefix.size());
    }
    call.peer = context->peer();
    return call;
}

grpc::ServerUnaryReactor* CodeExecutorService::ValidateCode(grpc::CallbackServerContext* context,
                                                            const rpc::ValidateCodeRequest* request,
                                                            rpc::ValidateCodeResponse* response) {
    CallContext call = ExtractCallContext(context);
    Logger::Info("Received ValidateCode request from ", call.peer);

    auto settings = gateway_.Snapshot();
    auto authenticated = gateway_.Authenticate(call, *settings);
    if (auto* error = std::get_if<CallError>(&authenticated)) {
        grpc::ServerUnaryReactor* reactor = context->DefaultReactor();
        reactor->Finish(ToStatus(*error));
        return reactor;
    }
    return new ValidateCodeReactor(gateway_, std::get<Principal>(std::move(authenticated)), std::move(call),
                                   std::move(settings), request, response);
}

grpc::ServerUnaryReactor* AdminService::CreateSuperuser(grpc::CallbackServerContext* context,
                                                        const rpc::CreateSuperuserRequest* request,
                                                        rpc::CreateSuperuserResponse* response) {
    return Respond(context, gateway_.CreateSuperuser(ExtractCallContext(context), *request), response);
}

grpc::ServerUnaryReactor* AdminService::SetSuperuserCliEnabled(grpc::CallbackServerContext* context,
                                                               const rpc::SetSuperuserCliEnabledRequest* request,
                                                               rpc::SetSuperuserCliEnabledResponse* response) {
    return Respond(context, gateway_.SetSuperuserCliEnabled(ExtractCallContext(context), *request), response);
}

grpc::ServerUnaryReactor* AdminService::SetAuthMode(grpc::CallbackServerContext* context,
                                                    const rpc::SetAuthModeRequest* request,
                                                    rpc::SetAuthModeResponse* response) {
    return Respond(context, gateway_.SetAuthMode(ExtractCallContext(context), *request), response);
}

grpc::ServerUnaryReactor* AuthService::Login(grpc::CallbackServerContext* context, const rpc::LoginRequest* request,
                                             rpc::SessionResponse* response) {
    return Respond(context, gateway_.Login(ExtractCallContext(context), *request), response);
}

grpc::ServerUnaryReactor* AuthService::AutoLogin(grpc::CallbackServerContext* context,
                                                 const rpc::AutoLoginRequest* request,
                                                 rpc::SessionResponse* response) {
    return Respond(context, gateway_.AutoLogin(ExtractCallContext(context), *request), response);
}

grpc::ServerUnaryReactor* AuthService::CreateApiKey(grpc::CallbackServerContext* context,
                                                    const rpc::CreateApiKeyRequest* request,
                                                    rpc::CreateApiKeyResponse* response) {
    return Respond(context, gateway_.CreateApiKey(ExtractCallContext(context), *request), response);
}

} // namespace aiexec
