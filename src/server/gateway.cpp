#include "src/server/gateway.h"
#include "src/server/logger.h"
#include "src/server/wire.h"

namespace aiexec {

namespace {

AuthRequest ToAuthRequest(const CallContext& context) {
    AuthRequest request;
    request.api_key = context.api_key;
    request.bearer_token = context.bearer_token;
    request.source_address = context.peer;
    return request;
}

CallError InvalidArgument(const std::string& message) {
    return CallError{CallError::Code::kInvalidArgument, 400, message};
}

rpc::SessionResponse ToProto(const SessionToken& session) {
    rpc::SessionResponse response;
    response.set_access_token(session.access_token);
    response.set_token_type("bearer");
    response.set_expires_at(session.expires_at);
    response.set_principal_id(session.principal_id);
    return response;
}

} // namespace

CallError ToCallError(const AuthFailure& failure) {
    switch (failure.error) {
        case AuthError::kUnauthorized:
            return CallError{CallError::Code::kUnauthenticated, 401, failure.message};
        case AuthError::kForbidden:
            return CallError{CallError::Code::kPermissionDenied, 403, failure.message};
        case AuthError::kDisabled:
            return CallError{CallError::Code::kFailedPrecondition, 403, failure.message};
    }
    return CallError{CallError::Code::kUnauthenticated, 401, failure.message};
}

CallError ToCallError(const ValidationFailure& failure) {
    if (failure.error == ValidationError::kLimitExceeded) {
        return CallError{CallError::Code::kOutOfRange, 413, failure.message};
    }
    return InvalidArgument(failure.message);
}

std::variant<Principal, CallError> Gateway::Authenticate(const CallContext& context, const Settings& settings) const {
    auto verified = verifier_.Verify(ToAuthRequest(context), settings);
    if (auto* failure = std::get_if<AuthFailure>(&verified)) {
        return ToCallError(*failure);
    }
    return std::get<Principal>(std::move(verified));
}

Reply<rpc::ValidateCodeResponse> Gateway::Execute(const Principal& principal, const CallContext& context,
                                                  const rpc::ValidateCodeRequest& request, const Settings& settings) {
    Reply<rpc::ValidateCodeResponse> reply;
    CodeSubmission submission = FromProto(request);
    submission.source_address = context.peer;

    auto outcome = executor_.ValidateAndRun(principal, submission, settings);
    if (auto* failure = std::get_if<ValidationFailure>(&outcome)) {
        reply.error = ToCallError(*failure);
        return reply;
    }
    reply.response = ToProto(std::get<ExecutionResult>(outcome));
    return reply;
}

Reply<rpc::ValidateCodeResponse> Gateway::ValidateCode(const CallContext& context,
                                                       const rpc::ValidateCodeRequest& request) {
    auto settings = settings_.Snapshot();
    auto authenticated = Authenticate(context, *settings);
    if (auto* error = std::get_if<CallError>(&authenticated)) {
        return Reply<rpc::ValidateCodeResponse>{{}, *error};
    }
    return Execute(std::get<Principal>(authenticated), context, request, *settings);
}

std::optional<CallError> Gateway::AuthorizePrivileged(const CallContext& context, PrivilegedOperation operation,
                                                      const Settings& settings) const {
    if (auto disabled = gate_.CheckEnabled(operation, settings, context.peer)) {
        return ToCallError(*disabled);
    }
    auto authenticated = Authenticate(context, settings);
    if (auto* error = std::get_if<CallError>(&authenticated)) {
        return *error;
    }
    if (auto denied = gate_.Authorize(std::get<Principal>(authenticated), operation, settings, context.peer)) {
        return ToCallError(*denied);
    }
    return std::nullopt;
}

Reply<rpc::CreateSuperuserResponse> Gateway::CreateSuperuser(const CallContext& context,
                                                             const rpc::CreateSuperuserRequest& request) {
    Reply<rpc::CreateSuperuserResponse> reply;
    auto settings = settings_.Snapshot();
    if (auto error = AuthorizePrivileged(context, PrivilegedOperation::kCreateSuperuser, *settings)) {
        reply.error = std::move(error);
        return reply;
    }

    auto created = accounts_.CreateSuperuser(request.username(), request.password());
    if (auto* failure = std::get_if<ValidationFailure>(&created)) {
        reply.error = ToCallError(*failure);
        return reply;
    }
    const IssuedApiKey& issued = std::get<IssuedApiKey>(created);
    reply.response.set_principal_id(issued.principal_id);
    reply.response.set_username(issued.username);
    reply.response.set_api_key(issued.api_key);
    return reply;
}

Reply<rpc::SetSuperuserCliEnabledResponse> Gateway::SetSuperuserCliEnabled(
    const CallContext& context, const rpc::SetSuperuserCliEnabledRequest& request) {
    Reply<rpc::SetSuperuserCliEnabledResponse> reply;
    auto settings = settings_.Snapshot();
    if (auto error = AuthorizePrivileged(context, PrivilegedOperation::kToggleSuperuserCli, *settings)) {
        reply.error = std::move(error);
        return reply;
    }

    bool enabled = request.enabled();
    auto updated = settings_.Update([enabled](Settings& next) { next.auth.superuser_cli_enabled = enabled; });
    Logger::Info("Superuser creation ", enabled ? "enabled" : "disabled", " by request from ", context.peer);
    reply.response.set_enabled(updated->auth.superuser_cli_enabled);
    return reply;
}

Reply<rpc::SetAuthModeResponse> Gateway::SetAuthMode(const CallContext& context,
                                                     const rpc::SetAuthModeRequest& request) {
    Reply<rpc::SetAuthModeResponse> reply;
    auto settings = settings_.Snapshot();
    if (auto error = AuthorizePrivileged(context, PrivilegedOperation::kChangeAuthMode, *settings)) {
        reply.error = std::move(error);
        return reply;
    }

    auto mode = ParseAuthMode(request.mode());
    if (!mode) {
        reply.error = InvalidArgument("Unknown auth mode '" + request.mode() + "'");
        return reply;
    }

    try {
        AuthMode next_mode = *mode;
        auto updated = settings_.Update([next_mode](Settings& next) { next.auth.mode = next_mode; });
        Logger::Warn("Auth mode changed to ", ToString(updated->auth.mode), " by request from ", context.peer);
        reply.response.set_mode(ToString(updated->auth.mode));
    } catch (const ConfigError& e) {
        reply.error = InvalidArgument(e.what());
    }
    return reply;
}

Reply<rpc::SessionResponse> Gateway::Login(const CallContext& context, const rpc::LoginRequest& request) {
    Reply<rpc::SessionResponse> reply;
    auto settings = settings_.Snapshot();
    auto session = accounts_.Login(request.username(), request.password(), *settings, context.peer);
    if (auto* failure = std::get_if<AuthFailure>(&session)) {
        reply.error = ToCallError(*failure);
        return reply;
    }
    reply.response = ToProto(std::get<SessionToken>(session));
    return reply;
}

Reply<rpc::SessionResponse> Gateway::AutoLogin(const CallContext& context, const rpc::AutoLoginRequest&) {
    Reply<rpc::SessionResponse> reply;
    auto settings = settings_.Snapshot();
    auto session = accounts_.AutoLogin(*settings, context.peer);
    if (auto* failure = std::get_if<AuthFailure>(&session)) {
        reply.error = ToCallError(*failure);
        return reply;
    }
    reply.response = ToProto(std::get<SessionToken>(session));
    return reply;
}

Reply<rpc::CreateApiKeyResponse> Gateway::CreateApiKey(const CallContext& context,
                                                       const rpc::CreateApiKeyRequest&) {
    Reply<rpc::CreateApiKeyResponse> reply;
    auto settings = settings_.Snapshot();
    auto authenticated = Authenticate(context, *settings);
    if (auto* error = std::get_if<CallError>(&authenticated)) {
        reply.error = *error;
        return reply;
    }

    auto issued = accounts_.CreateApiKey(std::get<Principal>(authenticated));
    if (auto* failure = std::get_if<AuthFailure>(&issued)) {
        reply.error = ToCallError(*failure);
        return reply;
    }
    reply.response.set_principal_id(std::get<IssuedApiKey>(issued).principal_id);
    reply.response.set_api_key(std::get<IssuedApiKey>(issued).api_key);
    return reply;
}

} // namespace aiexec
