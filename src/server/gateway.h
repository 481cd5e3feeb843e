#pragma once

#include "proto/aiexec.pb.h"
#include "src/server/accounts.h"
#include "src/server/config.h"
#include "src/server/credential_verifier.h"
#include "src/server/errors.h"
#include "src/server/executor.h"
#include "src/server/privilege_gate.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace aiexec {

// Credentials and peer information pulled from the transport.
struct CallContext {
    std::string api_key;
    std::string bearer_token;
    std::string peer;
};

// Transport-neutral failure: the gRPC layer maps `code` onto grpc::StatusCode.
struct CallError {
    enum class Code {
        kUnauthenticated,
        kPermissionDenied,
        kFailedPrecondition,
        kInvalidArgument,
        kOutOfRange
    };

    Code code;
    int http_status;
    std::string message;
};

CallError ToCallError(const AuthFailure& failure);
CallError ToCallError(const ValidationFailure& failure);

template <typename Response>
struct Reply {
    Response response;
    std::optional<CallError> error;

    bool ok() const { return !error.has_value(); }
};

// Binds the verifier, the privilege gate, the executor and the account manager into the
// request pipeline. Each call takes one settings snapshot and uses it throughout.
class Gateway {
public:
    Gateway(SettingsHolder& settings, CredentialVerifier& verifier, PrivilegeGate& gate, CodeExecutor& executor,
            AccountManager& accounts)
        : settings_(settings), verifier_(verifier), gate_(gate), executor_(executor), accounts_(accounts) {}

    std::shared_ptr<const Settings> Snapshot() const { return settings_.Snapshot(); }

    // Split so that verification can run on the transport thread and execution on a
    // worker.
    std::variant<Principal, CallError> Authenticate(const CallContext& context, const Settings& settings) const;
    Reply<rpc::ValidateCodeResponse> Execute(const Principal& principal, const CallContext& context,
                                             const rpc::ValidateCodeRequest& request, const Settings& settings);

    Reply<rpc::ValidateCodeResponse> ValidateCode(const CallContext& context, const rpc::ValidateCodeRequest& request);

    Reply<rpc::CreateSuperuserResponse> CreateSuperuser(const CallContext& context,
                                                        const rpc::CreateSuperuserRequest& request);
    Reply<rpc::SetSuperuserCliEnabledResponse> SetSuperuserCliEnabled(const CallContext& context,
                                                                      const rpc::SetSuperuserCliEnabledRequest& request);
    Reply<rpc::SetAuthModeResponse> SetAuthMode(const CallContext& context, const rpc::SetAuthModeRequest& request);

    Reply<rpc::SessionResponse> Login(const CallContext& context, const rpc::LoginRequest& request);
    Reply<rpc::SessionResponse> AutoLogin(const CallContext& context, const rpc::AutoLoginRequest& request);
    Reply<rpc::CreateApiKeyResponse> CreateApiKey(const CallContext& context, const rpc::CreateApiKeyRequest& request);

private:
    // Verifies the caller and runs it through the privilege gate for `operation`.
    std::optional<CallError> AuthorizePrivileged(const CallContext& context, PrivilegedOperation operation,
                                                 const Settings& settings) const;

    SettingsHolder& settings_;
    CredentialVerifier& verifier_;
    PrivilegeGate& gate_;
    CodeExecutor& executor_;
    AccountManager& accounts_;
};

} // namespace aiexec
