#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "src/server/accounts.h"
#include "src/server/admission.h"
#include "src/server/audit.h"
#include "src/server/config.h"
#include "src/server/credential_verifier.h"
#include "src/server/executor.h"
#include "src/server/gateway.h"
#include "src/server/identity_store.h"
#include "src/server/logger.h"
#include "src/server/privilege_gate.h"
#include "src/server/sandbox.h"
#include "src/server/service.h"

using grpc::Server;
using grpc::ServerBuilder;
using aiexec::Logger;

namespace {

int RunServer(const aiexec::Settings& initial) {
    aiexec::SettingsHolder settings(initial);
    aiexec::InMemoryIdentityStore store;
    // Only the scheme: the rest of the URL may carry credentials.
    std::string scheme = initial.database_url.substr(0, initial.database_url.find(':'));
    Logger::Info("Identity store: in-memory (", scheme, " database at AIEXEC_DATABASE_URL is not opened by this server)");
    aiexec::LoggingAuditSink audit;

    aiexec::AccountManager accounts(store, audit);
    accounts.BootstrapDefaultSuperuser(initial);

    std::string error;
    auto sandbox = aiexec::ProcessSandbox::Create(initial.sandbox, &error);
    if (!sandbox) {
        Logger::Critical("Sandbox runtime unavailable: ", error);
        return 1;
    }
    sandbox->AddSecret(initial.auth.secret_key);
    sandbox->AddSecret(initial.auth.default_superuser_password);

    aiexec::ExecutionSlots slots(initial.sandbox.max_concurrency, initial.sandbox.max_queue);
    aiexec::CredentialVerifier verifier(store, audit);
    aiexec::PrivilegeGate gate(audit);
    aiexec::CodeExecutor executor(*sandbox, *sandbox, slots, audit);
    aiexec::Gateway gateway(settings, verifier, gate, executor, accounts);

    aiexec::CodeExecutorService executor_service(gateway);
    aiexec::AdminService admin_service(gateway);
    aiexec::AuthService auth_service(gateway);

    ServerBuilder builder;
    builder.AddListeningPort(initial.listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&executor_service);
    builder.RegisterService(&admin_service);
    builder.RegisterService(&auth_service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        Logger::Critical("Failed to listen on ", initial.listen_address);
        return 1;
    }
    Logger::Info("Server listening on ", initial.listen_address, " (profile=", aiexec::ToString(initial.profile),
                 ", auth=", aiexec::ToString(initial.auth.mode), ")");
    server->Wait();
    return 0;
}

} // namespace

int main() {
    aiexec::Settings settings;
    try {
        settings = aiexec::LoadSettings(aiexec::ProcessEnvironment());
    } catch (const aiexec::ConfigError& e) {
        std::cerr << "aiexec: invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    Logger::SetLevel(settings.log_level);
    return RunServer(settings);
}
