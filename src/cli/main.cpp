#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>
#include "proto/aiexec.grpc.pb.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void PrintUsage(std::ostream& out) {
    out << "aiexec-cli: client for the aiexec execution server\n\n";
    out << "usage:\n";
    out << "  aiexec-cli [--server <host:port>] [--api-key <key>] [--token <session>] <command> ...\n\n";
    out << "commands:\n";
    out << "  validate --language <python|cpp> [--entry <name>] [--args <json list>] [--kwargs <json object>]\n";
    out << "           [--cpu-ms <n>] [--wall-ms <n>] [--memory-bytes <n>] [--network] <file|->\n";
    out << "  login <username> [--password <password>]\n";
    out << "  auto-login\n";
    out << "  create-api-key\n";
    out << "  create-superuser <username> [--password <password>]\n";
    out << "  set-superuser-cli <on|off>\n";
    out << "  set-auth-mode <enforced|auto-login|auto-login-skip-auth>\n\n";
    out << "AIEXEC_SERVER, AIEXEC_API_KEY, AIEXEC_TOKEN and AIEXEC_PASSWORD fill in unset options.\n";
}

bool IsHelpFlag(const std::string& arg) {
    return arg == "--help" || arg == "-h" || arg == "help";
}

std::string EnvOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

struct Connection {
    std::string server = "localhost:50051";
    std::string api_key;
    std::string token;
};

void Authenticate(const Connection& connection, grpc::ClientContext* context) {
    if (!connection.api_key.empty()) {
        context->AddMetadata("x-api-key", connection.api_key);
    }
    if (!connection.token.empty()) {
        context->AddMetadata("authorization", "Bearer " + connection.token);
    }
}

int PrintResult(const grpc::Status& status, const google::protobuf::Message& response) {
    if (!status.ok()) {
        std::cerr << "error: " << status.error_code() << ": " << status.error_message() << "\n";
        return kExitError;
    }
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;
    if (!google::protobuf::util::MessageToJsonString(response, &json, options).ok()) {
        std::cerr << "error: could not render the response\n";
        return kExitError;
    }
    std::cout << json;
    return kExitOk;
}

std::optional<std::string> ReadSource(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<int64_t> ParseCount(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (*end != '\0' || value < 0) return std::nullopt;
    return static_cast<int64_t>(value);
}

int CmdValidate(const Connection& connection, const std::vector<std::string>& args) {
    aiexec::rpc::ValidateCodeRequest request;
    std::optional<std::string> path;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();
        if (arg == "--network") {
            request.set_network(true);
            continue;
        }
        if (arg.rfind("--", 0) == 0 && !has_value) {
            std::cerr << "error: " << arg << " expects a value\n";
            return kExitUsage;
        }
        if (arg == "--language") {
            request.set_language(args[++i]);
        } else if (arg == "--entry") {
            request.set_entry_point(args[++i]);
        } else if (arg == "--args") {
            if (!google::protobuf::util::JsonStringToMessage(args[++i], request.mutable_args()).ok()) {
                std::cerr << "error: --args must be a JSON list\n";
                return kExitUsage;
            }
        } else if (arg == "--kwargs") {
            if (!google::protobuf::util::JsonStringToMessage(args[++i], request.mutable_kwargs()).ok()) {
                std::cerr << "error: --kwargs must be a JSON object\n";
                return kExitUsage;
            }
        } else if (arg == "--cpu-ms" || arg == "--wall-ms" || arg == "--memory-bytes") {
            auto value = ParseCount(args[++i]);
            if (!value) {
                std::cerr << "error: " << arg << " expects a non-negative integer\n";
                return kExitUsage;
            }
            auto* limits = request.mutable_limits();
            if (arg == "--cpu-ms") limits->set_cpu_time_ms(*value);
            if (arg == "--wall-ms") limits->set_wall_time_ms(*value);
            if (arg == "--memory-bytes") limits->set_memory_bytes(*value);
        } else if (!path && (arg == "-" || arg.rfind("--", 0) != 0)) {
            path = arg;
        } else {
            std::cerr << "error: unexpected argument: " << arg << "\n\n";
            PrintUsage(std::cerr);
            return kExitUsage;
        }
    }

    if (!path || request.language().empty()) {
        std::cerr << "error: expected aiexec-cli validate --language <lang> <file|->\n\n";
        PrintUsage(std::cerr);
        return kExitUsage;
    }
    auto code = ReadSource(*path);
    if (!code) {
        std::cerr << "error: could not read " << *path << "\n";
        return kExitError;
    }
    request.set_code(*code);

    auto stub = aiexec::rpc::CodeExecutor::NewStub(
        grpc::CreateChannel(connection.server, grpc::InsecureChannelCredentials()));
    grpc::ClientContext context;
    Authenticate(connection, &context);
    aiexec::rpc::ValidateCodeResponse response;
    grpc::Status status = stub->ValidateCode(&context, request, &response);
    return PrintResult(status, response);
}

// Pulls "--password <value>" out of args, falling back to AIEXEC_PASSWORD.
std::string TakePassword(std::vector<std::string>& args) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--password") {
            std::string password = args[i + 1];
            args.erase(args.begin() + i, args.begin() + i + 2);
            return password;
        }
    }
    return EnvOr("AIEXEC_PASSWORD", "");
}

int Run(int argc, char** argv) {
    Connection connection;
    connection.server = EnvOr("AIEXEC_SERVER", connection.server);
    connection.api_key = EnvOr("AIEXEC_API_KEY", "");
    connection.token = EnvOr("AIEXEC_TOKEN", "");

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (IsHelpFlag(arg)) {
            PrintUsage(std::cout);
            return kExitOk;
        }
        if (arg != "--server" && arg != "--api-key" && arg != "--token") {
            break;
        }
        if (i + 1 >= argc) {
            std::cerr << "error: " << arg << " expects a value\n";
            return kExitUsage;
        }
        std::string value = argv[++i];
        if (arg == "--server") connection.server = value;
        if (arg == "--api-key") connection.api_key = value;
        if (arg == "--token") connection.token = value;
    }
    if (i >= argc) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    const std::string cmd = argv[i];
    std::vector<std::string> args(argv + i + 1, argv + argc);

    if (cmd == "validate") {
        return CmdValidate(connection, args);
    }

    auto channel = grpc::CreateChannel(connection.server, grpc::InsecureChannelCredentials());
    grpc::ClientContext context;
    Authenticate(connection, &context);

    if (cmd == "login") {
        std::string password = TakePassword(args);
        if (args.size() != 1) {
            std::cerr << "error: expected aiexec-cli login <username> [--password <password>]\n";
            return kExitUsage;
        }
        aiexec::rpc::LoginRequest request;
        request.set_username(args[0]);
        request.set_password(password);
        aiexec::rpc::SessionResponse response;
        return PrintResult(aiexec::rpc::Auth::NewStub(channel)->Login(&context, request, &response), response);
    }

    if (cmd == "auto-login" || cmd == "create-api-key") {
        if (!args.empty()) {
            std::cerr << "error: " << cmd << " takes no arguments\n";
            return kExitUsage;
        }
        auto stub = aiexec::rpc::Auth::NewStub(channel);
        if (cmd == "auto-login") {
            aiexec::rpc::SessionResponse response;
            return PrintResult(stub->AutoLogin(&context, aiexec::rpc::AutoLoginRequest(), &response), response);
        }
        aiexec::rpc::CreateApiKeyResponse response;
        return PrintResult(stub->CreateApiKey(&context, aiexec::rpc::CreateApiKeyRequest(), &response), response);
    }

    if (cmd == "create-superuser") {
        std::string password = TakePassword(args);
        if (args.size() != 1) {
            std::cerr << "error: expected aiexec-cli create-superuser <username> [--password <password>]\n";
            return kExitUsage;
        }
        aiexec::rpc::CreateSuperuserRequest request;
        request.set_username(args[0]);
        request.set_password(password);
        aiexec::rpc::CreateSuperuserResponse response;
        return PrintResult(aiexec::rpc::Admin::NewStub(channel)->CreateSuperuser(&context, request, &response),
                           response);
    }

    if (cmd == "set-superuser-cli") {
        if (args.size() != 1 || (args[0] != "on" && args[0] != "off")) {
            std::cerr << "error: expected aiexec-cli set-superuser-cli <on|off>\n";
            return kExitUsage;
        }
        aiexec::rpc::SetSuperuserCliEnabledRequest request;
        request.set_enabled(args[0] == "on");
        aiexec::rpc::SetSuperuserCliEnabledResponse response;
        return PrintResult(aiexec::rpc::Admin::NewStub(channel)->SetSuperuserCliEnabled(&context, request, &response),
                           response);
    }

    if (cmd == "set-auth-mode") {
        if (args.size() != 1) {
            std::cerr << "error: expected aiexec-cli set-auth-mode <mode>\n";
            return kExitUsage;
        }
        aiexec::rpc::SetAuthModeRequest request;
        request.set_mode(args[0]);
        aiexec::rpc::SetAuthModeResponse response;
        return PrintResult(aiexec::rpc::Admin::NewStub(channel)->SetAuthMode(&context, request, &response), response);
    }

    std::cerr << "error: unknown command: " << cmd << "\n\n";
    PrintUsage(std::cerr);
    return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
    return Run(argc, argv);
}
