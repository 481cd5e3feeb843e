#include "src/server/config.h"
#include "src/server/crypto.h"
#include "src/server/errors.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace aiexec {

namespace {

constexpr size_t kMinSecretBytes = 32;
constexpr const char* kDevelopmentSuperuserPassword = "aiexec-dev";

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<bool> ParseBool(const std::string& text) {
    std::string value = Lower(text);
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return std::nullopt;
}

class Reader {
public:
    explicit Reader(const EnvLookup& env) : env_(env) {}

    std::optional<std::string> String(const std::string& name) const {
        auto value = env_(name);
        if (!value || value->empty()) return std::nullopt;
        return value;
    }

    void Read(const std::string& name, std::string& out) const {
        if (auto value = String(name)) out = *value;
    }

    void Read(const std::string& name, bool& out) const {
        auto value = String(name);
        if (!value) return;
        auto parsed = ParseBool(*value);
        if (!parsed) throw ConfigError(name + " must be a boolean, got '" + *value + "'");
        out = *parsed;
    }

    template <typename T>
    void ReadNumber(const std::string& name, T& out) const {
        auto value = String(name);
        if (!value) return;
        char* end = nullptr;
        errno = 0;
        long long parsed = std::strtoll(value->c_str(), &end, 10);
        if (errno || !end || *end != '\0' || parsed < 0) {
            throw ConfigError(name + " must be a non-negative integer, got '" + *value + "'");
        }
        if (static_cast<unsigned long long>(parsed) >
            static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            throw ConfigError(name + " is out of range, got '" + *value + "'");
        }
        out = static_cast<T>(parsed);
    }

    void Read(const std::string& name, IsolationRequirement& out) const {
        auto value = String(name);
        if (!value) return;
        std::string text = Lower(*value);
        if (text == "required") out = IsolationRequirement::kRequired;
        else if (text == "preferred") out = IsolationRequirement::kPreferred;
        else if (text == "disabled") out = IsolationRequirement::kDisabled;
        else throw ConfigError(name + " must be one of required, preferred, disabled");
    }

private:
    const EnvLookup& env_;
};

void CheckLimits(const char* what, const ResourceLimits& limits) {
    if (limits.cpu_time_ms <= 0 || limits.wall_time_ms <= 0 || limits.memory_bytes == 0 ||
        limits.max_processes == 0 || limits.open_files == 0) {
        throw ConfigError(std::string(what) + " limits must be positive");
    }
}

LogLevel ParseLogLevel(const std::string& text) {
    std::string value = Lower(text);
    if (value == "debug") return LogLevel::DEBUG;
    if (value == "info") return LogLevel::INFO;
    if (value == "warning" || value == "warn") return LogLevel::WARNING;
    if (value == "error") return LogLevel::ERROR;
    if (value == "critical") return LogLevel::CRITICAL;
    throw ConfigError("AIEXEC_LOG_LEVEL must be one of debug, info, warning, error, critical");
}

SandboxSettings DefaultSandboxSettings() {
    SandboxSettings sandbox;

    sandbox.max_limits.cpu_time_ms = 10000;
    sandbox.max_limits.wall_time_ms = 30000;
    sandbox.max_limits.memory_bytes = 1024ull * 1024 * 1024;
    sandbox.max_limits.file_size_bytes = 64ull * 1024 * 1024;
    sandbox.max_limits.max_processes = 64;
    sandbox.max_limits.open_files = 128;

    sandbox.build_limits.cpu_time_ms = 30000;
    sandbox.build_limits.wall_time_ms = 60000;
    sandbox.build_limits.memory_bytes = 2048ull * 1024 * 1024;
    sandbox.build_limits.file_size_bytes = 256ull * 1024 * 1024;
    sandbox.build_limits.max_processes = 64;
    sandbox.build_limits.open_files = 256;

    sandbox.precheck_limits.cpu_time_ms = 5000;
    sandbox.precheck_limits.wall_time_ms = 10000;
    sandbox.precheck_limits.memory_bytes = 1024ull * 1024 * 1024;
    sandbox.precheck_limits.file_size_bytes = 1024 * 1024;
    sandbox.precheck_limits.max_processes = 64;
    sandbox.precheck_limits.open_files = 64;

    return sandbox;
}

} // namespace

const char* ToString(Profile profile) {
    return profile == Profile::kDevelopment ? "development" : "production";
}

const char* ToString(AuthMode mode) {
    switch (mode) {
        case AuthMode::kEnforced: return "enforced";
        case AuthMode::kAutoLogin: return "auto-login";
        case AuthMode::kAutoLoginSkipAuth: return "auto-login-skip-auth";
    }
    return "enforced";
}

std::optional<AuthMode> ParseAuthMode(const std::string& text) {
    std::string value = Lower(text);
    std::replace(value.begin(), value.end(), '_', '-');
    if (value == "enforced") return AuthMode::kEnforced;
    if (value == "auto-login") return AuthMode::kAutoLogin;
    if (value == "auto-login-skip-auth") return AuthMode::kAutoLoginSkipAuth;
    return std::nullopt;
}

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

Settings LoadSettings(const EnvLookup& env) {
    Reader reader(env);
    Settings settings;
    settings.sandbox = DefaultSandboxSettings();

    bool dev = false;
    reader.Read("AIEXEC_DEV", dev);
    if (dev) settings.profile = Profile::kDevelopment;
    if (auto profile = reader.String("AIEXEC_PROFILE")) {
        std::string value = Lower(*profile);
        if (value == "production") settings.profile = Profile::kProduction;
        else if (value == "development") settings.profile = Profile::kDevelopment;
        else throw ConfigError("AIEXEC_PROFILE must be production or development");
    }

    reader.Read("AIEXEC_LISTEN_ADDRESS", settings.listen_address);
    reader.Read("AIEXEC_DATABASE_URL", settings.database_url);
    if (auto level = reader.String("AIEXEC_LOG_LEVEL")) {
        settings.log_level = ParseLogLevel(*level);
    }

    // Auth
    AuthSettings& auth = settings.auth;
    bool auto_login = false;
    bool skip_auth = false;
    reader.Read("AIEXEC_AUTO_LOGIN", auto_login);
    reader.Read("AIEXEC_SKIP_AUTH_AUTO_LOGIN", skip_auth);
    if (skip_auth && !auto_login) {
        throw ConfigError("AIEXEC_SKIP_AUTH_AUTO_LOGIN requires AIEXEC_AUTO_LOGIN");
    }
    auth.mode = skip_auth ? AuthMode::kAutoLoginSkipAuth
              : auto_login ? AuthMode::kAutoLogin
              : AuthMode::kEnforced;
    if (auto mode = reader.String("AIEXEC_AUTH_MODE")) {
        auto parsed = ParseAuthMode(*mode);
        if (!parsed) throw ConfigError("AIEXEC_AUTH_MODE must be enforced, auto-login or auto-login-skip-auth");
        auth.mode = *parsed;
    }

    reader.Read("AIEXEC_ENABLE_SUPERUSER_CLI", auth.superuser_cli_enabled);
    reader.Read("AIEXEC_SUPERUSER", auth.default_superuser);
    reader.Read("AIEXEC_SUPERUSER_PASSWORD", auth.default_superuser_password);
    reader.Read("AIEXEC_SECRET_KEY", auth.secret_key);
    reader.ReadNumber("AIEXEC_SESSION_TTL_SECONDS", auth.session_ttl_seconds);
    reader.ReadNumber("AIEXEC_ELEVATED_MAX_AGE_SECONDS", auth.elevated_max_age_seconds);

    if (settings.IsDevelopment()) {
        if (auth.secret_key.empty()) {
            auth.secret_key = RandomHex(kMinSecretBytes);
            if (auth.secret_key.empty()) throw ConfigError("Failed to generate a development secret key");
            Logger::Warn("AIEXEC_SECRET_KEY is not set; using an ephemeral development key");
        }
        if (auth.default_superuser_password.empty()) {
            auth.default_superuser_password = kDevelopmentSuperuserPassword;
        }
    }

    // Sandbox
    SandboxSettings& sandbox = settings.sandbox;
    if (settings.IsDevelopment()) {
        sandbox.landlock = IsolationRequirement::kPreferred;
    }
    reader.ReadNumber("AIEXEC_MAX_CONCURRENCY", sandbox.max_concurrency);
    reader.ReadNumber("AIEXEC_MAX_QUEUE", sandbox.max_queue);
    reader.ReadNumber("AIEXEC_QUEUE_WAIT_MS", sandbox.queue_wait_ms);
    reader.ReadNumber("AIEXEC_MAX_SOURCE_BYTES", sandbox.max_source_bytes);
    reader.ReadNumber("AIEXEC_MAX_ARGS_BYTES", sandbox.max_args_bytes);
    reader.ReadNumber("AIEXEC_OUTPUT_CAP_BYTES", sandbox.output_cap_bytes);
    reader.ReadNumber("AIEXEC_DEFAULT_WALL_MS", sandbox.default_limits.wall_time_ms);
    reader.ReadNumber("AIEXEC_MAX_WALL_MS", sandbox.max_limits.wall_time_ms);
    reader.ReadNumber("AIEXEC_DEFAULT_CPU_MS", sandbox.default_limits.cpu_time_ms);
    reader.ReadNumber("AIEXEC_MAX_CPU_MS", sandbox.max_limits.cpu_time_ms);
    reader.ReadNumber("AIEXEC_DEFAULT_MEMORY_BYTES", sandbox.default_limits.memory_bytes);
    reader.ReadNumber("AIEXEC_MAX_MEMORY_BYTES", sandbox.max_limits.memory_bytes);
    reader.ReadNumber("AIEXEC_BUILD_WALL_MS", sandbox.build_limits.wall_time_ms);
    reader.ReadNumber("AIEXEC_BUILD_MEMORY_BYTES", sandbox.build_limits.memory_bytes);
    reader.Read("AIEXEC_SCRATCH_ROOT", sandbox.scratch_root);
    reader.Read("AIEXEC_PYTHON", sandbox.python_interpreter);
    reader.Read("AIEXEC_CXX", sandbox.cxx_compiler);
    reader.Read("AIEXEC_SANDBOX_NAMESPACES", sandbox.namespaces);
    reader.Read("AIEXEC_SANDBOX_LANDLOCK", sandbox.landlock);
    reader.Read("AIEXEC_SANDBOX_NETWORK", sandbox.network_allowed);

    ValidateSettings(settings);
    return settings;
}

void ValidateSettings(const Settings& settings) {
    const AuthSettings& auth = settings.auth;
    const SandboxSettings& sandbox = settings.sandbox;

    if (settings.profile == Profile::kProduction) {
        if (auth.mode != AuthMode::kEnforced) {
            throw ConfigError(std::string("Auth mode '") + ToString(auth.mode) +
                              "' is not allowed in the production profile");
        }
        if (auth.secret_key.size() < kMinSecretBytes) {
            throw ConfigError("AIEXEC_SECRET_KEY must be at least 32 bytes in the production profile");
        }
        // Without Landlock a submission can read host files and other executions' scratch.
        if (sandbox.landlock != IsolationRequirement::kRequired) {
            throw ConfigError("AIEXEC_SANDBOX_LANDLOCK must be 'required' in the production profile");
        }
    }
    if (auth.secret_key.empty()) {
        throw ConfigError("AIEXEC_SECRET_KEY must be set");
    }
    if (auth.session_ttl_seconds <= 0 || auth.elevated_max_age_seconds <= 0) {
        throw ConfigError("Session TTL and elevated max age must be positive");
    }
    if (auth.mode != AuthMode::kEnforced && auth.default_superuser.empty()) {
        throw ConfigError("Auto-login requires AIEXEC_SUPERUSER");
    }

    CheckLimits("Default", sandbox.default_limits);
    CheckLimits("Maximum", sandbox.max_limits);
    CheckLimits("Build", sandbox.build_limits);
    CheckLimits("Pre-check", sandbox.precheck_limits);

    const ResourceLimits& def = sandbox.default_limits;
    const ResourceLimits& max = sandbox.max_limits;
    if (def.cpu_time_ms > max.cpu_time_ms || def.wall_time_ms > max.wall_time_ms ||
        def.memory_bytes > max.memory_bytes || def.file_size_bytes > max.file_size_bytes ||
        def.max_processes > max.max_processes || def.open_files > max.open_files) {
        throw ConfigError("Default sandbox limits exceed the configured maximum");
    }

    if (sandbox.max_concurrency < 1) {
        throw ConfigError("AIEXEC_MAX_CONCURRENCY must be at least 1");
    }
    if (sandbox.max_queue < 0 || sandbox.queue_wait_ms < 0) {
        throw ConfigError("Queue settings must not be negative");
    }
    if (sandbox.max_source_bytes == 0 || sandbox.output_cap_bytes == 0 || sandbox.max_args_bytes == 0) {
        throw ConfigError("Size caps must be positive");
    }
    if (sandbox.scratch_root.empty() || sandbox.scratch_root[0] != '/') {
        throw ConfigError("AIEXEC_SCRATCH_ROOT must be an absolute path");
    }
}

SettingsHolder::SettingsHolder(Settings settings)
    : current_(std::make_shared<const Settings>(std::move(settings))) {}

std::shared_ptr<const Settings> SettingsHolder::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::shared_ptr<const Settings> SettingsHolder::Update(const std::function<void(Settings&)>& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    Settings next = *current_;
    mutate(next);
    ValidateSettings(next);
    current_ = std::make_shared<const Settings>(std::move(next));
    return current_;
}

} // namespace aiexec
