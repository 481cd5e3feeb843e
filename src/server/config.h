#pragma once

#include "src/server/logger.h"
#include "src/server/process.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace aiexec {

enum class Profile {
    kProduction,
    kDevelopment
};

enum class AuthMode {
    kEnforced,
    kAutoLogin,
    kAutoLoginSkipAuth
};

// How hard the runtime insists on kernel isolation features.
enum class IsolationRequirement {
    kRequired,
    kPreferred,
    kDisabled
};

struct AuthSettings {
    AuthMode mode = AuthMode::kEnforced;
    bool superuser_cli_enabled = true;
    std::string default_superuser = "aiexec";
    std::string default_superuser_password;
    std::string secret_key;
    int64_t session_ttl_seconds = 3600;
    int64_t elevated_max_age_seconds = 900;
};

struct SandboxSettings {
    ResourceLimits default_limits;
    ResourceLimits max_limits;
    ResourceLimits build_limits;
    ResourceLimits precheck_limits;

    size_t max_source_bytes = 256 * 1024;
    size_t max_args_bytes = 64 * 1024;
    size_t output_cap_bytes = 64 * 1024;
    size_t result_cap_bytes = 1024 * 1024;

    int max_concurrency = 4;
    int max_queue = 16;
    int64_t queue_wait_ms = 2000;

    std::string scratch_root = "/tmp/aiexec";
    std::string python_interpreter = "python3";
    std::string cxx_compiler = "g++";

    IsolationRequirement namespaces = IsolationRequirement::kPreferred;
    // Production insists on Landlock; development defaults to kPreferred.
    IsolationRequirement landlock = IsolationRequirement::kRequired;
    bool network_allowed = false;
};

struct Settings {
    Profile profile = Profile::kProduction;
    std::string listen_address = "0.0.0.0:50051";
    std::string database_url = "sqlite:///./aiexec.db";
    LogLevel log_level = LogLevel::INFO;
    AuthSettings auth;
    SandboxSettings sandbox;

    bool IsDevelopment() const { return profile == Profile::kDevelopment; }
    bool AutoLoginEnabled() const { return auth.mode != AuthMode::kEnforced; }
};

// Returns the variable's value, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

EnvLookup ProcessEnvironment();

// Parses AIEXEC_* variables and validates the result. Throws ConfigError.
Settings LoadSettings(const EnvLookup& env);

// Profile rules: production never admits auto-login and requires a strong secret and
// Landlock filesystem confinement.
void ValidateSettings(const Settings& settings);

const char* ToString(Profile profile);
const char* ToString(AuthMode mode);
std::optional<AuthMode> ParseAuthMode(const std::string& text);

// Holds the current configuration as immutable snapshots. Requests take a snapshot once
// and use it for their whole lifetime; updates publish a new snapshot.
class SettingsHolder {
public:
    explicit SettingsHolder(Settings settings);

    std::shared_ptr<const Settings> Snapshot() const;

    // Validates before publishing; throws ConfigError and keeps the old snapshot on failure.
    std::shared_ptr<const Settings> Update(const std::function<void(Settings&)>& mutate);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Settings> current_;
};

} // namespace aiexec
