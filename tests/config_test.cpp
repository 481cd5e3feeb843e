#include <gtest/gtest.h>

#include "src/server/config.h"
#include "src/server/errors.h"
#include "tests/test_support.h"

using namespace aiexec;
using aiexec::test::MapEnv;

TEST(ConfigTest, ProductionIsTheDefaultProfile) {
    Settings settings = LoadSettings(MapEnv({{"AIEXEC_SECRET_KEY", aiexec::test::kTestSecret}}));
    EXPECT_EQ(settings.profile, Profile::kProduction);
    EXPECT_EQ(settings.auth.mode, AuthMode::kEnforced);
    EXPECT_TRUE(settings.auth.superuser_cli_enabled);
    EXPECT_FALSE(settings.AutoLoginEnabled());
}

TEST(ConfigTest, ProductionRequiresStrongSecret) {
    EXPECT_THROW(LoadSettings(MapEnv({})), ConfigError);
    EXPECT_THROW(LoadSettings(MapEnv({{"AIEXEC_SECRET_KEY", "short"}})), ConfigError);
}

TEST(ConfigTest, ProductionRejectsAutoLogin) {
    EXPECT_THROW(LoadSettings(MapEnv({
                     {"AIEXEC_SECRET_KEY", aiexec::test::kTestSecret},
                     {"AIEXEC_AUTO_LOGIN", "true"},
                 })),
                 ConfigError);
    EXPECT_THROW(LoadSettings(MapEnv({
                     {"AIEXEC_SECRET_KEY", aiexec::test::kTestSecret},
                     {"AIEXEC_AUTH_MODE", "auto-login-skip-auth"},
                 })),
                 ConfigError);
}

TEST(ConfigTest, DevelopmentFillsInSecretAndSuperuserPassword) {
    Settings settings = LoadSettings(MapEnv({{"AIEXEC_DEV", "1"}}));
    EXPECT_EQ(settings.profile, Profile::kDevelopment);
    EXPECT_EQ(settings.auth.secret_key.size(), 64u);
    EXPECT_EQ(settings.auth.default_superuser, "aiexec");
    EXPECT_EQ(settings.auth.default_superuser_password, "aiexec-dev");
}

TEST(ConfigTest, SkipAuthWithoutAutoLoginIsRejected) {
    EXPECT_THROW(LoadSettings(MapEnv({
                     {"AIEXEC_DEV", "true"},
                     {"AIEXEC_SKIP_AUTH_AUTO_LOGIN", "true"},
                 })),
                 ConfigError);
}

TEST(ConfigTest, LegacyFlagsSelectAuthMode) {
    Settings auto_login = LoadSettings(MapEnv({{"AIEXEC_DEV", "true"}, {"AIEXEC_AUTO_LOGIN", "true"}}));
    EXPECT_EQ(auto_login.auth.mode, AuthMode::kAutoLogin);

    Settings skip = LoadSettings(MapEnv({
        {"AIEXEC_DEV", "true"},
        {"AIEXEC_AUTO_LOGIN", "true"},
        {"AIEXEC_SKIP_AUTH_AUTO_LOGIN", "true"},
    }));
    EXPECT_EQ(skip.auth.mode, AuthMode::kAutoLoginSkipAuth);
}

TEST(ConfigTest, AuthModeVariableOverridesLegacyFlags) {
    Settings settings = LoadSettings(MapEnv({
        {"AIEXEC_DEV", "true"},
        {"AIEXEC_AUTO_LOGIN", "true"},
        {"AIEXEC_AUTH_MODE", "enforced"},
    }));
    EXPECT_EQ(settings.auth.mode, AuthMode::kEnforced);

    EXPECT_THROW(LoadSettings(MapEnv({{"AIEXEC_DEV", "true"}, {"AIEXEC_AUTH_MODE", "open"}})), ConfigError);
}

TEST(ConfigTest, ParsesAuthModeSpellings) {
    EXPECT_EQ(ParseAuthMode("AUTO_LOGIN"), AuthMode::kAutoLogin);
    EXPECT_EQ(ParseAuthMode("auto-login-skip-auth"), AuthMode::kAutoLoginSkipAuth);
    EXPECT_FALSE(ParseAuthMode("").has_value());
}

TEST(ConfigTest, RejectsMalformedNumbersAndBooleans) {
    std::map<std::string, std::string> base = {{"AIEXEC_SECRET_KEY", aiexec::test::kTestSecret}};

    auto with = [&](const std::string& name, const std::string& value) {
        auto env = base;
        env[name] = value;
        return MapEnv(env);
    };
    EXPECT_THROW(LoadSettings(with("AIEXEC_MAX_CONCURRENCY", "four")), ConfigError);
    EXPECT_THROW(LoadSettings(with("AIEXEC_MAX_CONCURRENCY", "0")), ConfigError);
    EXPECT_THROW(LoadSettings(with("AIEXEC_MAX_WALL_MS", "-5")), ConfigError);
    EXPECT_THROW(LoadSettings(with("AIEXEC_SANDBOX_NETWORK", "maybe")), ConfigError);
    EXPECT_THROW(LoadSettings(with("AIEXEC_SANDBOX_LANDLOCK", "sometimes")), ConfigError);
    EXPECT_THROW(LoadSettings(with("AIEXEC_SCRATCH_ROOT", "relative/dir")), ConfigError);
    EXPECT_THROW(LoadSettings(with("AIEXEC_LOG_LEVEL", "loud")), ConfigError);
}

TEST(ConfigTest, RejectsNumbersThatDoNotFitTheirSetting) {
    std::map<std::string, std::string> base = {{"AIEXEC_SECRET_KEY", aiexec::test::kTestSecret}};

    auto with = [&](const std::string& name, const std::string& value) {
        auto env = base;
        env[name] = value;
        return MapEnv(env);
    };
    EXPECT_THROW(LoadSettings(with("AIEXEC_MAX_CONCURRENCY", "4294967297")), ConfigError);
    EXPECT_THROW(LoadSettings(with("AIEXEC_MAX_QUEUE", "2147483648")), ConfigError);
    EXPECT_THROW(LoadSettings(with("AIEXEC_MAX_WALL_MS", "99999999999999999999999")), ConfigError);

    Settings settings = LoadSettings(with("AIEXEC_MAX_QUEUE", "2147483647"));
    EXPECT_EQ(settings.sandbox.max_queue, 2147483647);
}

TEST(ConfigTest, ProductionRequiresFilesystemConfinement) {
    Settings defaults = aiexec::test::ProductionSettings();
    EXPECT_EQ(defaults.sandbox.landlock, IsolationRequirement::kRequired);

    for (const char* weaker : {"preferred", "disabled"}) {
        EXPECT_THROW(LoadSettings(MapEnv({
                         {"AIEXEC_SECRET_KEY", aiexec::test::kTestSecret},
                         {"AIEXEC_SANDBOX_LANDLOCK", weaker},
                     })),
                     ConfigError)
            << weaker;
    }

    SettingsHolder holder(defaults);
    EXPECT_THROW(holder.Update([](Settings& next) { next.sandbox.landlock = IsolationRequirement::kPreferred; }),
                 ConfigError);
    EXPECT_EQ(holder.Snapshot()->sandbox.landlock, IsolationRequirement::kRequired);
}

TEST(ConfigTest, DevelopmentPrefersFilesystemConfinement) {
    Settings settings = LoadSettings(MapEnv({{"AIEXEC_DEV", "true"}}));
    EXPECT_EQ(settings.sandbox.landlock, IsolationRequirement::kPreferred);

    Settings disabled = LoadSettings(MapEnv({{"AIEXEC_DEV", "true"}, {"AIEXEC_SANDBOX_LANDLOCK", "disabled"}}));
    EXPECT_EQ(disabled.sandbox.landlock, IsolationRequirement::kDisabled);
}

TEST(ConfigTest, DefaultsMayNotExceedMaxima) {
    EXPECT_THROW(LoadSettings(MapEnv({
                     {"AIEXEC_SECRET_KEY", aiexec::test::kTestSecret},
                     {"AIEXEC_DEFAULT_WALL_MS", "60000"},
                     {"AIEXEC_MAX_WALL_MS", "30000"},
                 })),
                 ConfigError);
}

TEST(ConfigTest, ReadsSandboxOverrides) {
    Settings settings = LoadSettings(MapEnv({
        {"AIEXEC_SECRET_KEY", aiexec::test::kTestSecret},
        {"AIEXEC_MAX_CONCURRENCY", "2"},
        {"AIEXEC_MAX_QUEUE", "0"},
        {"AIEXEC_SCRATCH_ROOT", "/var/tmp/aiexec"},
        {"AIEXEC_SANDBOX_NAMESPACES", "required"},
        {"AIEXEC_LOG_LEVEL", "debug"},
    }));
    EXPECT_EQ(settings.sandbox.max_concurrency, 2);
    EXPECT_EQ(settings.sandbox.max_queue, 0);
    EXPECT_EQ(settings.sandbox.scratch_root, "/var/tmp/aiexec");
    EXPECT_EQ(settings.sandbox.namespaces, IsolationRequirement::kRequired);
    EXPECT_EQ(settings.log_level, LogLevel::DEBUG);
}

TEST(SettingsHolderTest, InvalidUpdateKeepsPreviousSnapshot) {
    SettingsHolder holder(aiexec::test::ProductionSettings());
    auto before = holder.Snapshot();

    EXPECT_THROW(holder.Update([](Settings& next) { next.auth.mode = AuthMode::kAutoLogin; }), ConfigError);
    EXPECT_EQ(holder.Snapshot(), before);
    EXPECT_EQ(holder.Snapshot()->auth.mode, AuthMode::kEnforced);
}

TEST(SettingsHolderTest, UpdatePublishesNewSnapshotWithoutTouchingOld) {
    SettingsHolder holder(aiexec::test::ProductionSettings());
    auto before = holder.Snapshot();

    auto after = holder.Update([](Settings& next) { next.auth.superuser_cli_enabled = false; });
    EXPECT_FALSE(after->auth.superuser_cli_enabled);
    EXPECT_FALSE(holder.Snapshot()->auth.superuser_cli_enabled);
    EXPECT_TRUE(before->auth.superuser_cli_enabled);
}
