#include <gtest/gtest.h>

#include "src/server/accounts.h"
#include "src/server/crypto.h"
#include "src/server/identity_store.h"
#include "tests/test_support.h"

#include <algorithm>
#include <chrono>

using namespace aiexec;

class AccountManagerTest : public ::testing::Test {
protected:
    InMemoryIdentityStore store_;
    test::RecordingAuditSink audit_;
    AccountManager accounts_{store_, audit_};
};

TEST_F(AccountManagerTest, CreateSuperuserIssuesPrefixedKeyStoredAsDigest) {
    auto created = accounts_.CreateSuperuser("root", "hunter2hunter2");
    ASSERT_TRUE(std::holds_alternative<IssuedApiKey>(created));
    const IssuedApiKey& issued = std::get<IssuedApiKey>(created);

    EXPECT_EQ(issued.username, "root");
    EXPECT_EQ(issued.api_key.rfind(AccountManager::kApiKeyPrefix, 0), 0u);
    EXPECT_EQ(issued.api_key.size(), 3u + 64u);

    EXPECT_FALSE(store_.LookupApiKey(issued.api_key).has_value());
    auto record = store_.LookupApiKey(Sha256Hex(issued.api_key));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->principal_id, issued.principal_id);
    EXPECT_EQ(record->role, Role::kSuperuser);

    auto account = store_.FindByUsername("root");
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->password_hash.find("hunter2"), std::string::npos);
}

TEST_F(AccountManagerTest, CreateSuperuserValidatesInput) {
    auto bad_name = accounts_.CreateSuperuser("root user", "hunter2hunter2");
    ASSERT_TRUE(std::holds_alternative<ValidationFailure>(bad_name));
    EXPECT_EQ(std::get<ValidationFailure>(bad_name).error, ValidationError::kMalformed);

    auto short_password = accounts_.CreateSuperuser("root", "short");
    ASSERT_TRUE(std::holds_alternative<ValidationFailure>(short_password));

    ASSERT_TRUE(std::holds_alternative<IssuedApiKey>(accounts_.CreateSuperuser("root", "hunter2hunter2")));
    auto duplicate = accounts_.CreateSuperuser("root", "another-password");
    ASSERT_TRUE(std::holds_alternative<ValidationFailure>(duplicate));
    EXPECT_EQ(std::get<ValidationFailure>(duplicate).message, "Username already exists");
}

TEST_F(AccountManagerTest, LoginDoesNotRevealWhetherTheUserExists) {
    Settings settings = test::ProductionSettings();
    ASSERT_TRUE(std::holds_alternative<IssuedApiKey>(accounts_.CreateSuperuser("root", "hunter2hunter2")));

    auto wrong_password = accounts_.Login("root", "wrong-password", settings, "test");
    auto unknown_user = accounts_.Login("nobody", "wrong-password", settings, "test");
    ASSERT_TRUE(std::holds_alternative<AuthFailure>(wrong_password));
    ASSERT_TRUE(std::holds_alternative<AuthFailure>(unknown_user));
    EXPECT_EQ(std::get<AuthFailure>(wrong_password).error, AuthError::kUnauthorized);
    EXPECT_EQ(std::get<AuthFailure>(wrong_password).message, std::get<AuthFailure>(unknown_user).message);

    auto session = accounts_.Login("root", "hunter2hunter2", settings, "test");
    ASSERT_TRUE(std::holds_alternative<SessionToken>(session));
    EXPECT_FALSE(std::get<SessionToken>(session).access_token.empty());
    EXPECT_GT(std::get<SessionToken>(session).expires_at, 0);
    EXPECT_TRUE(audit_.Has("auth.login", "success"));
    EXPECT_TRUE(audit_.Has("auth.login", "unauthorized"));
}

TEST_F(AccountManagerTest, UnknownUserLoginCostsAKeyDerivation) {
    Settings settings = test::ProductionSettings();
    ASSERT_TRUE(std::holds_alternative<IssuedApiKey>(accounts_.CreateSuperuser("root", "hunter2hunter2")));

    auto fastest = [&](const std::string& username) {
        auto best = std::chrono::steady_clock::duration::max();
        for (int i = 0; i < 3; ++i) {
            auto start = std::chrono::steady_clock::now();
            auto outcome = accounts_.Login(username, "wrong-password", settings, "test");
            best = std::min(best, std::chrono::steady_clock::now() - start);
            EXPECT_TRUE(std::holds_alternative<AuthFailure>(outcome));
        }
        return best;
    };

    auto known = fastest("root");
    auto unknown = fastest("nobody");
    EXPECT_GT(unknown * 4, known);
}

TEST_F(AccountManagerTest, AutoLoginIsDisabledWhenAuthIsEnforced) {
    Settings settings = test::ProductionSettings();
    auto session = accounts_.AutoLogin(settings, "test");
    ASSERT_TRUE(std::holds_alternative<AuthFailure>(session));
    EXPECT_EQ(std::get<AuthFailure>(session).error, AuthError::kDisabled);
}

TEST_F(AccountManagerTest, AutoLoginIssuesSessionForBootstrappedSuperuser) {
    Settings settings = test::DevelopmentSettings(AuthMode::kAutoLogin);
    accounts_.BootstrapDefaultSuperuser(settings);
    ASSERT_TRUE(store_.FindByUsername(settings.auth.default_superuser).has_value());

    auto session = accounts_.AutoLogin(settings, "test");
    ASSERT_TRUE(std::holds_alternative<SessionToken>(session));
    EXPECT_TRUE(audit_.Has("auth.auto-login", "success"));
}

TEST_F(AccountManagerTest, BootstrapIsANoOpInProduction) {
    Settings settings = test::ProductionSettings();
    settings.auth.default_superuser_password = "ignored-password";
    accounts_.BootstrapDefaultSuperuser(settings);
    EXPECT_FALSE(store_.FindByUsername(settings.auth.default_superuser).has_value());
}

TEST_F(AccountManagerTest, BootstrapIsIdempotent) {
    Settings settings = test::DevelopmentSettings(AuthMode::kEnforced);
    accounts_.BootstrapDefaultSuperuser(settings);
    auto first = store_.FindByUsername(settings.auth.default_superuser);
    accounts_.BootstrapDefaultSuperuser(settings);
    auto second = store_.FindByUsername(settings.auth.default_superuser);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->id, second->id);
}

TEST_F(AccountManagerTest, CreateApiKeyRequiresVerifiedPrincipal) {
    auto created = accounts_.CreateSuperuser("root", "hunter2hunter2");
    ASSERT_TRUE(std::holds_alternative<IssuedApiKey>(created));

    Principal fabricated;
    fabricated.id = std::get<IssuedApiKey>(created).principal_id;
    fabricated.role = Role::kSuperuser;
    fabricated.provenance = Provenance::kFabricated;
    auto denied = accounts_.CreateApiKey(fabricated);
    ASSERT_TRUE(std::holds_alternative<AuthFailure>(denied));
    EXPECT_EQ(std::get<AuthFailure>(denied).error, AuthError::kForbidden);

    Principal verified = fabricated;
    verified.provenance = Provenance::kVerified;
    auto issued = accounts_.CreateApiKey(verified);
    ASSERT_TRUE(std::holds_alternative<IssuedApiKey>(issued));
    EXPECT_NE(std::get<IssuedApiKey>(issued).api_key, std::get<IssuedApiKey>(created).api_key);
}
