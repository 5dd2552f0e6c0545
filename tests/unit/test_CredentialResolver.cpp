#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "auth/CredentialResolver.hpp"
#include "types/errors.hpp"
#include "support/Fakes.hpp"

#include <cstdlib>

using namespace rh;
using namespace rh::auth;
using namespace rh::types;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class CredentialResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<test::MapEnvironment> env = std::make_shared<test::MapEnvironment>();
    config::CredentialsConfig cfg;

    [[nodiscard]] CredentialResolver resolver(std::shared_ptr<TestDataSource> data = nullptr) const {
        return {cfg, env, std::move(data)};
    }

    static std::shared_ptr<NiceMock<test::MockTestData>> testData(const std::optional<std::string>& email,
                                                        const std::optional<std::string>& password,
                                                        const std::optional<std::string>& kind) {
        auto data = std::make_shared<NiceMock<test::MockTestData>>();
        ON_CALL(*data, get(_)).WillByDefault(Return(std::nullopt));
        ON_CALL(*data, get("email")).WillByDefault(Return(email));
        ON_CALL(*data, get("password")).WillByDefault(Return(password));
        ON_CALL(*data, get("sessionType")).WillByDefault(Return(kind));
        return data;
    }
};

TEST_F(CredentialResolverTest, EnvNamesInLookupOrder) {
    EXPECT_EQ(resolver().envNames(SessionKind::SuperAdmin),
              (std::vector<std::string>{"SPEEDYDD_SUPER_ADMIN_EMAIL", "SPEEDYDD_SUPER_ADMIN_PASSWORD",
                                        "SPEEDYDD_DEV_EMAIL", "SPEEDYDD_DEV_PASSWORD"}));
}

TEST_F(CredentialResolverTest, CompleteTestDataWins) {
    env->set("SPEEDYDD_ADMIN_EMAIL", "env@example.com");
    env->set("SPEEDYDD_ADMIN_PASSWORD", "envpw");

    auto data = testData("data@example.com", "datapw", "owner");
    EXPECT_CALL(*data, get("email")).Times(1);
    EXPECT_CALL(*data, get("password")).Times(1);
    EXPECT_CALL(*data, get("sessionType")).Times(1);

    const auto id = resolver(data).resolve(SessionKind::Admin);
    EXPECT_EQ(id.kind, SessionKind::Owner);
    EXPECT_EQ(id.identity, "data@example.com");
    EXPECT_EQ(id.secret, "datapw");
}

TEST_F(CredentialResolverTest, IncompleteTestDataFallsBackToEnvironment) {
    env->set("SPEEDYDD_ADMIN_EMAIL", "env@example.com");
    env->set("SPEEDYDD_ADMIN_PASSWORD", "envpw");

    const auto id = resolver(testData("data@example.com", std::nullopt, "owner")).resolve(SessionKind::Admin);
    EXPECT_EQ(id.kind, SessionKind::Admin);
    EXPECT_EQ(id.identity, "env@example.com");
    EXPECT_EQ(id.secret, "envpw");
}

TEST_F(CredentialResolverTest, BlankTestDataFieldCountsAsMissing) {
    env->set("SPEEDYDD_USER_EMAIL", "env@example.com");
    env->set("SPEEDYDD_USER_PASSWORD", "envpw");

    const auto id = resolver(testData("   ", "datapw", "user")).resolve(SessionKind::User);
    EXPECT_EQ(id.identity, "env@example.com");
}

TEST_F(CredentialResolverTest, InvalidKindInTestDataFallsBackToEnvironment) {
    env->set("SPEEDYDD_USER_EMAIL", "env@example.com");
    env->set("SPEEDYDD_USER_PASSWORD", "envpw");

    const auto id = resolver(testData("data@example.com", "datapw", "wizard")).resolve(SessionKind::User);
    EXPECT_EQ(id.kind, SessionKind::User);
    EXPECT_EQ(id.identity, "env@example.com");
}

TEST_F(CredentialResolverTest, GenericScopeFallback) {
    env->set("SPEEDYDD_DEV_EMAIL", "dev@example.com");
    env->set("SPEEDYDD_DEV_PASSWORD", "devpw");

    const auto id = resolver().resolve(SessionKind::Trial);
    EXPECT_EQ(id.kind, SessionKind::Trial);
    EXPECT_EQ(id.identity, "dev@example.com");
    EXPECT_EQ(id.secret, "devpw");
}

TEST_F(CredentialResolverTest, IdentityAndSecretFallBackIndependently) {
    env->set("SPEEDYDD_OWNER_EMAIL", "owner@example.com");
    env->set("SPEEDYDD_DEV_EMAIL", "dev@example.com");
    env->set("SPEEDYDD_DEV_PASSWORD", "devpw");

    const auto id = resolver().resolve(SessionKind::Owner);
    EXPECT_EQ(id.identity, "owner@example.com");
    EXPECT_EQ(id.secret, "devpw");
}

TEST_F(CredentialResolverTest, MissingEverywhereListsAllNames) {
    env->set("SPEEDYDD_ADMIN_EMAIL", "admin@example.com");

    try {
        (void)resolver().resolve(SessionKind::Admin);
        FAIL() << "expected MissingCredentials";
    } catch (const MissingCredentials& e) {
        const std::vector<std::string> expected{"SPEEDYDD_ADMIN_EMAIL", "SPEEDYDD_ADMIN_PASSWORD",
                                                "SPEEDYDD_DEV_EMAIL", "SPEEDYDD_DEV_PASSWORD"};
        EXPECT_EQ(e.attempted, expected);
        const std::string msg = e.what();
        for (const auto& name : expected) EXPECT_NE(msg.find(name), std::string::npos) << name;
        EXPECT_NE(msg.find("identity=found"), std::string::npos);
        EXPECT_NE(msg.find("secret=missing"), std::string::npos);
    }
}

TEST_F(CredentialResolverTest, CustomPrefixAndScope) {
    cfg.env_prefix = "ACME";
    cfg.generic_scope = "STAGING";
    env->set("ACME_STAGING_EMAIL", "s@example.com");
    env->set("ACME_STAGING_PASSWORD", "spw");

    EXPECT_EQ(resolver().resolve(SessionKind::User).identity, "s@example.com");
}

TEST_F(CredentialResolverTest, RequiresEnvironment) {
    EXPECT_THROW((void)CredentialResolver(cfg, nullptr), std::invalid_argument);
}

TEST(ProcessEnvironmentTest, ReadsSetVariablesAndTreatsEmptyAsUnset) {
    ::setenv("REHYDRA_TEST_SET", "value", 1);
    ::setenv("REHYDRA_TEST_EMPTY", "", 1);
    ::unsetenv("REHYDRA_TEST_UNSET");

    const ProcessEnvironment env;
    EXPECT_EQ(env.get("REHYDRA_TEST_SET"), "value");
    EXPECT_FALSE(env.get("REHYDRA_TEST_EMPTY").has_value());
    EXPECT_FALSE(env.get("REHYDRA_TEST_UNSET").has_value());

    ::unsetenv("REHYDRA_TEST_SET");
    ::unsetenv("REHYDRA_TEST_EMPTY");
}
