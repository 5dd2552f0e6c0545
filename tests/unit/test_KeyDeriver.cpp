#include <gtest/gtest.h>
#include "identity/KeyDeriver.hpp"
#include "types/SessionKind.hpp"
#include "types/errors.hpp"

#include <cctype>

using namespace rh::identity;
using namespace rh::types;

TEST(KeyDeriverTest, Normalize_TrimsAndLowercases) {
    EXPECT_EQ(normalize("  QA.User@Example.COM \t\n"), "qa.user@example.com");
    EXPECT_EQ(normalize("plain"), "plain");
    EXPECT_EQ(normalize("   "), "");
}

TEST(KeyDeriverTest, DeriveKey_Format) {
    const auto key = deriveKey(SessionKind::Admin, "qa@example.com");
    ASSERT_EQ(key.size(), std::string("admin-").size() + KEY_HASH_CHARS);
    EXPECT_EQ(key.rfind("admin-", 0), 0u);
    for (const auto c : key.substr(6)) EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << key;
}

TEST(KeyDeriverTest, DeriveKey_SuperAdminPrefix) {
    EXPECT_EQ(deriveKey(SessionKind::SuperAdmin, "root@example.com").rfind("super-admin-", 0), 0u);
}

TEST(KeyDeriverTest, DeriveKey_InsensitiveToCaseAndWhitespace) {
    const auto a = deriveKey(SessionKind::User, "qa@example.com");
    EXPECT_EQ(a, deriveKey(SessionKind::User, "  QA@Example.com  "));
    EXPECT_EQ(a, deriveKey(SessionKind::User, "QA@EXAMPLE.COM\n"));
}

TEST(KeyDeriverTest, DeriveKey_Deterministic) {
    EXPECT_EQ(deriveKey(SessionKind::Owner, "owner@example.com"), deriveKey(SessionKind::Owner, "owner@example.com"));
}

TEST(KeyDeriverTest, DeriveKey_DistinguishesKindAndIdentity) {
    EXPECT_NE(deriveKey(SessionKind::User, "qa@example.com"), deriveKey(SessionKind::Admin, "qa@example.com"));
    EXPECT_NE(deriveKey(SessionKind::User, "qa@example.com"), deriveKey(SessionKind::User, "qa2@example.com"));
}

TEST(SessionKindTest, NamesRoundTrip) {
    for (const auto kind : ALL_SESSION_KINDS) EXPECT_EQ(sessionKindFromString(to_string(kind)), kind);
}

TEST(SessionKindTest, InvalidNameListsValidKinds) {
    try {
        (void)sessionKindFromString("Admin");
        FAIL() << "expected InvalidSessionKind";
    } catch (const InvalidSessionKind& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("'Admin'"), std::string::npos);
        EXPECT_NE(msg.find("trial, user, admin, owner, super-admin"), std::string::npos);
    }
}

TEST(SessionKindTest, FromRole) {
    EXPECT_EQ(sessionKindFromRole("SUPER_ADMIN"), SessionKind::SuperAdmin);
    EXPECT_EQ(sessionKindFromRole("admin"), SessionKind::Admin);
    EXPECT_EQ(sessionKindFromRole("Trial"), SessionKind::Trial);
    EXPECT_EQ(sessionKindFromRole("auditor"), SessionKind::User);
}

TEST(SessionKindTest, EnvTokens) {
    EXPECT_EQ(envToken(SessionKind::SuperAdmin), "SUPER_ADMIN");
    EXPECT_EQ(envToken(SessionKind::Owner), "OWNER");
}

TEST(SessionKindTest, ArtifactNames) {
    EXPECT_EQ(refreshArtifactName(SessionKind::Trial), "trialAuthRefreshToken");
    EXPECT_EQ(refreshArtifactName(SessionKind::Admin), "userAuthRefreshToken");
    EXPECT_EQ(authArtifactName(SessionKind::Trial), "trialAuth");
    EXPECT_EQ(authArtifactName(SessionKind::User), "userAuth");
}
