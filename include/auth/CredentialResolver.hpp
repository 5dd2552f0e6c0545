#pragma once

#include "auth/Environment.hpp"
#include "auth/TestDataSource.hpp"
#include "config/Config.hpp"
#include "types/SessionIdentity.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rh::auth {

/**
 * Looks up {identity, secret, kind} for a test session.
 *
 * Per-test structured data wins when it carries all of "email", "password"
 * and "sessionType". Otherwise the environment is consulted:
 * {PREFIX}_{KIND}_EMAIL / {PREFIX}_{KIND}_PASSWORD first, then the generic
 * {PREFIX}_{GENERIC}_EMAIL / {PREFIX}_{GENERIC}_PASSWORD. Identity and secret
 * fall back independently.
 */
class CredentialResolver {
public:
    static constexpr const auto* IDENTITY_FIELD = "email";
    static constexpr const auto* SECRET_FIELD = "password";
    static constexpr const auto* KIND_FIELD = "sessionType";

    CredentialResolver(config::CredentialsConfig cfg,
                       std::shared_ptr<Environment> env,
                       std::shared_ptr<TestDataSource> testData = nullptr);

    // Throws types::MissingCredentials naming every variable tried.
    [[nodiscard]] types::SessionIdentity resolve(types::SessionKind kind) const;

    // Step one only; throws when the data source is absent or incomplete.
    [[nodiscard]] types::SessionIdentity fromTestData() const;

    // Step two only.
    [[nodiscard]] types::SessionIdentity fromEnvironment(types::SessionKind kind) const;

    // Variable names in lookup order: kind identity, kind secret, generic identity, generic secret.
    [[nodiscard]] std::vector<std::string> envNames(types::SessionKind kind) const;

private:
    config::CredentialsConfig cfg_;
    std::shared_ptr<Environment> env_;
    std::shared_ptr<TestDataSource> testData_;
};

}
