#include "auth/CredentialResolver.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace rh::auth;
using namespace rh::types;
using namespace rh::log;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
}

std::optional<std::string> nonEmpty(std::optional<std::string> v) {
    if (!v) return std::nullopt;
    auto t = trim(*v);
    if (t.empty()) return std::nullopt;
    return t;
}

const char* mark(const std::optional<std::string>& v) { return v ? "found" : "missing"; }

}

CredentialResolver::CredentialResolver(config::CredentialsConfig cfg,
                                       std::shared_ptr<Environment> env,
                                       std::shared_ptr<TestDataSource> testData)
    : cfg_(std::move(cfg)), env_(std::move(env)), testData_(std::move(testData)) {
    if (!env_) throw std::invalid_argument("CredentialResolver requires an environment");
}

SessionIdentity CredentialResolver::resolve(const SessionKind kind) const {
    try {
        return fromTestData();
    } catch (const InvalidSessionKind& e) {
        Registry::auth()->warn("[CredentialResolver] Ignoring test data: {}", e.what());
    } catch (const std::exception& e) {
        Registry::auth()->debug("[CredentialResolver] Test data not available, falling back to environment: {}", e.what());
    }

    return fromEnvironment(kind);
}

SessionIdentity CredentialResolver::fromTestData() const {
    if (!testData_) throw std::runtime_error("no test data source configured");

    const auto identity = nonEmpty(testData_->get(IDENTITY_FIELD));
    const auto secret = nonEmpty(testData_->get(SECRET_FIELD));
    const auto kind = nonEmpty(testData_->get(KIND_FIELD));

    if (!identity || !secret || !kind)
        throw std::runtime_error(fmt::format(
            "Session config missing required fields in test data. Required: {}, {}, {}. Found: {}={}, {}={}, {}={}",
            IDENTITY_FIELD, SECRET_FIELD, KIND_FIELD,
            IDENTITY_FIELD, mark(identity), SECRET_FIELD, mark(secret), KIND_FIELD, mark(kind)));

    return {sessionKindFromString(*kind), *identity, *secret};
}

SessionIdentity CredentialResolver::fromEnvironment(const SessionKind kind) const {
    const auto names = envNames(kind);

    auto identity = nonEmpty(env_->get(names[0]));
    auto secret = nonEmpty(env_->get(names[1]));
    if (!identity) identity = nonEmpty(env_->get(names[2]));
    if (!secret) secret = nonEmpty(env_->get(names[3]));

    if (!identity || !secret)
        throw MissingCredentials(fmt::format(
            "Session credentials for '{}' not found. Provide test data or set environment variables. "
            "Tried: {}. Found: identity={}, secret={}",
            to_string(kind), fmt::join(names, ", "), mark(identity), mark(secret)), names);

    Registry::auth()->debug("[CredentialResolver] Resolved {} credentials from environment", to_string(kind));
    return {kind, *identity, *secret};
}

std::vector<std::string> CredentialResolver::envNames(const SessionKind kind) const {
    const auto scoped = cfg_.env_prefix + "_" + envToken(kind);
    const auto generic = cfg_.env_prefix + "_" + cfg_.generic_scope;
    return {scoped + "_EMAIL", scoped + "_PASSWORD", generic + "_EMAIL", generic + "_PASSWORD"};
}
