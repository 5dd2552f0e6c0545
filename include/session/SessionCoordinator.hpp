#pragma once

#include "auth/CredentialResolver.hpp"
#include "config/Config.hpp"
#include "monitor/AutomationContext.hpp"
#include "monitor/RefreshMonitor.hpp"
#include "types/SessionKind.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace rh::storage { class SessionStore; }

namespace rh::session {

// Engine-side callbacks. Both must return a live context.
struct SessionHooks {
    std::function<std::shared_ptr<monitor::AutomationContext>(const std::filesystem::path& snapshot)> rehydrate;
    std::function<std::shared_ptr<monitor::AutomationContext>(const types::SessionIdentity& id)> login;
};

class ActiveSession {
public:
    ActiveSession(std::shared_ptr<monitor::AutomationContext> ctx,
                  std::unique_ptr<monitor::RefreshMonitor> monitor,
                  types::SessionKind kind,
                  std::string identity,
                  bool rehydrated);

    ~ActiveSession();

    ActiveSession(const ActiveSession&) = delete;
    ActiveSession& operator=(const ActiveSession&) = delete;
    ActiveSession(ActiveSession&&) noexcept = default;
    ActiveSession& operator=(ActiveSession&&) noexcept = default;

    [[nodiscard]] const std::shared_ptr<monitor::AutomationContext>& context() const { return ctx_; }
    [[nodiscard]] types::SessionKind kind() const { return kind_; }
    [[nodiscard]] const std::string& identity() const { return identity_; }
    [[nodiscard]] bool rehydrated() const { return rehydrated_; }
    [[nodiscard]] bool disposed() const { return !monitor_; }

    // Detaches the monitor and waits for pending saves. Idempotent.
    void dispose();

private:
    std::shared_ptr<monitor::AutomationContext> ctx_;
    std::unique_ptr<monitor::RefreshMonitor> monitor_;
    types::SessionKind kind_;
    std::string identity_;
    bool rehydrated_;
};

/**
 * Ties the cache together for one test: resolve credentials, reuse a cached
 * snapshot when the store has a valid one, otherwise log in and seed the
 * cache, then keep the cache current while the test runs.
 */
class SessionCoordinator {
public:
    SessionCoordinator(std::shared_ptr<storage::SessionStore> store,
                       std::shared_ptr<auth::CredentialResolver> resolver,
                       config::RefreshConfig refreshCfg = {});

    [[nodiscard]] ActiveSession establish(types::SessionKind kind, const SessionHooks& hooks) const;

private:
    std::shared_ptr<monitor::AutomationContext> loginAndSeed(const types::SessionIdentity& id,
                                                             const SessionHooks& hooks) const;

    std::shared_ptr<storage::SessionStore> store_;
    std::shared_ptr<auth::CredentialResolver> resolver_;
    config::RefreshConfig refreshCfg_;
};

}
