#include "session/SessionCoordinator.hpp"
#include "storage/SessionStore.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace rh::session;
using namespace rh::monitor;
using namespace rh::types;
using namespace rh::log;

ActiveSession::ActiveSession(std::shared_ptr<AutomationContext> ctx,
                             std::unique_ptr<RefreshMonitor> monitor,
                             const SessionKind kind,
                             std::string identity,
                             const bool rehydrated)
    : ctx_(std::move(ctx)),
      monitor_(std::move(monitor)),
      kind_(kind),
      identity_(std::move(identity)),
      rehydrated_(rehydrated) {}

ActiveSession::~ActiveSession() {
    dispose();
}

void ActiveSession::dispose() {
    if (!monitor_) return;
    monitor_->detach();
    monitor_->waitIdle();
    monitor_.reset();
}

SessionCoordinator::SessionCoordinator(std::shared_ptr<storage::SessionStore> store,
                                       std::shared_ptr<auth::CredentialResolver> resolver,
                                       config::RefreshConfig refreshCfg)
    : store_(std::move(store)), resolver_(std::move(resolver)), refreshCfg_(std::move(refreshCfg)) {
    if (!store_ || !resolver_) throw std::invalid_argument("SessionCoordinator requires a store and a resolver");
}

ActiveSession SessionCoordinator::establish(const SessionKind kind, const SessionHooks& hooks) const {
    if (!hooks.rehydrate || !hooks.login) throw std::invalid_argument("SessionCoordinator requires rehydrate and login hooks");

    const auto id = resolver_->resolve(kind);

    std::shared_ptr<AutomationContext> ctx;
    bool rehydrated = false;

    if (const auto snapshot = store_->load(id)) {
        Registry::rehydra()->debug("[SessionCoordinator] Rehydrating {} session from {}", to_string(id.kind), snapshot->string());
        ctx = hooks.rehydrate(*snapshot);
        if (!ctx) throw std::runtime_error("rehydrate hook returned no context");
        rehydrated = true;
    } else {
        ctx = loginAndSeed(id, hooks);
    }

    auto monitor = std::make_unique<RefreshMonitor>(ctx, store_, id, refreshCfg_);
    monitor->attach();

    return {ctx, std::move(monitor), id.kind, id.identity, rehydrated};
}

std::shared_ptr<AutomationContext> SessionCoordinator::loginAndSeed(const SessionIdentity& id,
                                                                    const SessionHooks& hooks) const {
    Registry::rehydra()->info("[SessionCoordinator] No valid cached {} session, performing full login", to_string(id.kind));

    auto ctx = hooks.login(id);
    if (!ctx) throw std::runtime_error("login hook returned no context");

    const auto artifact = authArtifactName(id.kind);
    if (!ctx->readCredentialArtifact(artifact))
        throw std::runtime_error(fmt::format("Login for {} did not produce the {} credential", to_string(id.kind), artifact));

    store_->save(id, ctx->captureSnapshot());
    Registry::rehydra()->info("[SessionCoordinator] Cached new {} session", to_string(id.kind));
    return ctx;
}
