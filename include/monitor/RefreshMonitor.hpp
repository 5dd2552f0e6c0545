#pragma once

#include "concurrency/TaskQueue.hpp"
#include "config/Config.hpp"
#include "monitor/AutomationContext.hpp"
#include "types/SessionIdentity.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace rh::storage { class SessionStore; }

namespace rh::monitor {

/**
 * Watches one live context for credential renewal exchanges and writes the
 * renewed session back to the store.
 *
 * A renewal is a POST whose URL contains one of the configured renewal paths
 * and whose response status is below 400. Each distinct URL is persisted at
 * most once at a time; persistence runs on the monitor's own TaskQueue so
 * saves from this context never overlap.
 *
 * Destroying the monitor detaches it and lets already queued saves finish.
 */
class RefreshMonitor {
public:
    using Detach = std::function<void()>;

    RefreshMonitor(std::shared_ptr<AutomationContext> ctx,
                   std::shared_ptr<storage::SessionStore> store,
                   types::SessionIdentity id,
                   config::RefreshConfig cfg = {});

    ~RefreshMonitor();

    RefreshMonitor(const RefreshMonitor&) = delete;
    RefreshMonitor& operator=(const RefreshMonitor&) = delete;

    // Subscribes to request and response events. Subscription failure is
    // rethrown. The returned function must not outlive the monitor.
    Detach attach();

    // Idempotent. Interrupts a propagation wait in progress.
    void detach();

    [[nodiscard]] bool isAttached() const { return attached_.load(); }

    [[nodiscard]] bool isRenewalEndpoint(const std::string& url) const;

    [[nodiscard]] size_t inFlightCount() const;

    // Blocks until every queued persistence task has run.
    void waitIdle();

private:
    void handleRequest(const NetworkEvent& ev) const;
    void handleResponse(const NetworkEvent& ev);
    void persistRenewal(const std::string& url);

    // true once the refresh artifact is visible; false on timeout or detach.
    bool waitForPropagation();

    // false when interrupted by detach().
    bool sleepFor(std::chrono::milliseconds d);

    // Shared with every registered handler. Cleared by the destructor so a
    // handler the context failed to remove never reaches a dead monitor.
    struct Liveness {
        std::mutex mutex;
        RefreshMonitor* self = nullptr;
    };

    std::shared_ptr<Liveness> liveness_;

    std::shared_ptr<AutomationContext> ctx_;
    std::shared_ptr<storage::SessionStore> store_;
    types::SessionIdentity identity_;
    config::RefreshConfig cfg_;
    std::string artifactName_;

    std::atomic<bool> attached_{false};
    std::optional<AutomationContext::SubscriptionId> requestSub_, responseSub_;
    std::mutex attachMutex_;

    bool cancelled_ = false;
    std::mutex cancelMutex_;
    std::condition_variable cancelCv_;

    std::unordered_set<std::string> inFlight_;
    mutable std::mutex inFlightMutex_;

    concurrency::TaskQueue queue_;
};

}
