#include "monitor/RefreshMonitor.hpp"
#include "storage/SessionStore.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace rh::monitor;
using namespace rh::types;
using namespace rh::log;

namespace {
constexpr const auto* RENEWAL_METHOD = "POST";
}

RefreshMonitor::RefreshMonitor(std::shared_ptr<AutomationContext> ctx,
                               std::shared_ptr<storage::SessionStore> store,
                               SessionIdentity id,
                               config::RefreshConfig cfg)
    : liveness_(std::make_shared<Liveness>()),
      ctx_(std::move(ctx)),
      store_(std::move(store)),
      identity_(std::move(id)),
      cfg_(std::move(cfg)),
      artifactName_(refreshArtifactName(identity_.kind)),
      queue_("refresh-" + to_string(identity_.kind)) {
    if (!ctx_ || !store_) throw std::invalid_argument("RefreshMonitor requires a context and a store");
    liveness_->self = this;
}

RefreshMonitor::~RefreshMonitor() {
    detach();
    {
        std::scoped_lock lock(liveness_->mutex);
        liveness_->self = nullptr;
    }
    queue_.shutdown();
}

RefreshMonitor::Detach RefreshMonitor::attach() {
    {
        std::scoped_lock lock(attachMutex_);
        if (attached_.load()) return [this] { detach(); };

        {
            std::scoped_lock cancelLock(cancelMutex_);
            cancelled_ = false;
        }

        try {
            requestSub_ = ctx_->onRequest([alive = liveness_](const NetworkEvent& ev) {
                std::scoped_lock lock(alive->mutex);
                if (alive->self) alive->self->handleRequest(ev);
            });
            responseSub_ = ctx_->onResponse([alive = liveness_](const NetworkEvent& ev) {
                std::scoped_lock lock(alive->mutex);
                if (alive->self) alive->self->handleResponse(ev);
            });
        } catch (const std::exception& e) {
            Registry::monitor()->error("[RefreshMonitor] Failed to attach renewal listeners: {}", e.what());
            if (requestSub_) {
                try {
                    ctx_->off(NetworkEventType::Request, *requestSub_);
                } catch (const std::exception& offErr) {
                    Registry::monitor()->warn("[RefreshMonitor] Error removing request listener: {}", offErr.what());
                }
                requestSub_.reset();
            }
            throw;
        }

        attached_.store(true);
    }

    Registry::monitor()->debug("[RefreshMonitor] Watching renewals for {} (artifact {})",
                               to_string(identity_.kind), artifactName_);
    return [this] { detach(); };
}

void RefreshMonitor::detach() {
    std::scoped_lock lock(attachMutex_);
    if (!attached_.exchange(false)) return;

    {
        std::scoped_lock cancelLock(cancelMutex_);
        cancelled_ = true;
    }
    cancelCv_.notify_all();

    const auto unsubscribe = [this](const NetworkEventType type, std::optional<AutomationContext::SubscriptionId>& sub) {
        if (!sub) return;
        try {
            ctx_->off(type, *sub);
        } catch (const std::exception& e) {
            Registry::monitor()->warn("[RefreshMonitor] Error removing {} listener: {}",
                                      type == NetworkEventType::Request ? "request" : "response", e.what());
        }
        sub.reset();
    };

    unsubscribe(NetworkEventType::Request, requestSub_);
    unsubscribe(NetworkEventType::Response, responseSub_);

    Registry::monitor()->debug("[RefreshMonitor] Renewal listeners removed");
}

bool RefreshMonitor::isRenewalEndpoint(const std::string& url) const {
    return std::ranges::any_of(cfg_.renewal_paths, [&url](const std::string& p) {
        return !p.empty() && url.find(p) != std::string::npos;
    });
}

size_t RefreshMonitor::inFlightCount() const {
    std::scoped_lock lock(inFlightMutex_);
    return inFlight_.size();
}

void RefreshMonitor::waitIdle() {
    queue_.waitIdle();
}

void RefreshMonitor::handleRequest(const NetworkEvent& ev) const {
    if (!attached_.load()) return;
    if (ev.method == RENEWAL_METHOD && isRenewalEndpoint(ev.url))
        Registry::monitor()->debug("[RefreshMonitor] Renewal request detected: {}", ev.url);
}

void RefreshMonitor::handleResponse(const NetworkEvent& ev) {
    if (!attached_.load()) return;
    if (ev.method != RENEWAL_METHOD || !isRenewalEndpoint(ev.url)) return;

    if (ev.status >= 400) {
        Registry::monitor()->warn("[RefreshMonitor] Renewal failed with status {} ({}). Stored session will not be updated.",
                                  ev.status, ev.url);
        std::scoped_lock lock(inFlightMutex_);
        inFlight_.erase(ev.url);
        return;
    }

    {
        std::scoped_lock lock(inFlightMutex_);
        if (!inFlight_.insert(ev.url).second) {
            Registry::monitor()->debug("[RefreshMonitor] Renewal for {} already queued, ignoring duplicate", ev.url);
            return;
        }
    }

    const auto url = ev.url;
    if (!queue_.enqueue([this, url] { persistRenewal(url); }, "persist " + url)) {
        std::scoped_lock lock(inFlightMutex_);
        inFlight_.erase(url);
    }
}

void RefreshMonitor::persistRenewal(const std::string& url) {
    struct InFlightRelease {
        RefreshMonitor& self;
        const std::string& url;
        ~InFlightRelease() {
            std::scoped_lock lock(self.inFlightMutex_);
            self.inFlight_.erase(url);
        }
    } release{*this, url};

    try {
        waitForPropagation();
        const auto snapshot = ctx_->captureSnapshot();
        store_->save(identity_, snapshot);
        Registry::monitor()->debug("[RefreshMonitor] Stored session updated after renewal ({})", url);
    } catch (const std::exception& e) {
        // The next validity check falls back to a full login.
        Registry::monitor()->error("[RefreshMonitor] Failed to update stored session after renewal: {}", e.what());
    }
}

bool RefreshMonitor::waitForPropagation() {
    const auto deadline = std::chrono::steady_clock::now() + cfg_.poll_timeout;

    while (true) {
        if (ctx_->readCredentialArtifact(artifactName_)) {
            sleepFor(cfg_.grace_period);
            return true;
        }

        if (std::chrono::steady_clock::now() >= deadline) break;

        if (!sleepFor(cfg_.poll_interval)) {
            Registry::monitor()->debug("[RefreshMonitor] Detached while waiting for {}, saving current state", artifactName_);
            return false;
        }
    }

    Registry::monitor()->warn("[RefreshMonitor] {} not updated within {}ms, saving anyway",
                              artifactName_, cfg_.poll_timeout.count());
    return false;
}

bool RefreshMonitor::sleepFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(cancelMutex_);
    return !cancelCv_.wait_for(lock, d, [this] { return cancelled_; });
}
