#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace rh::monitor {

struct NetworkEvent {
    std::string url;
    std::string method;
    int status = 0;     // 0 for requests
};

enum class NetworkEventType { Request, Response };

// A live, authenticated browser context owned by the automation engine.
// Handlers may be invoked from any engine thread.
class AutomationContext {
public:
    using Handler = std::function<void(const NetworkEvent&)>;
    using SubscriptionId = std::uint64_t;

    virtual ~AutomationContext() = default;

    // Cookies plus storage, serialized by the engine.
    virtual std::string captureSnapshot() = 0;

    // Current value of a named credential cookie, nullopt when absent or empty.
    virtual std::optional<std::string> readCredentialArtifact(const std::string& name) = 0;

    virtual SubscriptionId onRequest(Handler handler) = 0;
    virtual SubscriptionId onResponse(Handler handler) = 0;
    virtual void off(NetworkEventType type, SubscriptionId id) = 0;
};

}
