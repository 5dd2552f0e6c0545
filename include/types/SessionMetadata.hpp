#pragma once

#include "types/SessionKind.hpp"

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace rh::types {

struct SessionMetadata {
    std::chrono::system_clock::time_point createdAt{}, expiresAt{};
    SessionKind kind{SessionKind::User};
    std::string identity;
};

// Wire names match the on-disk document: createdAt, expiresAt, sessionKind, identity.
void to_json(nlohmann::json& j, const SessionMetadata& m);
void from_json(const nlohmann::json& j, SessionMetadata& m);

}
