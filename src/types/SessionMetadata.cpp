#include "types/SessionMetadata.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace rh::types {

void to_json(nlohmann::json& j, const SessionMetadata& m) {
    j = {
        {"createdAt", util::toIso8601(m.createdAt)},
        {"expiresAt", util::toIso8601(m.expiresAt)},
        {"sessionKind", to_string(m.kind)},
        {"identity", m.identity}
    };
}

void from_json(const nlohmann::json& j, SessionMetadata& m) {
    m.createdAt = util::parseIso8601(j.at("createdAt").get<std::string>());
    m.expiresAt = util::parseIso8601(j.at("expiresAt").get<std::string>());
    m.kind = sessionKindFromString(j.at("sessionKind").get<std::string>());
    m.identity = j.at("identity").get<std::string>();
}

}
