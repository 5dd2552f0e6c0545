#include "types/SessionKind.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <cctype>

namespace rh::types {

std::string to_string(const SessionKind kind) {
    switch (kind) {
        case SessionKind::Trial: return "trial";
        case SessionKind::User: return "user";
        case SessionKind::Admin: return "admin";
        case SessionKind::Owner: return "owner";
        case SessionKind::SuperAdmin: return "super-admin";
        default: return "unknown";
    }
}

SessionKind sessionKindFromString(const std::string_view name) {
    for (const auto kind : ALL_SESSION_KINDS)
        if (to_string(kind) == name) return kind;

    throw InvalidSessionKind("Invalid session kind: '" + std::string(name) + "'. Valid kinds: " + validSessionKindsList());
}

SessionKind sessionKindFromRole(const std::string_view role) {
    std::string upper(role);
    std::ranges::transform(upper, upper.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRIAL") return SessionKind::Trial;
    if (upper == "USER") return SessionKind::User;
    if (upper == "ADMIN") return SessionKind::Admin;
    if (upper == "OWNER") return SessionKind::Owner;
    if (upper == "SUPER_ADMIN") return SessionKind::SuperAdmin;
    return SessionKind::User;
}

std::string envToken(const SessionKind kind) {
    auto token = to_string(kind);
    std::ranges::transform(token, token.begin(), [](const unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::toupper(c));
    });
    return token;
}

std::string refreshArtifactName(const SessionKind kind) {
    return kind == SessionKind::Trial ? "trialAuthRefreshToken" : "userAuthRefreshToken";
}

std::string authArtifactName(const SessionKind kind) {
    return kind == SessionKind::Trial ? "trialAuth" : "userAuth";
}

std::string validSessionKindsList() {
    std::string out;
    for (const auto kind : ALL_SESSION_KINDS) {
        if (!out.empty()) out += ", ";
        out += to_string(kind);
    }
    return out;
}

}
