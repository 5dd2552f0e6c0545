#pragma once

#include <array>
#include <string>
#include <string_view>

namespace rh::types {

enum class SessionKind {
    Trial,
    User,
    Admin,
    Owner,
    SuperAdmin
};

inline constexpr std::array ALL_SESSION_KINDS = {
    SessionKind::Trial, SessionKind::User, SessionKind::Admin, SessionKind::Owner, SessionKind::SuperAdmin
};

std::string to_string(SessionKind kind);

// Throws InvalidSessionKind listing the accepted names.
SessionKind sessionKindFromString(std::string_view name);

// TRIAL, USER, ADMIN, OWNER, SUPER_ADMIN (any case). Unknown roles map to User.
SessionKind sessionKindFromRole(std::string_view role);

// "super-admin" -> "SUPER_ADMIN"
std::string envToken(SessionKind kind);

// Cookie replaced by a successful renewal exchange.
std::string refreshArtifactName(SessionKind kind);

// Cookie that must be present once an interactive login completed.
std::string authArtifactName(SessionKind kind);

std::string validSessionKindsList();

}
