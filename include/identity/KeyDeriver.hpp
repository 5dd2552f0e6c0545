#pragma once

#include "types/SessionKind.hpp"

#include <string>
#include <string_view>

namespace rh::identity {

// Width of the identity digest embedded in a session key.
inline constexpr std::size_t KEY_HASH_CHARS = 8;

// Trim surrounding ASCII whitespace, then ASCII-lowercase.
std::string normalize(std::string_view identity);

// "{kind}-{hash8(normalize(identity))}", stable across processes and hosts.
std::string deriveKey(types::SessionKind kind, std::string_view identity);

}
