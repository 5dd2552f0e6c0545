#include "identity/KeyDeriver.hpp"
#include "crypto/util/hash.hpp"

#include <algorithm>
#include <cctype>

namespace rh::identity {

std::string normalize(std::string_view identity) {
    const auto isSpace = [](const unsigned char c) { return std::isspace(c) != 0; };

    while (!identity.empty() && isSpace(identity.front())) identity.remove_prefix(1);
    while (!identity.empty() && isSpace(identity.back())) identity.remove_suffix(1);

    std::string out(identity);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string deriveKey(const types::SessionKind kind, const std::string_view identity) {
    return types::to_string(kind) + "-" + crypto::hash::blake2bPrefix(normalize(identity), KEY_HASH_CHARS);
}

}
