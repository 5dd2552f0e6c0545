#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace rh::crypto::hash {

// BLAKE2b over an in-memory buffer, hex encoded. digestBytes must lie in
// [crypto_generichash_BYTES_MIN, crypto_generichash_BYTES_MAX].
std::string blake2b(std::string_view data, std::size_t digestBytes);

// Hex of the first `hexChars` characters of the default-length BLAKE2b digest.
std::string blake2bPrefix(std::string_view data, std::size_t hexChars);

}
