#include "crypto/util/hash.hpp"

#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace rh::crypto::hash {

namespace {
void ensure_sodium_init() {
    static const int init = [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
        return 1;
    }();
    (void)init;
}
}

std::string blake2b(const std::string_view data, const std::size_t digestBytes) {
    if (digestBytes < crypto_generichash_BYTES_MIN || digestBytes > crypto_generichash_BYTES_MAX)
        throw std::invalid_argument("blake2b: digest length out of range: " + std::to_string(digestBytes));

    ensure_sodium_init();

    std::vector<unsigned char> hash(digestBytes);
    crypto_generichash(hash.data(), hash.size(),
                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                       nullptr, 0);

    std::ostringstream result;
    for (const auto byte : hash)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);

    return result.str();
}

std::string blake2bPrefix(const std::string_view data, const std::size_t hexChars) {
    auto digest = blake2b(data, crypto_generichash_BYTES);
    if (hexChars < digest.size()) digest.resize(hexChars);
    return digest;
}

}
