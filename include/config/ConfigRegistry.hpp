#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace rh::config {

class ConfigRegistry {
public:
    static constexpr const auto* DEFAULT_CONFIG_PATH = "rehydra.yaml";

    // Loads from path if it exists, otherwise keeps defaults. With required set,
    // a missing file throws ConfigNotFound.
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH, bool required = false);
    static void init(Config cfg);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace rh::config
