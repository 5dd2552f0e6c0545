#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace rh::config {

void ConfigRegistry::init(const std::filesystem::path& path, const bool required) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfigOrDefaults(path, required);
        initialized_ = true;
    });
}

void ConfigRegistry::init(Config cfg) {
    std::call_once(init_flag_, [&]() {
        config_ = std::move(cfg);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace rh::config
