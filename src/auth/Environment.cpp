#include "auth/Environment.hpp"

#include <cstdlib>

using namespace rh::auth;

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}
