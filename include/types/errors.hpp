#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace rh::types {

struct LockTimeout : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct InvalidSessionKind : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct MissingCredentials : std::runtime_error {
    std::vector<std::string> attempted;

    MissingCredentials(const std::string& what, std::vector<std::string> tried)
        : std::runtime_error(what), attempted(std::move(tried)) {}
};

}
