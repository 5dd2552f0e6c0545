#pragma once

#include "types/SessionKind.hpp"

#include <string>

namespace rh::types {

struct SessionIdentity {
    SessionKind kind{SessionKind::User};
    std::string identity;
    std::string secret;     // never persisted, never logged
};

}
