#pragma once

#include <optional>
#include <string>

namespace rh::auth {

class Environment {
public:
    virtual ~Environment() = default;

    // nullopt when unset or empty.
    [[nodiscard]] virtual std::optional<std::string> get(const std::string& name) const = 0;
};

class ProcessEnvironment final : public Environment {
public:
    [[nodiscard]] std::optional<std::string> get(const std::string& name) const override;
};

}
