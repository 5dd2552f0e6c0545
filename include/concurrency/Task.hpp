#pragma once

#include <functional>
#include <string>
#include <utility>

namespace rh::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    [[nodiscard]] virtual std::string name() const { return "task"; }
};

struct FunctionTask final : Task {
    std::function<void()> fn;
    std::string label;

    explicit FunctionTask(std::function<void()> f, std::string l = "task")
        : fn(std::move(f)), label(std::move(l)) {}

    void operator()() override { if (fn) fn(); }

    [[nodiscard]] std::string name() const override { return label; }
};

}
