#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace rh::auth {

// Per-test structured data (YAML/CSV rows selected for the running test).
class TestDataSource {
public:
    virtual ~TestDataSource() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& field) const = 0;
};

/**
 * Reads a YAML document whose top-level keys name data rows, e.g.
 *
 *   suite.LoginSpec.smoke:
 *     email: qa@example.com
 *     password: hunter2
 *     sessionType: admin
 *
 * The first row whose key ends with "<testName>.<dataKey>" becomes the active
 * row. Values are trimmed and one surrounding pair of brackets is stripped.
 */
class YamlTestData final : public TestDataSource {
public:
    YamlTestData(const std::filesystem::path& file, const std::string& testName, const std::string& dataKey);

    [[nodiscard]] std::optional<std::string> get(const std::string& field) const override;

    [[nodiscard]] bool hasRow() const { return !row_.empty(); }

private:
    std::unordered_map<std::string, std::string> row_;
};

}
