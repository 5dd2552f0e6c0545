#include "auth/TestDataSource.hpp"
#include "log/Registry.hpp"

#include <yaml-cpp/yaml.h>

using namespace rh::auth;
using namespace rh::log;

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string clean(std::string value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    value = value.substr(first, value.find_last_not_of(" \t\r\n") - first + 1);

    if (!value.empty() && value.front() == '[') value.erase(0, 1);
    if (!value.empty() && value.back() == ']') value.pop_back();
    return value;
}

}

YamlTestData::YamlTestData(const std::filesystem::path& file, const std::string& testName, const std::string& dataKey) {
    const YAML::Node root = YAML::LoadFile(file.string());
    if (!root.IsMap()) throw std::runtime_error("Test data file is not a YAML map: " + file.string());

    const auto wanted = testName + "." + dataKey;

    for (const auto& entry : root) {
        const auto rowKey = entry.first.as<std::string>();
        if (!endsWith(rowKey, wanted) || !entry.second.IsMap()) continue;

        for (const auto& field : entry.second)
            if (field.second.IsScalar()) row_[field.first.as<std::string>()] = field.second.as<std::string>();

        Registry::auth()->debug("[YamlTestData] Using row '{}' from {}", rowKey, file.string());
        return;
    }

    Registry::auth()->debug("[YamlTestData] No row matching '{}' in {}", wanted, file.string());
}

std::optional<std::string> YamlTestData::get(const std::string& field) const {
    const auto it = row_.find(field);
    if (it == row_.end()) return std::nullopt;
    return clean(it->second);
}
