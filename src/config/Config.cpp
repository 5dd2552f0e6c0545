#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace rh::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["store"]) YAML::convert<StoreConfig>::decode(node, cfg.store);
    if (auto node = root["refresh"]) YAML::convert<RefreshConfig>::decode(node, cfg.refresh);
    if (auto node = root["credentials"]) YAML::convert<CredentialsConfig>::decode(node, cfg.credentials);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

Config loadConfigOrDefaults(const std::filesystem::path& path, const bool required) {
    if (std::filesystem::exists(path)) return loadConfig(path);
    if (required) throw ConfigNotFound("Config file not found: " + path.string());
    return {};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"store", c.store},
        {"refresh", c.refresh},
        {"credentials", c.credentials},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const LockConfig& c) {
    j = {
        {"retries", c.retries},
        {"min_backoff_ms", c.min_backoff.count()},
        {"max_backoff_ms", c.max_backoff.count()}
    };
}

void from_json(const nlohmann::json& j, LockConfig& c) {
    c.retries = j.value("retries", 5u);
    c.min_backoff = std::chrono::milliseconds(j.value("min_backoff_ms", 100));
    c.max_backoff = std::chrono::milliseconds(j.value("max_backoff_ms", 1000));
}

void to_json(nlohmann::json& j, const StoreConfig& c) {
    j = {
        {"directory", c.directory.string()},
        {"expiry_days", c.expiry.count() / 24},
        {"lock", c.lock}
    };
}

void from_json(const nlohmann::json& j, StoreConfig& c) {
    c.directory = j.value("directory", std::string("storageStates"));
    c.expiry = std::chrono::hours(24 * j.value("expiry_days", 7));
    if (j.contains("lock")) j.at("lock").get_to(c.lock);
}

void to_json(nlohmann::json& j, const RefreshConfig& c) {
    j = {
        {"renewal_paths", c.renewal_paths},
        {"poll_interval_ms", c.poll_interval.count()},
        {"poll_timeout_ms", c.poll_timeout.count()},
        {"grace_period_ms", c.grace_period.count()}
    };
}

void from_json(const nlohmann::json& j, RefreshConfig& c) {
    if (j.contains("renewal_paths")) c.renewal_paths = j.at("renewal_paths").get<std::vector<std::string>>();
    c.poll_interval = std::chrono::milliseconds(j.value("poll_interval_ms", 100));
    c.poll_timeout = std::chrono::milliseconds(j.value("poll_timeout_ms", 5000));
    c.grace_period = std::chrono::milliseconds(j.value("grace_period_ms", 200));
}

void to_json(nlohmann::json& j, const CredentialsConfig& c) {
    j = {
        {"env_prefix", c.env_prefix},
        {"generic_scope", c.generic_scope},
        {"test_data_file", c.test_data_file.string()},
        {"test_name", c.test_name},
        {"data_key", c.data_key}
    };
}

void from_json(const nlohmann::json& j, CredentialsConfig& c) {
    c.env_prefix = j.value("env_prefix", std::string("SPEEDYDD"));
    c.generic_scope = j.value("generic_scope", std::string("DEV"));
    c.test_data_file = j.value("test_data_file", std::string());
    c.test_name = j.value("test_name", std::string());
    c.data_key = j.value("data_key", std::string());
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.console_log_level))},
        {"file_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.file_log_level))},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    const auto name = [](const spdlog::level::level_enum lvl) {
        return YAML::to_std_string(spdlog::level::to_string_view(lvl));
    };

    j = {
        {"rehydra", name(c.rehydra)},
        {"store", name(c.store)},
        {"auth", name(c.auth)},
        {"monitor", name(c.monitor)},
        {"queue", name(c.queue)},
        {"cli", name(c.cli)}
    };
}

} // namespace rh::config
