#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace rh::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<LockConfig> {
    static Node encode(const LockConfig& rhs) {
        Node node;
        node["retries"] = rhs.retries;
        node["min_backoff_ms"] = rhs.min_backoff.count();
        node["max_backoff_ms"] = rhs.max_backoff.count();
        return node;
    }

    static bool decode(const Node& node, LockConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.retries = node["retries"].as<unsigned int>(5);
        rhs.min_backoff = std::chrono::milliseconds(node["min_backoff_ms"].as<long>(100));
        rhs.max_backoff = std::chrono::milliseconds(node["max_backoff_ms"].as<long>(1000));
        return true;
    }
};

template<>
struct convert<StoreConfig> {
    static Node encode(const StoreConfig& rhs) {
        Node node;
        node["directory"] = rhs.directory.string();
        node["expiry_days"] = rhs.expiry.count() / 24;
        node["lock"] = rhs.lock;
        return node;
    }

    static bool decode(const Node& node, StoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.directory = node["directory"].as<std::string>("storageStates");
        rhs.expiry = std::chrono::hours(24 * node["expiry_days"].as<unsigned int>(7));
        if (node["lock"]) convert<LockConfig>::decode(node["lock"], rhs.lock);
        return true;
    }
};

template<>
struct convert<RefreshConfig> {
    static Node encode(const RefreshConfig& rhs) {
        Node node;
        node["renewal_paths"] = rhs.renewal_paths;
        node["poll_interval_ms"] = rhs.poll_interval.count();
        node["poll_timeout_ms"] = rhs.poll_timeout.count();
        node["grace_period_ms"] = rhs.grace_period.count();
        return node;
    }

    static bool decode(const Node& node, RefreshConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["renewal_paths"]) rhs.renewal_paths = node["renewal_paths"].as<std::vector<std::string>>();
        rhs.poll_interval = std::chrono::milliseconds(node["poll_interval_ms"].as<long>(100));
        rhs.poll_timeout = std::chrono::milliseconds(node["poll_timeout_ms"].as<long>(5000));
        rhs.grace_period = std::chrono::milliseconds(node["grace_period_ms"].as<long>(200));
        return true;
    }
};

template<>
struct convert<CredentialsConfig> {
    static Node encode(const CredentialsConfig& rhs) {
        Node node;
        node["env_prefix"] = rhs.env_prefix;
        node["generic_scope"] = rhs.generic_scope;
        node["test_data_file"] = rhs.test_data_file.string();
        node["test_name"] = rhs.test_name;
        node["data_key"] = rhs.data_key;
        return node;
    }

    static bool decode(const Node& node, CredentialsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.env_prefix = node["env_prefix"].as<std::string>("SPEEDYDD");
        rhs.generic_scope = node["generic_scope"].as<std::string>("DEV");
        rhs.test_data_file = node["test_data_file"].as<std::string>("");
        rhs.test_name = node["test_name"].as<std::string>("");
        rhs.data_key = node["data_key"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["rehydra"] = to_std_string(spdlog::level::to_string_view(rhs.rehydra));
        node["store"]   = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["auth"]    = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["monitor"] = to_std_string(spdlog::level::to_string_view(rhs.monitor));
        node["queue"]   = to_std_string(spdlog::level::to_string_view(rhs.queue));
        node["cli"]     = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.rehydra = spdlog::level::from_str(node["rehydra"].as<std::string>("info"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("info"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("info"));
        rhs.monitor = spdlog::level::from_str(node["monitor"].as<std::string>("info"));
        rhs.queue = spdlog::level::from_str(node["queue"].as<std::string>("warning"));
        rhs.cli = spdlog::level::from_str(node["cli"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels);
        return true;
    }
};

}
