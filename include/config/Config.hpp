#pragma once

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace rh::config {

struct LockConfig {
    unsigned int retries = 5;
    std::chrono::milliseconds min_backoff{100};
    std::chrono::milliseconds max_backoff{1000};
};

struct StoreConfig {
    std::filesystem::path directory = "storageStates";
    std::chrono::hours expiry = std::chrono::hours(24 * 7); // local heuristic, not the server-side lifetime
    LockConfig lock;
};

struct RefreshConfig {
    std::vector<std::string> renewal_paths = {"/auth/refresh", "/refresh-token"};
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds poll_timeout{5000};
    std::chrono::milliseconds grace_period{200};
};

struct CredentialsConfig {
    std::string env_prefix = "SPEEDYDD";
    std::string generic_scope = "DEV";
    std::filesystem::path test_data_file;   // empty = environment only
    std::string test_name;
    std::string data_key;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum rehydra = spdlog::level::info;
    spdlog::level::level_enum store   = spdlog::level::info;   // saves, expiry, corrupt metadata
    spdlog::level::level_enum auth    = spdlog::level::info;   // credential fallback decisions
    spdlog::level::level_enum monitor = spdlog::level::info;   // renewal detection and persistence
    spdlog::level::level_enum queue   = spdlog::level::warn;
    spdlog::level::level_enum cli     = spdlog::level::info;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty = console only
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    StoreConfig store;
    RefreshConfig refresh;
    CredentialsConfig credentials;
    LoggingConfig logging;
};

struct ConfigNotFound : std::runtime_error {
    using std::runtime_error::runtime_error;
};

Config loadConfig(const std::filesystem::path& path);

// Defaults when the file is absent, unless the caller named it explicitly.
Config loadConfigOrDefaults(const std::filesystem::path& path, bool required);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const StoreConfig& c);
void from_json(const nlohmann::json& j, StoreConfig& c);
void to_json(nlohmann::json& j, const LockConfig& c);
void from_json(const nlohmann::json& j, LockConfig& c);
void to_json(nlohmann::json& j, const RefreshConfig& c);
void from_json(const nlohmann::json& j, RefreshConfig& c);
void to_json(nlohmann::json& j, const CredentialsConfig& c);
void from_json(const nlohmann::json& j, CredentialsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace rh::config
