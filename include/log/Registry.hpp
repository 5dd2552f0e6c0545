#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace rh::config { struct LoggingConfig; }

namespace rh::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cfg);

    // Generic access by name. Falls back to spdlog's default logger while
    // the registry is not initialized, so logging never throws.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> rehydra()  { return get("rehydra"); }
    static std::shared_ptr<spdlog::logger> store()    { return get("store"); }
    static std::shared_ptr<spdlog::logger> auth()     { return get("auth"); }
    static std::shared_ptr<spdlog::logger> monitor()  { return get("monitor"); }
    static std::shared_ptr<spdlog::logger> queue()    { return get("queue"); }
    static std::shared_ptr<spdlog::logger> cli()      { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

    // Drop every registered logger so init() can run again (tests, CLI re-config).
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline std::atomic<bool> initialized_{false};

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
