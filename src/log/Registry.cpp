#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <vector>

namespace rh::log {

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cfg.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // main file sink (rotating), only when a log directory is configured
    if (!cfg.log_dir.empty()) {
        namespace fs = std::filesystem;
        log_dir_ = cfg.log_dir;
        main_log_path_ = log_dir_ / "rehydra.log";
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cfg.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cfg.subsystem_levels;
    makeLogger("rehydra", sub_levels.rehydra);
    makeLogger("store",   sub_levels.store);
    makeLogger("auth",    sub_levels.auth);
    makeLogger("monitor", sub_levels.monitor);
    makeLogger("queue",   sub_levels.queue);
    makeLogger("cli",     sub_levels.cli);

    initialized_ = true;
    rehydra()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    if (auto logger = spdlog::get(name)) return logger;
    // Library code may log before the host has called init(), or after shutdown().
    return spdlog::default_logger();
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_.exchange(false)) return;
    for (const auto* name : {"rehydra", "store", "auth", "monitor", "queue", "cli"}) spdlog::drop(name);
    console_sink_.reset();
    main_file_sink_.reset();
}

}
