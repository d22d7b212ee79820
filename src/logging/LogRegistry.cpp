#include "logging/LogRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <mutex>
#include <vector>

namespace bfs::logging {

namespace {
std::recursive_mutex init_mutex;
}

void LogRegistry::init(const config::LoggingConfig& cnf) {
    std::scoped_lock lock(init_mutex);

    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // main file sink (rotating), only when a log directory is configured
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        main_log_path_ = cnf.log_dir / "blobfs.log";
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("blobfs",  sub_levels.blobfs);
    makeLogger("storage", sub_levels.storage);
    makeLogger("cloud",   sub_levels.cloud);
    makeLogger("config",  sub_levels.config);

    initialized_ = true;
    spdlog::get("blobfs")->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (!initialized_) init();
    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
