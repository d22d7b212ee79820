#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace bfs::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels. A second call is ignored.
    static void init(const config::LoggingConfig& cnf = {});

    // Generic access by name; initializes with defaults on first use.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> blobfs()  { return get("blobfs"); }
    static std::shared_ptr<spdlog::logger> storage() { return get("storage"); }
    static std::shared_ptr<spdlog::logger> cloud()   { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> config()  { return get("config"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
