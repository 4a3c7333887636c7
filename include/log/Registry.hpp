#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hs::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& logging, const config::RuntimeConfig& runtime);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> harborsync() { return get("harborsync"); }
    static std::shared_ptr<spdlog::logger> sync()       { return get("sync"); }
    static std::shared_ptr<spdlog::logger> transport()  { return get("transport"); }
    static std::shared_ptr<spdlog::logger> supervisor() { return get("supervisor"); }
    static std::shared_ptr<spdlog::logger> status()     { return get("status"); }
    static std::shared_ptr<spdlog::logger> cli()        { return get("cli"); }

    // Append-only operator-facing activity log (the file `harborsync logs` follows)
    static std::shared_ptr<spdlog::logger> activity()   { return get("activity"); }

    [[nodiscard]] static bool isInitialized();

    [[nodiscard]] static const std::filesystem::path& activityLogPath() { return activity_log_path_; }

    // Drop all loggers so init() can run again (tests, re-exec after fork)
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* ACTIVITY_FORMAT = "[%Y-%m-%d %H:%M:%S] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;
    static inline std::filesystem::path activity_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>    activity_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
