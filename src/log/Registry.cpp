#include "log/Registry.hpp"

#include <filesystem>
#include <stdexcept>

namespace hs::log {

void Registry::init(const config::LoggingConfig& logging, const config::RuntimeConfig& runtime) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;

    log_dir_ = runtime.log_dir.empty() ? runtime.activity_log.parent_path() : runtime.log_dir;
    main_log_path_ = log_dir_ / "harborsync.log";
    activity_log_path_ = runtime.activity_log;

    if (!log_dir_.empty() && !fs::exists(log_dir_)) fs::create_directories(log_dir_);
    if (const auto dir = activity_log_path_.parent_path(); !dir.empty() && !fs::exists(dir))
        fs::create_directories(dir);

    const auto& levels = logging.levels;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = levels.subsystem_levels;
    makeLogger("harborsync", sub_levels.harborsync);
    makeLogger("sync",       sub_levels.sync);
    makeLogger("transport",  sub_levels.transport);
    makeLogger("supervisor", sub_levels.supervisor);
    makeLogger("status",     sub_levels.status);
    makeLogger("cli",        sub_levels.cli);

    // activity: file-only sink (append)
    {
        activity_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            activity_log_path_.string(), /*truncate=*/false);
        activity_file_sink_->set_pattern(ACTIVITY_FORMAT);
        std::vector<spdlog::sink_ptr> sinks = { activity_file_sink_ };
        const auto logger = std::make_shared<spdlog::logger>("activity", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    harborsync()->debug("[Registry] Initialized (log dir: {})", log_dir_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : {"harborsync", "sync", "transport", "supervisor", "status", "cli", "activity"}) {
        if (const auto lg = spdlog::get(name)) lg->flush();
        spdlog::drop(name);
    }
    console_sink_.reset();
    main_file_sink_.reset();
    activity_file_sink_.reset();
    initialized_ = false;
}

}
