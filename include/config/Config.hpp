#pragma once

#include "types/Target.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace hs::config {

struct RemoteConfig {
    std::string host;
    std::string user = "root";
    std::filesystem::path ssh_key;
    std::chrono::seconds connect_timeout{10};
    std::string strict_host_key_checking = "no";
    std::string rsync_binary = "rsync";
    std::string ssh_binary = "ssh";

    // user@host, or bare host when no user is configured
    [[nodiscard]] std::string destination() const;
};

struct ScheduleConfig {
    std::chrono::seconds interval{30};
    unsigned int failure_ceiling = 10;
    std::chrono::seconds cooldown{300};
    unsigned int log_window_days = 2;
    unsigned int workers = 1;
    std::chrono::seconds stop_grace{2};
    std::chrono::seconds restart_settle{1};
    std::chrono::milliseconds launch_check{1000};
};

struct ExcludeConfig {
    std::vector<std::string> logs;
    std::vector<std::string> data = {"temp_media", "cache"};
};

struct RuntimeConfig {
    std::filesystem::path pid_file;
    std::filesystem::path activity_log;
    std::filesystem::path log_dir;
    std::filesystem::path last_pass_file; // JSON report of the most recent pass
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum harborsync = spdlog::level::info;  // startup, shutdown, lifecycle
    spdlog::level::level_enum sync       = spdlog::level::info;  // per-target pass results
    spdlog::level::level_enum transport  = spdlog::level::info;  // rsync/ssh invocations and failures
    spdlog::level::level_enum supervisor = spdlog::level::info;  // PID file, signals, escalation
    spdlog::level::level_enum status     = spdlog::level::warn;
    spdlog::level::level_enum cli        = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    RemoteConfig remote;
    ScheduleConfig schedule;
    ExcludeConfig excludes;
    RuntimeConfig runtime;
    LoggingConfig logging;
    std::vector<types::Target> targets;

    std::filesystem::path source_path; // file this config was loaded from

    // Throws std::runtime_error naming the first problem found.
    void validate() const;

    [[nodiscard]] std::string toYaml() const;
};

// Defaults for every field that has one, including the runtime paths under $HOME.
Config defaultConfig();

Config loadConfig(const std::filesystem::path& path);

// HARBORSYNC_REMOTE_HOST, HARBORSYNC_REMOTE_USER, HARBORSYNC_SSH_KEY, HARBORSYNC_INTERVAL
void applyEnvironmentOverrides(Config& cfg);

// Expand "~" in every local path.
void expandPaths(Config& cfg);

}
