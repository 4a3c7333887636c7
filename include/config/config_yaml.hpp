#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace hs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["user"] = rhs.user;
        node["ssh_key"] = rhs.ssh_key.string();
        node["connect_timeout_seconds"] = rhs.connect_timeout.count();
        node["strict_host_key_checking"] = rhs.strict_host_key_checking;
        node["rsync_binary"] = rhs.rsync_binary;
        node["ssh_binary"] = rhs.ssh_binary;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>(rhs.host);
        rhs.user = node["user"].as<std::string>(rhs.user);
        rhs.ssh_key = node["ssh_key"].as<std::string>(rhs.ssh_key.string());
        rhs.connect_timeout = std::chrono::seconds(node["connect_timeout_seconds"].as<long>(rhs.connect_timeout.count()));
        rhs.strict_host_key_checking = node["strict_host_key_checking"].as<std::string>(rhs.strict_host_key_checking);
        rhs.rsync_binary = node["rsync_binary"].as<std::string>(rhs.rsync_binary);
        rhs.ssh_binary = node["ssh_binary"].as<std::string>(rhs.ssh_binary);
        return true;
    }
};

template<>
struct convert<ScheduleConfig> {
    static Node encode(const ScheduleConfig& rhs) {
        Node node;
        node["interval_seconds"] = rhs.interval.count();
        node["failure_ceiling"] = rhs.failure_ceiling;
        node["cooldown_seconds"] = rhs.cooldown.count();
        node["log_window_days"] = rhs.log_window_days;
        node["workers"] = rhs.workers;
        node["stop_grace_seconds"] = rhs.stop_grace.count();
        node["restart_settle_seconds"] = rhs.restart_settle.count();
        node["launch_check_ms"] = rhs.launch_check.count();
        return node;
    }

    static bool decode(const Node& node, ScheduleConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.interval = std::chrono::seconds(node["interval_seconds"].as<long>(rhs.interval.count()));
        rhs.failure_ceiling = node["failure_ceiling"].as<unsigned int>(rhs.failure_ceiling);
        rhs.cooldown = std::chrono::seconds(node["cooldown_seconds"].as<long>(rhs.cooldown.count()));
        rhs.log_window_days = node["log_window_days"].as<unsigned int>(rhs.log_window_days);
        rhs.workers = node["workers"].as<unsigned int>(rhs.workers);
        rhs.stop_grace = std::chrono::seconds(node["stop_grace_seconds"].as<long>(rhs.stop_grace.count()));
        rhs.restart_settle = std::chrono::seconds(node["restart_settle_seconds"].as<long>(rhs.restart_settle.count()));
        rhs.launch_check = std::chrono::milliseconds(node["launch_check_ms"].as<long>(rhs.launch_check.count()));
        return true;
    }
};

template<>
struct convert<ExcludeConfig> {
    static Node encode(const ExcludeConfig& rhs) {
        Node node;
        node["logs"] = rhs.logs;
        node["data"] = rhs.data;
        return node;
    }

    static bool decode(const Node& node, ExcludeConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["logs"]) rhs.logs = node["logs"].as<std::vector<std::string>>();
        if (node["data"]) rhs.data = node["data"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<RuntimeConfig> {
    static Node encode(const RuntimeConfig& rhs) {
        Node node;
        node["pid_file"] = rhs.pid_file.string();
        node["activity_log"] = rhs.activity_log.string();
        node["log_dir"] = rhs.log_dir.string();
        node["last_pass_file"] = rhs.last_pass_file.string();
        return node;
    }

    static bool decode(const Node& node, RuntimeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.pid_file = node["pid_file"].as<std::string>(rhs.pid_file.string());
        rhs.activity_log = node["activity_log"].as<std::string>(rhs.activity_log.string());
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        rhs.last_pass_file = node["last_pass_file"].as<std::string>(rhs.last_pass_file.string());
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["harborsync"] = to_std_string(spdlog::level::to_string_view(rhs.harborsync));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["transport"]  = to_std_string(spdlog::level::to_string_view(rhs.transport));
        node["supervisor"] = to_std_string(spdlog::level::to_string_view(rhs.supervisor));
        node["status"]     = to_std_string(spdlog::level::to_string_view(rhs.status));
        node["cli"]        = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.harborsync = levelOr(node["harborsync"], rhs.harborsync);
        rhs.sync       = levelOr(node["sync"], rhs.sync);
        rhs.transport  = levelOr(node["transport"], rhs.transport);
        rhs.supervisor = levelOr(node["supervisor"], rhs.supervisor);
        rhs.status     = levelOr(node["status"], rhs.status);
        rhs.cli        = levelOr(node["cli"], rhs.cli);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.file_log_level));
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.levels.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.levels.console_log_level = levelOr(node["console_log_level"], rhs.levels.console_log_level);
        rhs.levels.file_log_level = levelOr(node["file_log_level"], rhs.levels.file_log_level);
        if (const auto sub = node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(sub, rhs.levels.subsystem_levels);
        return true;
    }
};

template<>
struct convert<hs::types::Target> {
    static Node encode(const hs::types::Target& rhs) {
        Node node;
        node["label"] = rhs.label;
        node["remote_log_root"] = rhs.remote_log_root.string();
        node["remote_data_root"] = rhs.remote_data_root.string();
        node["local_log_root"] = rhs.local_log_root.string();
        node["local_data_root"] = rhs.local_data_root.string();
        return node;
    }

    static bool decode(const Node& node, hs::types::Target& rhs) {
        if (!node.IsMap()) return false;
        rhs.label = node["label"].as<std::string>(std::string{});
        rhs.remote_log_root = node["remote_log_root"].as<std::string>(std::string{});
        rhs.remote_data_root = node["remote_data_root"].as<std::string>(std::string{});
        rhs.local_log_root = node["local_log_root"].as<std::string>(std::string{});
        rhs.local_data_root = node["local_data_root"].as<std::string>(std::string{});
        return true;
    }
};

}
