#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/paths.hpp"

#include <cstdlib>
#include <fmt/core.h>
#include <stdexcept>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace hs::config {

std::string RemoteConfig::destination() const {
    if (user.empty()) return host;
    return user + "@" + host;
}

Config defaultConfig() {
    Config cfg;
    cfg.runtime.pid_file = paths::getDefaultPidFile();
    cfg.runtime.activity_log = paths::getDefaultActivityLog();
    cfg.runtime.log_dir = paths::getStateDir();
    cfg.runtime.last_pass_file = paths::getStateDir() / "last-pass.json";
    return cfg;
}

Config loadConfig(const fs::path& path) {
    if (!fs::exists(path)) throw std::runtime_error(fmt::format("Config file not found: {}", path.string()));

    Config cfg = defaultConfig();
    cfg.source_path = fs::absolute(path);

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }

    try {
        if (auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);
        if (auto node = root["schedule"]) YAML::convert<ScheduleConfig>::decode(node, cfg.schedule);
        if (auto node = root["excludes"]) YAML::convert<ExcludeConfig>::decode(node, cfg.excludes);
        if (auto node = root["runtime"]) YAML::convert<RuntimeConfig>::decode(node, cfg.runtime);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

        if (auto node = root["targets"]) {
            if (!node.IsSequence()) throw std::runtime_error("'targets' must be a list");
            for (const auto& t : node) {
                types::Target target;
                if (!YAML::convert<types::Target>::decode(t, target))
                    throw std::runtime_error("every entry under 'targets' must be a map");
                cfg.targets.push_back(std::move(target));
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Invalid value in config {}: {}", path.string(), e.what()));
    }

    applyEnvironmentOverrides(cfg);
    expandPaths(cfg);
    cfg.validate();
    return cfg;
}

void applyEnvironmentOverrides(Config& cfg) {
    const auto env = [](const char* name) -> const char* {
        const char* v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    };

    if (const auto* v = env("HARBORSYNC_REMOTE_HOST")) cfg.remote.host = v;
    if (const auto* v = env("HARBORSYNC_REMOTE_USER")) cfg.remote.user = v;
    if (const auto* v = env("HARBORSYNC_SSH_KEY")) cfg.remote.ssh_key = v;
    if (const auto* v = env("HARBORSYNC_INTERVAL")) {
        const std::string text = v;
        size_t consumed = 0;
        long seconds = 0;
        try {
            seconds = std::stol(text, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != text.size())
            throw std::runtime_error(fmt::format("HARBORSYNC_INTERVAL is not a number: '{}'", text));
        cfg.schedule.interval = std::chrono::seconds(seconds);
    }
}

void expandPaths(Config& cfg) {
    if (!cfg.remote.ssh_key.empty()) cfg.remote.ssh_key = paths::expandHome(cfg.remote.ssh_key);
    cfg.runtime.pid_file = paths::expandHome(cfg.runtime.pid_file);
    cfg.runtime.activity_log = paths::expandHome(cfg.runtime.activity_log);
    cfg.runtime.log_dir = paths::expandHome(cfg.runtime.log_dir);
    cfg.runtime.last_pass_file = paths::expandHome(cfg.runtime.last_pass_file);
    for (auto& t : cfg.targets) {
        t.local_log_root = paths::expandHome(t.local_log_root);
        t.local_data_root = paths::expandHome(t.local_data_root);
    }
}

void Config::validate() const {
    if (remote.host.empty()) throw std::runtime_error("remote.host is required");
    if (remote.connect_timeout.count() <= 0) throw std::runtime_error("remote.connect_timeout_seconds must be positive");
    if (schedule.interval.count() <= 0) throw std::runtime_error("schedule.interval_seconds must be positive");
    if (schedule.failure_ceiling == 0) throw std::runtime_error("schedule.failure_ceiling must be at least 1");
    if (schedule.cooldown.count() < 0) throw std::runtime_error("schedule.cooldown_seconds must not be negative");
    if (schedule.log_window_days == 0) throw std::runtime_error("schedule.log_window_days must be at least 1");
    if (schedule.workers == 0) throw std::runtime_error("schedule.workers must be at least 1");
    if (runtime.pid_file.empty()) throw std::runtime_error("runtime.pid_file is required");
    if (runtime.activity_log.empty()) throw std::runtime_error("runtime.activity_log is required");
    if (targets.empty()) throw std::runtime_error("at least one entry under 'targets' is required");

    std::unordered_set<std::string> labels;
    for (const auto& t : targets) {
        if (t.label.empty()) throw std::runtime_error("every target needs a label");
        if (!labels.insert(t.label).second) throw std::runtime_error(fmt::format("duplicate target label '{}'", t.label));
        if (t.remote_log_root.empty() || t.remote_data_root.empty() ||
            t.local_log_root.empty() || t.local_data_root.empty())
            throw std::runtime_error(fmt::format("target '{}' must set all four log/data roots", t.label));
    }
}

std::string Config::toYaml() const {
    YAML::Node root;
    root["remote"] = YAML::convert<RemoteConfig>::encode(remote);
    root["schedule"] = YAML::convert<ScheduleConfig>::encode(schedule);
    root["excludes"] = YAML::convert<ExcludeConfig>::encode(excludes);
    root["runtime"] = YAML::convert<RuntimeConfig>::encode(runtime);
    root["logging"] = YAML::convert<LoggingConfig>::encode(logging);
    for (const auto& t : targets) root["targets"].push_back(YAML::convert<types::Target>::encode(t));

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
