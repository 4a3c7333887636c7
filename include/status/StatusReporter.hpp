#pragma once

#include "config/Config.hpp"
#include "sync/PassRecord.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json_fwd.hpp>

namespace hs::status {

struct DayFolder {
    std::string name;            // YYYY-MM-DD
    uint64_t log_files = 0;      // *.log directly inside the folder
    uintmax_t bytes = 0;
};

struct TargetStatus {
    std::string label;
    std::filesystem::path local_log_root;
    std::filesystem::path local_data_root;
    std::vector<DayFolder> recent_days;  // newest last
    bool data_synced = false;
    uint64_t data_files = 0;
    uintmax_t data_bytes = 0;
    uint64_t backups = 0;                // files under <data>/backups
};

struct Status {
    bool running = false;
    bool stale_pid_removed = false;
    std::optional<pid_t> pid;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::chrono::seconds interval{0};
    unsigned int failure_ceiling = 0;
    std::chrono::seconds cooldown{0};
    std::filesystem::path activity_log;
    std::optional<std::string> last_activity;
    std::optional<sync::PassSummary> last_pass;
    std::vector<TargetStatus> targets;
};

// Read-only view over the PID file and the local mirror directories.
class StatusReporter {
public:
    static constexpr size_t RECENT_DAYS = 5;

    explicit StatusReporter(config::Config cfg);

    // Removes a stale PID file as a side effect
    [[nodiscard]] Status collect() const;

    [[nodiscard]] static TargetStatus inspectTarget(const types::Target& target);

    [[nodiscard]] static std::string render(const Status& s);

    [[nodiscard]] static std::optional<std::string> lastLine(const std::filesystem::path& file);

    // Print the last `tail` lines of the activity log, then keep printing appended lines
    // until `stop` becomes true. Returns false when the log does not exist yet.
    bool follow(std::ostream& out, const std::atomic<bool>& stop, size_t tail = 10) const;

private:
    config::Config cfg_;
};

void to_json(nlohmann::json& j, const DayFolder& d);
void to_json(nlohmann::json& j, const TargetStatus& t);
void to_json(nlohmann::json& j, const Status& s);

}
