#include "status/StatusReporter.hpp"
#include "runtime/PidFile.hpp"
#include "log/Registry.hpp"
#include "util/bytes.hpp"
#include "util/date.hpp"

#include <algorithm>
#include <deque>
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <thread>

using namespace hs::status;

namespace fs = std::filesystem;

namespace {

struct TreeSize {
    uint64_t files = 0;
    uintmax_t bytes = 0;
};

TreeSize measure(const fs::path& root) {
    TreeSize out;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        ++out.files;
        if (const auto sz = it->file_size(fec); !fec) out.bytes += sz;
    }
    return out;
}

}

StatusReporter::StatusReporter(config::Config cfg) : cfg_(std::move(cfg)) {}

Status StatusReporter::collect() const {
    Status s;
    s.interval = cfg_.schedule.interval;
    s.failure_ceiling = cfg_.schedule.failure_ceiling;
    s.cooldown = cfg_.schedule.cooldown;
    s.activity_log = cfg_.runtime.activity_log;
    s.last_activity = lastLine(cfg_.runtime.activity_log);
    if (!cfg_.runtime.last_pass_file.empty()) s.last_pass = sync::PassRecord(cfg_.runtime.last_pass_file).load();

    const runtime::PidFile pidFile(cfg_.runtime.pid_file);
    const auto inspection = pidFile.inspect();

    if (inspection.state == runtime::PidFile::State::Running) {
        s.running = true;
        s.pid = inspection.pid;
        s.started_at = pidFile.modifiedAt();
    } else if (inspection.state == runtime::PidFile::State::Stale) {
        s.stale_pid_removed = pidFile.remove();
        log::Registry::status()->info("[StatusReporter] Removed stale PID file {}", cfg_.runtime.pid_file.string());
    }

    for (const auto& t : cfg_.targets) s.targets.push_back(inspectTarget(t));
    return s;
}

TargetStatus StatusReporter::inspectTarget(const types::Target& target) {
    TargetStatus ts;
    ts.label = target.label;
    ts.local_log_root = target.local_log_root;
    ts.local_data_root = target.local_data_root;

    std::error_code ec, fec;
    std::vector<fs::path> days;
    for (fs::directory_iterator it(target.local_log_root, ec), end; !ec && it != end; it.increment(ec))
        if (it->is_directory(fec) && util::isDateFolderName(it->path().filename().string())) days.push_back(it->path());

    std::ranges::sort(days);
    const auto first = days.size() > RECENT_DAYS ? days.end() - static_cast<std::ptrdiff_t>(RECENT_DAYS) : days.begin();

    for (auto it = first; it != days.end(); ++it) {
        DayFolder d;
        d.name = it->filename().string();
        std::error_code dec;
        for (fs::directory_iterator f(*it, dec), end; !dec && f != end; f.increment(dec))
            if (f->is_regular_file(fec) && f->path().extension() == ".log") ++d.log_files;
        d.bytes = measure(*it).bytes;
        ts.recent_days.push_back(std::move(d));
    }

    if (fs::is_directory(target.local_data_root, fec)) {
        ts.data_synced = true;
        const auto size = measure(target.local_data_root);
        ts.data_files = size.files;
        ts.data_bytes = size.bytes;
        if (const auto backups = target.local_data_root / "backups"; fs::is_directory(backups, fec))
            ts.backups = measure(backups).files;
    }

    return ts;
}

std::string StatusReporter::render(const Status& s) {
    std::string out;

    if (s.running) {
        out += fmt::format("Daemon is running (PID: {})\n", *s.pid);
        if (s.started_at) out += fmt::format("Started: {}\n", util::formatTimestamp(*s.started_at));
    } else if (s.stale_pid_removed) {
        out += "Daemon not running (stale PID file removed)\n";
    } else {
        out += "Daemon not running\n";
    }

    out += fmt::format("Sync interval: {}s (cooldown {}s after {} failed passes)\n",
                       s.interval.count(), s.cooldown.count(), s.failure_ceiling);
    if (s.last_activity) out += fmt::format("Last activity: {}\n", *s.last_activity);
    if (s.last_pass)
        out += fmt::format("Last pass: {} at {} ({} ok, {} partial, {} failed)\n", s.last_pass->outcome,
                           s.last_pass->finished_at, s.last_pass->ok, s.last_pass->partial, s.last_pass->failed);

    for (const auto& t : s.targets) {
        out += fmt::format("\n[{}]\n", t.label);
        out += fmt::format("Log dir: {}\n", t.local_log_root.string());
        if (t.recent_days.empty()) out += "  (no log folders synced yet)\n";
        else out += "Recent synced log folders:\n";
        for (const auto& d : t.recent_days)
            out += fmt::format("  {}/ ({} logs, {})\n", d.name, d.log_files, util::humanBytes(d.bytes));

        out += fmt::format("Data dir: {}\n", t.local_data_root.string());
        if (!t.data_synced) {
            out += "  (not synced yet)\n";
            continue;
        }
        out += fmt::format("  Files: {} ({})\n", t.data_files, util::humanBytes(t.data_bytes));
        out += fmt::format("  Backups: {}\n", t.backups);
    }

    return out;
}

std::optional<std::string> StatusReporter::lastLine(const fs::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) return std::nullopt;

    std::string line, last;
    while (std::getline(in, line))
        if (!line.empty()) last = line;

    if (last.empty()) return std::nullopt;
    return last;
}

bool StatusReporter::follow(std::ostream& out, const std::atomic<bool>& stop, const size_t tail) const {
    std::ifstream in(cfg_.runtime.activity_log);
    if (!in.is_open()) return false;

    // A line without its trailing newline is still being written; hold it
    // back until the rest of it arrives.
    std::deque<std::string> lines;
    std::string line, pending;
    while (std::getline(in, line)) {
        if (in.eof()) {
            pending = line;
            break;
        }
        lines.push_back(line);
        if (lines.size() > tail) lines.pop_front();
    }
    for (const auto& l : lines) out << l << '\n';
    out.flush();

    while (!stop.load()) {
        in.clear();
        while (std::getline(in, line)) {
            if (in.eof()) {
                pending += line;
                break;
            }
            out << pending << line << '\n';
            pending.clear();
        }
        out.flush();
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    return true;
}

void hs::status::to_json(nlohmann::json& j, const DayFolder& d) {
    j = {
        {"name", d.name},
        {"log_files", d.log_files},
        {"bytes", d.bytes}
    };
}

void hs::status::to_json(nlohmann::json& j, const TargetStatus& t) {
    j = {
        {"label", t.label},
        {"local_log_root", t.local_log_root.string()},
        {"local_data_root", t.local_data_root.string()},
        {"recent_days", t.recent_days},
        {"data_synced", t.data_synced},
        {"data_files", t.data_files},
        {"data_bytes", t.data_bytes},
        {"backups", t.backups}
    };
}

void hs::status::to_json(nlohmann::json& j, const Status& s) {
    j = {
        {"running", s.running},
        {"stale_pid_removed", s.stale_pid_removed},
        {"pid", s.pid ? nlohmann::json(*s.pid) : nlohmann::json(nullptr)},
        {"started_at", s.started_at ? nlohmann::json(util::formatTimestamp(*s.started_at)) : nlohmann::json(nullptr)},
        {"interval_seconds", s.interval.count()},
        {"failure_ceiling", s.failure_ceiling},
        {"cooldown_seconds", s.cooldown.count()},
        {"activity_log", s.activity_log.string()},
        {"last_activity", s.last_activity ? nlohmann::json(*s.last_activity) : nlohmann::json(nullptr)},
        {"last_pass", nullptr},
        {"targets", s.targets}
    };
    if (s.last_pass) {
        j["last_pass"] = {
            {"outcome", s.last_pass->outcome},
            {"finished_at", s.last_pass->finished_at},
            {"ok", s.last_pass->ok},
            {"partial", s.last_pass->partial},
            {"failed", s.last_pass->failed}
        };
    }
}
