#include "sync/PassRecord.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace hs::sync;
using namespace hs::types;

namespace fs = std::filesystem;

PassRecord::PassRecord(fs::path path) : path_(std::move(path)) {}

bool PassRecord::save(const PassReport& report) const {
    std::error_code ec;
    if (const auto dir = path_.parent_path(); !dir.empty()) fs::create_directories(dir, ec);

    const auto tmp = fs::path(path_.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            log::Registry::sync()->warn("[PassRecord] Cannot open {} for writing", tmp.string());
            return false;
        }
        out << nlohmann::json(report).dump(2) << '\n';
        if (!out) {
            log::Registry::sync()->warn("[PassRecord] Failed to write {}", tmp.string());
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        log::Registry::sync()->warn("[PassRecord] Failed to install {}: {}", path_.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

std::optional<PassSummary> PassRecord::load() const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;

    try {
        const auto j = nlohmann::json::parse(in);
        PassSummary s;
        s.outcome = j.at("outcome").get<std::string>();
        s.finished_at = j.value("finished_at", std::string{});
        for (const auto& t : j.value("targets", nlohmann::json::array())) {
            const auto outcome = t.value("outcome", std::string{});
            if (outcome == to_string(TargetOutcome::OK)) ++s.ok;
            else if (outcome == to_string(TargetOutcome::Partial)) ++s.partial;
            else if (outcome == to_string(TargetOutcome::Failed)) ++s.failed;
        }
        return s;
    } catch (const nlohmann::json::exception& e) {
        log::Registry::status()->debug("[PassRecord] Ignoring unreadable {}: {}", path_.string(), e.what());
        return std::nullopt;
    }
}
