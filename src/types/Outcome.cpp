#include "types/Outcome.hpp"
#include "util/date.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace hs::types;

unsigned int PassReport::count(const TargetOutcome o) const {
    return static_cast<unsigned int>(std::ranges::count_if(targets, [o](const auto& t) { return t.outcome == o; }));
}

TargetOutcome hs::types::classify(const SyncResult& logs, const SyncResult& data) {
    const auto failed = static_cast<int>(logs.isFailed()) + static_cast<int>(data.isFailed());
    const auto succeeded = static_cast<int>(logs.isSuccess()) + static_cast<int>(data.isSuccess());

    if (failed == 0) return TargetOutcome::OK;
    if (succeeded == 0) return TargetOutcome::Failed;
    return TargetOutcome::Partial;
}

PassOutcome hs::types::aggregate(const std::vector<TargetOutcome>& outcomes) {
    if (std::ranges::all_of(outcomes, [](const auto o) { return o == TargetOutcome::OK; }))
        return PassOutcome::AllOk;
    if (std::ranges::all_of(outcomes, [](const auto o) { return o == TargetOutcome::Failed; }))
        return PassOutcome::AllFailed;
    return PassOutcome::SomeDegraded;
}

PassOutcome hs::types::aggregate(const std::vector<TargetReport>& reports) {
    std::vector<TargetOutcome> outcomes;
    outcomes.reserve(reports.size());
    for (const auto& r : reports) outcomes.push_back(r.outcome);
    return aggregate(outcomes);
}

std::string hs::types::to_string(const SyncResult::Status s) {
    switch (s) {
    case SyncResult::Status::Success: return "success";
    case SyncResult::Status::Failed: return "failed";
    case SyncResult::Status::Skipped: return "skipped";
    default: throw std::invalid_argument("Unknown sync result status");
    }
}

std::string hs::types::to_string(const TargetOutcome o) {
    switch (o) {
    case TargetOutcome::OK: return "ok";
    case TargetOutcome::Partial: return "partial";
    case TargetOutcome::Failed: return "failed";
    default: throw std::invalid_argument("Unknown target outcome");
    }
}

std::string hs::types::to_string(const PassOutcome o) {
    switch (o) {
    case PassOutcome::AllOk: return "all_ok";
    case PassOutcome::SomeDegraded: return "some_degraded";
    case PassOutcome::AllFailed: return "all_failed";
    default: throw std::invalid_argument("Unknown pass outcome");
    }
}

std::string hs::types::describe(const SyncResult& r) {
    if (r.reason.empty()) return to_string(r.status);
    return to_string(r.status) + " (" + r.reason + ")";
}

void hs::types::to_json(nlohmann::json& j, const SyncResult& r) {
    j = {{"status", to_string(r.status)}};
    if (!r.reason.empty()) j["reason"] = r.reason;
}

void hs::types::to_json(nlohmann::json& j, const TargetReport& r) {
    j = {
        {"label", r.label},
        {"logs", r.logs},
        {"data", r.data},
        {"outcome", to_string(r.outcome)}
    };
}

void hs::types::to_json(nlohmann::json& j, const PassReport& r) {
    j = {
        {"outcome", to_string(r.outcome)},
        {"started_at", util::formatTimestamp(r.started_at)},
        {"finished_at", util::formatTimestamp(r.finished_at)},
        {"targets", r.targets}
    };
}
