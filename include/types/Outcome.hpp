#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace hs::types {

struct SyncResult {
    enum class Status : uint8_t { Success, Failed, Skipped };

    Status status{Status::Success};
    std::string reason;

    static SyncResult success() { return {Status::Success, {}}; }
    static SyncResult failed(std::string why) { return {Status::Failed, std::move(why)}; }
    static SyncResult skipped(std::string why) { return {Status::Skipped, std::move(why)}; }

    [[nodiscard]] bool isSuccess() const noexcept { return status == Status::Success; }
    [[nodiscard]] bool isFailed() const noexcept { return status == Status::Failed; }
    [[nodiscard]] bool isSkipped() const noexcept { return status == Status::Skipped; }
};

enum class TargetOutcome : uint8_t { OK, Partial, Failed };

enum class PassOutcome : uint8_t { AllOk, SomeDegraded, AllFailed };

struct TargetReport {
    std::string label;
    SyncResult logs;
    SyncResult data;
    TargetOutcome outcome{TargetOutcome::OK};
};

struct PassReport {
    std::vector<TargetReport> targets;
    PassOutcome outcome{PassOutcome::AllOk};
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;

    [[nodiscard]] unsigned int count(TargetOutcome o) const;
};

// Skipped subtrees are not applicable: a target fails only through a genuine Failed result.
// Both subtrees skipped means nothing went wrong, so the target is OK.
TargetOutcome classify(const SyncResult& logs, const SyncResult& data);

// All OK => AllOk, all Failed => AllFailed, anything else => SomeDegraded.
PassOutcome aggregate(const std::vector<TargetOutcome>& outcomes);
PassOutcome aggregate(const std::vector<TargetReport>& reports);

std::string to_string(SyncResult::Status s);
std::string to_string(TargetOutcome o);
std::string to_string(PassOutcome o);

// "success", "failed (transfer failed)", "skipped (no remote data root)"
std::string describe(const SyncResult& r);

void to_json(nlohmann::json& j, const SyncResult& r);
void to_json(nlohmann::json& j, const TargetReport& r);
void to_json(nlohmann::json& j, const PassReport& r);

}
