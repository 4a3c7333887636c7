#pragma once

#include "concurrency/AsyncService.hpp"
#include "sync/RetryPolicy.hpp"
#include "types/DaemonState.hpp"
#include "types/Target.hpp"
#include "util/date.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <vector>

namespace hs::sync { class Orchestrator; }

namespace hs::runtime {

// The Running state: pass, retry decision, preemptible sleep, repeat until stop().
// Each finished pass is recorded to `lastPassFile` when one is given.
class SyncLoop final : public concurrency::AsyncService {
public:
    SyncLoop(sync::Orchestrator& orchestrator,
             sync::RetryPolicy policy,
             std::vector<types::Target> targets,
             types::DaemonState initial,
             std::function<util::Date()> today = util::today,
             std::filesystem::path lastPassFile = {});

    ~SyncLoop() override;

    [[nodiscard]] types::DaemonState state() const;

    [[nodiscard]] unsigned long passes() const;

protected:
    void runLoop() override;

private:
    sync::Orchestrator& orchestrator_;
    sync::RetryPolicy policy_;
    std::vector<types::Target> targets_;
    std::function<util::Date()> today_;
    std::filesystem::path lastPassFile_; // empty: pass reports are not persisted

    mutable std::mutex stateMutex_;
    types::DaemonState state_;
    unsigned long passes_{0};
};

}
