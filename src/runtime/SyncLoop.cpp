#include "runtime/SyncLoop.hpp"
#include "sync/Orchestrator.hpp"
#include "sync/PassRecord.hpp"
#include "log/Registry.hpp"

using namespace hs::runtime;
using namespace hs::types;

SyncLoop::SyncLoop(sync::Orchestrator& orchestrator,
                   sync::RetryPolicy policy,
                   std::vector<Target> targets,
                   DaemonState initial,
                   std::function<util::Date()> today,
                   std::filesystem::path lastPassFile)
    : AsyncService("SyncLoop"),
      orchestrator_(orchestrator),
      policy_(policy),
      targets_(std::move(targets)),
      today_(std::move(today)),
      lastPassFile_(std::move(lastPassFile)),
      state_(std::move(initial)) {}

SyncLoop::~SyncLoop() { stop(); }

DaemonState SyncLoop::state() const {
    std::scoped_lock lock(stateMutex_);
    return state_;
}

unsigned long SyncLoop::passes() const {
    std::scoped_lock lock(stateMutex_);
    return passes_;
}

void SyncLoop::runLoop() {
    while (!shouldStop()) {
        PassOutcome outcome;
        try {
            const auto report = orchestrator_.runPass(targets_, today_());
            outcome = report.outcome;
            if (!lastPassFile_.empty()) (void)sync::PassRecord(lastPassFile_).save(report);
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[SyncLoop] Pass aborted: {}", e.what());
            outcome = PassOutcome::AllFailed;
        }

        sync::RetryPolicy::Decision decision;
        {
            std::scoped_lock lock(stateMutex_);
            decision = policy_.observe(state_, outcome);
            ++passes_;
        }

        log::Registry::sync()->debug("[SyncLoop] Next pass in {}s", decision.delay.count());
        lazySleep(decision.delay);
    }
}
