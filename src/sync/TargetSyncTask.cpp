#include "sync/TargetSyncTask.hpp"
#include "sync/Orchestrator.hpp"

#include <exception>

using namespace hs::sync;

TargetSyncTask::TargetSyncTask(Orchestrator& orchestrator, types::Target target, const util::Date today)
    : orchestrator_(orchestrator), target_(std::move(target)), today_(today) {}

void TargetSyncTask::operator()() {
    try {
        promise.set_value(orchestrator_.syncTarget(target_, today_));
    } catch (...) {
        // Rethrown by the orchestrator when it joins this task's future
        promise.set_exception(std::current_exception());
    }
}
