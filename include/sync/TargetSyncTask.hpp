#pragma once

#include "concurrency/Task.hpp"
#include "types/Outcome.hpp"
#include "types/Target.hpp"
#include "util/date.hpp"

namespace hs::sync {

class Orchestrator;

struct TargetSyncTask final : concurrency::PromisedTask<types::TargetReport> {
    TargetSyncTask(Orchestrator& orchestrator, types::Target target, util::Date today);

    void operator()() override;

private:
    Orchestrator& orchestrator_;
    types::Target target_;
    util::Date today_;
};

}
