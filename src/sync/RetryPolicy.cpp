#include "sync/RetryPolicy.hpp"
#include "log/Registry.hpp"

using namespace hs::sync;
using namespace hs::types;

RetryPolicy::RetryPolicy(Options opts) : opts_(opts) {}

RetryPolicy RetryPolicy::fromConfig(const config::ScheduleConfig& schedule) {
    return RetryPolicy(Options{
        .base_interval = schedule.interval,
        .failure_ceiling = schedule.failure_ceiling,
        .cooldown = schedule.cooldown
    });
}

DaemonState RetryPolicy::update(DaemonState state, const PassOutcome outcome) const {
    state.last_pass_outcome = outcome;
    if (outcome == PassOutcome::AllFailed) ++state.consecutive_failure_count;
    else state.consecutive_failure_count = 0;
    return state;
}

std::chrono::seconds RetryPolicy::nextDelay(const DaemonState& state,
                                            const PassOutcome outcome,
                                            const std::chrono::seconds baseInterval) const {
    if (outcome == PassOutcome::AllFailed && state.consecutive_failure_count >= opts_.failure_ceiling)
        return opts_.cooldown;
    return baseInterval;
}

RetryPolicy::Decision RetryPolicy::observe(DaemonState& state, const PassOutcome outcome) const {
    state = update(state, outcome);
    const auto delay = nextDelay(state, outcome, opts_.base_interval);

    if (outcome != PassOutcome::AllFailed) return {delay, false};

    log::Registry::activity()->info("Sync failed (attempt {}/{})", state.consecutive_failure_count, opts_.failure_ceiling);

    if (state.consecutive_failure_count < opts_.failure_ceiling) return {delay, false};

    log::Registry::activity()->warn("Too many consecutive failures, waiting {}s before retry", delay.count());
    log::Registry::sync()->warn("[RetryPolicy] {} consecutive failed passes, cooling down for {}s",
                                state.consecutive_failure_count, delay.count());
    state.consecutive_failure_count = 0;
    return {delay, true};
}
