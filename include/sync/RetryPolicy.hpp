#pragma once

#include "types/DaemonState.hpp"
#include "config/Config.hpp"

#include <chrono>

namespace hs::sync {

// Fixed-interval polling with one escalation step: after `failure_ceiling` consecutive
// AllFailed passes the loop waits `cooldown` instead of the base interval and starts
// counting again from zero. No jitter, no coordination between daemons.
class RetryPolicy {
public:
    struct Options {
        std::chrono::seconds base_interval{30};
        unsigned int failure_ceiling = 10;
        std::chrono::seconds cooldown{300};
    };

    struct Decision {
        std::chrono::seconds delay;
        bool cooldown = false;
    };

    explicit RetryPolicy(Options opts);

    static RetryPolicy fromConfig(const config::ScheduleConfig& schedule);

    // Counts consecutive AllFailed passes; any other outcome resets the count.
    [[nodiscard]] types::DaemonState update(types::DaemonState state, types::PassOutcome outcome) const;

    // Delay after a pass, given the state already updated for that pass.
    [[nodiscard]] std::chrono::seconds nextDelay(const types::DaemonState& state,
                                                 types::PassOutcome outcome,
                                                 std::chrono::seconds baseInterval) const;

    // update + nextDelay + reset-after-cooldown, with activity logging. Mutates `state`.
    Decision observe(types::DaemonState& state, types::PassOutcome outcome) const;

    [[nodiscard]] const Options& options() const { return opts_; }

private:
    Options opts_;
};

}
