#pragma once

#include "types/Outcome.hpp"

#include <chrono>
#include <optional>
#include <sys/types.h>

namespace hs::types {

// Lives for as long as the daemon holds the PID file.
struct DaemonState {
    pid_t pid{0};
    unsigned int consecutive_failure_count{0};
    std::optional<PassOutcome> last_pass_outcome;
    std::chrono::system_clock::time_point started_at;
};

}
