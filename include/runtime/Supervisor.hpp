#pragma once

#include "config/Config.hpp"
#include "runtime/PidFile.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <sys/types.h>

namespace hs::transport { class RemoteCopyClient; }
namespace hs::sync { class Orchestrator; }

namespace hs::runtime {

// Daemon lifecycle: Idle -> Starting -> Running -> Stopping -> Idle.
// start/stop/restart run in the operator's process; runDaemon is the detached process.
class Supervisor {
public:
    // Spawns the detached daemon process and returns its PID
    using Launcher = std::function<pid_t()>;

    Supervisor(config::Config cfg,
               std::shared_ptr<transport::RemoteCopyClient> client,
               Launcher launcher = {});

    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Exit codes: 0 success, 1 failure or refusal
    int start();
    int stop();
    int restart();

    // Blocks SIGTERM/SIGINT/SIGHUP on the calling thread and waits for one of them
    // while the sync loop runs. Returns once the loop has stopped and the PID file is gone.
    int runDaemon();

    void setOutput(std::ostream& out, std::ostream& err);

    [[nodiscard]] const PidFile& pidFile() const { return pidFile_; }

private:
    config::Config cfg_;
    std::shared_ptr<transport::RemoteCopyClient> client_;
    Launcher launcher_;
    PidFile pidFile_;
    std::unique_ptr<sync::Orchestrator> orchestrator_;

    std::ostream* out_ = &std::cout;
    std::ostream* err_ = &std::cerr;

    sync::Orchestrator& orchestrator();

    pid_t launchDefault() const;

    bool waitForExit(pid_t pid, std::chrono::milliseconds timeout) const;

    void runInitialPass();
};

}
