#include "runtime/Supervisor.hpp"
#include "runtime/SyncLoop.hpp"
#include "sync/Orchestrator.hpp"
#include "sync/PassRecord.hpp"
#include "sync/RetryPolicy.hpp"
#include "log/Registry.hpp"
#include "transport/RemoteCopyClient.hpp"
#include "util/Subprocess.hpp"
#include "util/paths.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fmt/format.h>
#include <pthread.h>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace hs::runtime;
using namespace hs::types;

static constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

Supervisor::Supervisor(config::Config cfg,
                       std::shared_ptr<transport::RemoteCopyClient> client,
                       Launcher launcher)
    : cfg_(std::move(cfg)),
      client_(std::move(client)),
      launcher_(std::move(launcher)),
      pidFile_(cfg_.runtime.pid_file) {
    if (!client_) throw std::invalid_argument("Supervisor requires a RemoteCopyClient");
    if (!launcher_) launcher_ = [this] { return launchDefault(); };
}

Supervisor::~Supervisor() = default;

void Supervisor::setOutput(std::ostream& out, std::ostream& err) {
    out_ = &out;
    err_ = &err;
}

hs::sync::Orchestrator& Supervisor::orchestrator() {
    if (!orchestrator_)
        orchestrator_ = std::make_unique<sync::Orchestrator>(client_, sync::Orchestrator::optionsFromConfig(cfg_));
    return *orchestrator_;
}

pid_t Supervisor::launchDefault() const {
    if (cfg_.source_path.empty()) throw std::runtime_error("Cannot launch daemon: config path unknown");
    return util::Subprocess::spawnDetached(paths::getSelfExe(),
                                           {"harborsync", "--config", cfg_.source_path.string(), "daemon"});
}

int Supervisor::start() {
    const auto existing = pidFile_.inspect();

    if (existing.state == PidFile::State::Running) {
        *err_ << fmt::format("Daemon already running (PID: {})\n", *existing.pid);
        log::Registry::supervisor()->warn("[Supervisor] Refusing to start, PID {} holds {}",
                                          *existing.pid, pidFile_.path().string());
        return 1;
    }

    if (existing.state == PidFile::State::Stale) {
        pidFile_.remove();
        log::Registry::supervisor()->info("[Supervisor] Removed stale PID file {} (PID: {})",
                                          pidFile_.path().string(),
                                          existing.pid ? std::to_string(*existing.pid) : "unreadable");
    }

    *out_ << "Starting harborsync daemon...\n";
    runInitialPass();

    const pid_t pid = launcher_();
    pidFile_.write(pid);

    std::this_thread::sleep_for(cfg_.schedule.launch_check);

    if (!PidFile::isAlive(pid)) {
        pidFile_.removeIfOwnedBy(pid);
        *err_ << "Failed to start daemon\n";
        log::Registry::supervisor()->error("[Supervisor] Daemon process {} exited during startup", pid);
        return 1;
    }

    *out_ << fmt::format("Daemon started (PID: {})\n", pid);
    *out_ << fmt::format("Syncing every {}s:\n", cfg_.schedule.interval.count());
    for (const auto& t : cfg_.targets) {
        *out_ << fmt::format("  [{}] Logs -> {}\n", t.label, t.local_log_root.string());
        *out_ << fmt::format("  [{}] Data -> {}\n", t.label, t.local_data_root.string());
    }
    *out_ << fmt::format("Daemon log: {}\n", cfg_.runtime.activity_log.string());

    log::Registry::supervisor()->info("[Supervisor] Daemon launched with PID {}", pid);
    return 0;
}

void Supervisor::runInitialPass() {
    *out_ << "Performing initial sync...\n";
    const auto report = orchestrator().runPass(cfg_.targets, util::today());
    if (!cfg_.runtime.last_pass_file.empty()) (void)sync::PassRecord(cfg_.runtime.last_pass_file).save(report);

    for (const auto& t : report.targets)
        *out_ << fmt::format("  [{}] {} (logs={}, data={})\n",
                             t.label, to_string(t.outcome), describe(t.logs), describe(t.data));

    if (report.outcome == PassOutcome::AllOk) *out_ << "Initial sync complete\n";
    else *out_ << "Initial sync had issues, but continuing...\n";
}

int Supervisor::stop() {
    const auto existing = pidFile_.inspect();

    if (existing.state == PidFile::State::Absent) {
        *out_ << "Daemon not running\n";
        return 0;
    }

    if (existing.state == PidFile::State::Stale) {
        pidFile_.remove();
        *out_ << "Daemon not running (stale PID file)\n";
        return 0;
    }

    const pid_t pid = *existing.pid;
    *out_ << fmt::format("Stopping daemon (PID: {})...\n", pid);

    if (::kill(pid, SIGTERM) != 0 && errno != ESRCH) {
        *err_ << fmt::format("Cannot signal PID {}: {}\n", pid, std::strerror(errno));
        log::Registry::supervisor()->error("[Supervisor] SIGTERM to {} failed: {}", pid, std::strerror(errno));
        return 1;
    }

    const auto grace = std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.schedule.stop_grace);
    if (!waitForExit(pid, grace)) {
        log::Registry::supervisor()->warn("[Supervisor] PID {} ignored SIGTERM for {}s, sending SIGKILL",
                                          pid, cfg_.schedule.stop_grace.count());
        ::kill(pid, SIGKILL);
        if (!waitForExit(pid, std::chrono::seconds(1))) {
            *err_ << fmt::format("Daemon (PID: {}) did not exit after SIGKILL\n", pid);
            return 1;
        }
    }

    // The daemon removes its own PID file on a clean exit; this covers SIGKILL
    pidFile_.remove();
    *out_ << "Daemon stopped\n";
    log::Registry::supervisor()->info("[Supervisor] Daemon {} stopped", pid);
    return 0;
}

int Supervisor::restart() {
    if (const int rc = stop(); rc != 0) return rc;
    std::this_thread::sleep_for(cfg_.schedule.restart_settle);
    return start();
}

bool Supervisor::waitForExit(const pid_t pid, const std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (PidFile::isAlive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    return true;
}

int Supervisor::runDaemon() {
    const pid_t self = ::getpid();

    if (const auto existing = pidFile_.inspect();
        existing.state == PidFile::State::Running && *existing.pid != self) {
        log::Registry::supervisor()->error("[Supervisor] Another instance is already running (PID: {})", *existing.pid);
        return 1;
    }

    // Mask before any worker thread exists so every thread inherits it
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGHUP);
    if (const int rc = ::pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0)
        throw std::runtime_error(fmt::format("pthread_sigmask failed: {}", std::strerror(rc)));

    pidFile_.write(self);

    DaemonState state;
    state.pid = self;
    state.started_at = std::chrono::system_clock::now();

    log::Registry::activity()->info("Daemon started (PID: {})", self);
    log::Registry::supervisor()->info("[Supervisor] Daemon running (PID: {}), interval {}s, {} target(s)",
                                      self, cfg_.schedule.interval.count(), cfg_.targets.size());

    SyncLoop loop(orchestrator(), sync::RetryPolicy::fromConfig(cfg_.schedule), cfg_.targets, state,
                  util::today, cfg_.runtime.last_pass_file);
    loop.start();

    int sig = 0;
    while (::sigwait(&signals, &sig) != 0) {}

    log::Registry::supervisor()->info("[Supervisor] Signal {} received, shutting down", sig);
    loop.stop();

    log::Registry::activity()->info("Daemon stopped");
    pidFile_.removeIfOwnedBy(self);
    return 0;
}
