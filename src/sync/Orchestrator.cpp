#include "sync/Orchestrator.hpp"
#include "sync/TargetSyncTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "transport/RemoteCopyClient.hpp"

#include <algorithm>
#include <chrono>
#include <fmt/format.h>
#include <future>
#include <stdexcept>

using namespace hs::sync;
using namespace hs::types;
using namespace hs::transport;
using namespace hs::concurrency;

Orchestrator::Orchestrator(std::shared_ptr<RemoteCopyClient> client, Options opts)
    : client_(std::move(client)), opts_(std::move(opts)) {
    if (!client_) throw std::invalid_argument("Orchestrator requires a RemoteCopyClient");
    if (opts_.log_window_days == 0) opts_.log_window_days = 1;
    if (opts_.workers > 1) pool_ = std::make_unique<ThreadPool>(opts_.workers);
}

Orchestrator::~Orchestrator() {
    if (pool_) pool_->stop();
}

Orchestrator::Options Orchestrator::optionsFromConfig(const config::Config& cfg) {
    Options opts{
        .log_window_days = cfg.schedule.log_window_days,
        .workers = cfg.schedule.workers,
        .log_excludes = cfg.excludes.logs,
        .data_excludes = cfg.excludes.data
    };

    if (const auto name = cfg.runtime.activity_log.filename().string();
        !name.empty() && std::ranges::find(opts.log_excludes, name) == opts.log_excludes.end())
        opts.log_excludes.push_back(name);

    return opts;
}

PassReport Orchestrator::runPass(const std::vector<Target>& targets, const util::Date& today) {
    PassReport report;
    report.started_at = std::chrono::system_clock::now();

    log::Registry::sync()->debug("[Orchestrator] Starting pass over {} target(s) for {}",
                                 targets.size(), util::toString(today));

    report.targets = pool_ && targets.size() > 1 ? runParallel(targets, today) : runSequential(targets, today);
    report.outcome = aggregate(report.targets);
    report.finished_at = std::chrono::system_clock::now();

    logPass(report);
    return report;
}

std::vector<TargetReport> Orchestrator::runSequential(const std::vector<Target>& targets, const util::Date& today) {
    std::vector<TargetReport> out;
    out.reserve(targets.size());
    for (const auto& t : targets) {
        try {
            out.push_back(syncTarget(t, today));
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[Orchestrator] [{}] Unexpected error: {}", t.label, e.what());
            TargetReport failed{t.label, SyncResult::failed(e.what()), SyncResult::failed(e.what()), TargetOutcome::Failed};
            logTarget(failed);
            out.push_back(std::move(failed));
        }
    }
    return out;
}

std::vector<TargetReport> Orchestrator::runParallel(const std::vector<Target>& targets, const util::Date& today) {
    std::vector<std::future<TargetReport>> futures;
    futures.reserve(targets.size());

    for (const auto& t : targets) {
        auto task = std::make_shared<TargetSyncTask>(*this, t, today);
        futures.push_back(task->getFuture());
        pool_->submit(task);
    }

    // Barrier: every target finishes before the pass is classified
    std::vector<TargetReport> out;
    out.reserve(targets.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            out.push_back(futures[i].get());
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[Orchestrator] [{}] Unexpected error: {}", targets[i].label, e.what());
            TargetReport failed{targets[i].label, SyncResult::failed(e.what()), SyncResult::failed(e.what()), TargetOutcome::Failed};
            logTarget(failed);
            out.push_back(std::move(failed));
        }
    }
    return out;
}

TargetReport Orchestrator::syncTarget(const Target& target, const util::Date& today) {
    TargetReport report;
    report.label = target.label;
    report.logs = syncLogs(target, today);
    report.data = syncData(target);
    report.outcome = classify(report.logs, report.data);
    logTarget(report);
    return report;
}

SyncResult Orchestrator::syncLogs(const Target& target, const util::Date& today) {
    unsigned int mirrored = 0, failed = 0, absent = 0;
    bool unreachable = false;

    for (const auto& day : util::window(today, opts_.log_window_days)) {
        const auto folder = util::toString(day);
        const auto remote = target.remote_log_root / folder;

        const auto presence = client_->probe(remote);
        if (presence == Presence::Unreachable) {
            unreachable = true;
            break;
        }
        if (presence == Presence::Absent) {
            ++absent;
            log::Registry::sync()->debug("[Orchestrator] [{}] No remote logs for {}", target.label, folder);
            continue;
        }

        const MirrorRequest req{
            .remote = remote,
            .local = target.local_log_root / folder,
            .excludes = opts_.log_excludes,
            .delete_extraneous = true
        };

        if (client_->mirror(req)) ++mirrored;
        else ++failed;
    }

    if (unreachable) return SyncResult::failed("remote unreachable");
    if (failed > 0) return SyncResult::failed(fmt::format("{} of {} log folder(s) failed", failed, failed + mirrored));
    if (mirrored == 0 && absent > 0) return SyncResult::skipped("no log folders in window");
    return SyncResult::success();
}

SyncResult Orchestrator::syncData(const Target& target) {
    switch (client_->probe(target.remote_data_root)) {
    case Presence::Unreachable:
        return SyncResult::failed("remote unreachable");
    case Presence::Absent:
        log::Registry::sync()->info("[Orchestrator] [{}] No remote data root at {}, skipping data",
                                    target.label, target.remote_data_root.string());
        return SyncResult::skipped("no remote data root");
    case Presence::Present:
        break;
    }

    const MirrorRequest req{
        .remote = target.remote_data_root,
        .local = target.local_data_root,
        .excludes = opts_.data_excludes,
        .delete_extraneous = false
    };

    if (client_->mirror(req)) return SyncResult::success();
    return SyncResult::failed("transfer failed");
}

void Orchestrator::logTarget(const TargetReport& report) {
    const auto detail = fmt::format("logs={}, data={}", describe(report.logs), describe(report.data));

    switch (report.outcome) {
    case TargetOutcome::OK:
        log::Registry::activity()->info("[{}] Sync successful ({})", report.label, detail);
        log::Registry::sync()->info("[{}] Sync successful ({})", report.label, detail);
        break;
    case TargetOutcome::Partial:
        log::Registry::activity()->info("[{}] Partial sync ({})", report.label, detail);
        log::Registry::sync()->warn("[{}] Partial sync ({})", report.label, detail);
        break;
    case TargetOutcome::Failed:
        log::Registry::activity()->info("[{}] Sync failed ({})", report.label, detail);
        log::Registry::sync()->warn("[{}] Sync failed ({})", report.label, detail);
        break;
    }
}

void Orchestrator::logPass(const PassReport& report) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(report.finished_at - report.started_at);
    const auto line = fmt::format("Pass {}: {} ok, {} partial, {} failed ({:.1f}s)",
                                  to_string(report.outcome),
                                  report.count(TargetOutcome::OK),
                                  report.count(TargetOutcome::Partial),
                                  report.count(TargetOutcome::Failed),
                                  static_cast<double>(elapsed.count()) / 1000.0);
    log::Registry::activity()->info(line);
    log::Registry::sync()->info("[Orchestrator] {}", line);
}
