#include "cli/commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "runtime/Supervisor.hpp"
#include "status/StatusReporter.hpp"
#include "transport/RsyncClient.hpp"
#include "util/paths.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace hs::config;
using namespace hs::runtime;
using namespace hs::status;
using namespace hs::transport;

namespace {

std::atomic<bool> stopFollowing = false;

void followSignalHandler(int) {
    stopFollowing = true;
}

Supervisor makeSupervisor(const Config& cfg) {
    return Supervisor(cfg, std::make_shared<RsyncClient>(cfg.remote));
}

}

const Config& hs::cli::bootstrap(const CommandCall& call) {
    const auto path = paths::getConfigPath(optVal(call, "config").value_or(optVal(call, "c").value_or("")));
    ConfigRegistry::init(path);
    const auto& cfg = ConfigRegistry::get();
    log::Registry::init(cfg.logging, cfg.runtime);
    return cfg;
}

void hs::cli::registerCommands(Router& router) {
    router.registerCommand("start", "Run an initial sync and start the background daemon", [](const CommandCall& call) {
        return makeSupervisor(bootstrap(call)).start();
    });

    router.registerCommand("stop", "Stop the daemon (SIGTERM, then SIGKILL after the grace period)", [](const CommandCall& call) {
        return makeSupervisor(bootstrap(call)).stop();
    });

    router.registerCommand("restart", "Stop, then start the daemon", [](const CommandCall& call) {
        return makeSupervisor(bootstrap(call)).restart();
    });

    router.registerCommand("status", "Show daemon state and synced folders (--json for machine output)", [](const CommandCall& call) {
        const StatusReporter reporter(bootstrap(call));
        const auto s = reporter.collect();
        if (hasFlag(call, "json")) std::cout << nlohmann::json(s).dump(2) << std::endl;
        else std::cout << StatusReporter::render(s);
        return s.running ? 0 : 1;
    });

    router.registerCommand("logs", "Follow the daemon's activity log", [](const CommandCall& call) {
        const StatusReporter reporter(bootstrap(call));
        std::signal(SIGINT, followSignalHandler);
        std::signal(SIGTERM, followSignalHandler);
        if (!reporter.follow(std::cout, stopFollowing)) std::cout << "No daemon log file yet" << std::endl;
        return 0;
    });

    router.registerCommand("config", "Print the effective configuration", [](const CommandCall& call) {
        std::cout << bootstrap(call).toYaml() << std::endl;
        return 0;
    });

    router.registerCommand("version", "Print the harborsync version", [](const CommandCall&) {
        std::cout << "harborsync " << HS_VERSION << std::endl;
        return 0;
    });

    router.registerCommand("help", "Show this help", [&router](const CommandCall&) {
        std::cout << router.usage();
        return 0;
    });

    // Entry point of the detached process spawned by `start`
    router.registerCommand("daemon", "Run the sync loop in the foreground", [](const CommandCall& call) {
        return makeSupervisor(bootstrap(call)).runDaemon();
    }, true);
}
