#pragma once

#include "types/Outcome.hpp"
#include "types/Target.hpp"
#include "util/date.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hs::config { struct Config; }
namespace hs::transport { class RemoteCopyClient; }
namespace hs::concurrency { class ThreadPool; }

namespace hs::sync {

class Orchestrator {
public:
    struct Options {
        unsigned int log_window_days = 2;
        unsigned int workers = 1;
        std::vector<std::string> log_excludes;
        std::vector<std::string> data_excludes = {"temp_media", "cache"};
    };

    Orchestrator(std::shared_ptr<transport::RemoteCopyClient> client, Options opts);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Log excludes always carry the activity log's file name
    static Options optionsFromConfig(const config::Config& cfg);

    // One full pass over every target. Never throws for transfer or probe failures.
    types::PassReport runPass(const std::vector<types::Target>& targets, const util::Date& today);

    types::TargetReport syncTarget(const types::Target& target, const util::Date& today);

    types::SyncResult syncLogs(const types::Target& target, const util::Date& today);

    types::SyncResult syncData(const types::Target& target);

    [[nodiscard]] const Options& options() const { return opts_; }

private:
    std::shared_ptr<transport::RemoteCopyClient> client_;
    Options opts_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    std::vector<types::TargetReport> runSequential(const std::vector<types::Target>& targets, const util::Date& today);
    std::vector<types::TargetReport> runParallel(const std::vector<types::Target>& targets, const util::Date& today);

    static void logTarget(const types::TargetReport& report);
    static void logPass(const types::PassReport& report);
};

}
