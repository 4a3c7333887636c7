#include <gtest/gtest.h>
#include "sync/Orchestrator.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "FakeRemoteCopyClient.hpp"
#include "TempDir.hpp"

#include <algorithm>

using namespace hs::sync;
using namespace hs::types;
using namespace hs::transport;
using namespace hs::test;
using namespace std::chrono;

class OrchestratorTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<FakeRemoteCopyClient> client = std::make_shared<FakeRemoteCopyClient>();
    const hs::util::Date today = year{2026} / October / 19;
    const std::string todayName = "2026-10-19", yesterdayName = "2026-10-18";

    Target bot = makeTarget("bot", tmp.path());
    Target web = makeTarget("web", tmp.path());

    Orchestrator make(const unsigned int workers = 1) {
        Orchestrator::Options opts;
        opts.workers = workers;
        opts.log_excludes = {"sync-daemon.log"};
        return Orchestrator(client, opts);
    }

    static const TargetReport& find(const PassReport& r, const std::string& label) {
        const auto it = std::ranges::find_if(r.targets, [&](const auto& t) { return t.label == label; });
        if (it == r.targets.end()) throw std::runtime_error("missing report for " + label);
        return *it;
    }
};

TEST_F(OrchestratorTest, RunPass_AllHealthy_IsAllOk) {
    makeHealthy(*client, bot, todayName, yesterdayName);
    makeHealthy(*client, web, todayName, yesterdayName);

    auto orch = make();
    const auto report = orch.runPass({bot, web}, today);

    EXPECT_EQ(report.outcome, PassOutcome::AllOk);
    ASSERT_EQ(report.targets.size(), 2u);
    EXPECT_EQ(report.targets[0].label, "bot");
    EXPECT_EQ(report.targets[1].label, "web");
    EXPECT_EQ(report.count(TargetOutcome::OK), 2u);
    EXPECT_EQ(client->mirrors().size(), 6u); // 2 log days + data per target
}

TEST_F(OrchestratorTest, MissingDataRoot_IsSkippedNotFailure) {
    makeHealthy(*client, bot, todayName, yesterdayName);
    client->addPresent(web.remote_log_root / todayName);

    auto orch = make();
    const auto report = orch.runPass({bot, web}, today);

    const auto& w = find(report, "web");
    EXPECT_TRUE(w.logs.isSuccess());
    EXPECT_TRUE(w.data.isSkipped());
    EXPECT_EQ(w.outcome, TargetOutcome::OK);
    EXPECT_EQ(report.outcome, PassOutcome::AllOk);
}

TEST_F(OrchestratorTest, MissingDateFolder_IsNotAnError) {
    client->addPresent(bot.remote_log_root / todayName);
    client->addPresent(bot.remote_data_root);

    auto orch = make();
    const auto r = orch.syncLogs(bot, today);

    EXPECT_TRUE(r.isSuccess());
    ASSERT_EQ(client->mirrors().size(), 1u);
    EXPECT_EQ(client->mirrors()[0].remote, bot.remote_log_root / todayName);
}

TEST_F(OrchestratorTest, NoLogFoldersInWindow_IsSkipped) {
    client->addPresent(bot.remote_data_root);

    auto orch = make();
    const auto report = orch.syncTarget(bot, today);

    EXPECT_TRUE(report.logs.isSkipped());
    EXPECT_TRUE(report.data.isSuccess());
    EXPECT_EQ(report.outcome, TargetOutcome::OK);
}

TEST_F(OrchestratorTest, UnreachableTarget_DegradesPassButOthersStillSync) {
    makeHealthy(*client, bot, todayName, yesterdayName);
    client->makeUnreachable("/srv/web");

    auto orch = make();
    const auto report = orch.runPass({bot, web}, today);

    EXPECT_EQ(find(report, "bot").outcome, TargetOutcome::OK);
    const auto& w = find(report, "web");
    EXPECT_EQ(w.outcome, TargetOutcome::Failed);
    EXPECT_EQ(w.logs.reason, "remote unreachable");
    EXPECT_EQ(w.data.reason, "remote unreachable");
    EXPECT_EQ(report.outcome, PassOutcome::SomeDegraded);
}

TEST_F(OrchestratorTest, EveryTargetUnreachable_IsAllFailed) {
    client->makeUnreachable("/srv");

    auto orch = make();
    const auto report = orch.runPass({bot, web}, today);

    EXPECT_EQ(report.outcome, PassOutcome::AllFailed);
    EXPECT_TRUE(client->mirrors().empty());
}

TEST_F(OrchestratorTest, FailedDataTransfer_IsPartial) {
    makeHealthy(*client, bot, todayName, yesterdayName);
    client->failMirror(bot.remote_data_root);

    auto orch = make();
    const auto report = orch.runPass({bot}, today);

    ASSERT_EQ(report.targets.size(), 1u);
    EXPECT_TRUE(report.targets[0].logs.isSuccess());
    EXPECT_EQ(report.targets[0].data.reason, "transfer failed");
    EXPECT_EQ(report.targets[0].outcome, TargetOutcome::Partial);
    EXPECT_EQ(report.outcome, PassOutcome::SomeDegraded);
}

TEST_F(OrchestratorTest, OneFailedLogFolder_FailsLogsSubtree) {
    makeHealthy(*client, bot, todayName, yesterdayName);
    client->failMirror(bot.remote_log_root / yesterdayName);

    auto orch = make();
    const auto r = orch.syncLogs(bot, today);

    EXPECT_TRUE(r.isFailed());
    EXPECT_EQ(r.reason, "1 of 2 log folder(s) failed");
}

TEST_F(OrchestratorTest, LogWindow_ProbesOnlyTodayAndYesterday) {
    auto orch = make();
    (void)orch.syncLogs(bot, today);

    const auto probes = client->probes();
    ASSERT_EQ(probes.size(), 2u);
    EXPECT_EQ(probes[0], bot.remote_log_root / todayName);
    EXPECT_EQ(probes[1], bot.remote_log_root / yesterdayName);
}

TEST_F(OrchestratorTest, LogWindow_CrossesMonthBoundary) {
    const hs::util::Date first = year{2026} / March / 1;
    auto orch = make();
    (void)orch.syncLogs(bot, first);

    const auto probes = client->probes();
    ASSERT_EQ(probes.size(), 2u);
    EXPECT_EQ(probes[1], bot.remote_log_root / "2026-02-28");
}

TEST_F(OrchestratorTest, MirrorRequests_CarryExcludesAndDeleteMode) {
    makeHealthy(*client, bot, todayName, yesterdayName);

    auto orch = make();
    (void)orch.syncTarget(bot, today);

    for (const auto& m : client->mirrors()) {
        if (m.remote == bot.remote_data_root) {
            EXPECT_FALSE(m.delete_extraneous);
            EXPECT_EQ(m.local, bot.local_data_root);
            EXPECT_EQ(m.excludes, (std::vector<std::string>{"temp_media", "cache"}));
        } else {
            EXPECT_TRUE(m.delete_extraneous);
            EXPECT_EQ(m.local.parent_path(), bot.local_log_root);
            EXPECT_EQ(m.excludes, std::vector<std::string>{"sync-daemon.log"});
        }
    }
}

TEST_F(OrchestratorTest, OptionsFromConfig_AlwaysExcludesActivityLog) {
    auto cfg = hs::config::defaultConfig();
    cfg.runtime.activity_log = "/var/log/harborsync/sync-daemon.log";
    cfg.excludes.logs = {"*.tmp"};
    cfg.schedule.workers = 4;
    cfg.schedule.log_window_days = 3;

    const auto opts = Orchestrator::optionsFromConfig(cfg);
    EXPECT_EQ(opts.log_excludes, (std::vector<std::string>{"*.tmp", "sync-daemon.log"}));
    EXPECT_EQ(opts.workers, 4u);
    EXPECT_EQ(opts.log_window_days, 3u);

    cfg.excludes.logs = {"sync-daemon.log"};
    EXPECT_EQ(Orchestrator::optionsFromConfig(cfg).log_excludes.size(), 1u);
}

TEST_F(OrchestratorTest, ParallelWorkers_KeepConfigOrderAndClassification) {
    std::vector<Target> targets;
    for (const auto* label : {"a", "b", "c", "d", "e"}) targets.push_back(makeTarget(label, tmp.path()));

    for (const auto& t : targets) makeHealthy(*client, t, todayName, yesterdayName);
    client->makeUnreachable("/srv/c");
    client->failMirror(targets[3].remote_data_root);

    auto orch = make(3);
    const auto report = orch.runPass(targets, today);

    ASSERT_EQ(report.targets.size(), targets.size());
    for (size_t i = 0; i < targets.size(); ++i) EXPECT_EQ(report.targets[i].label, targets[i].label);

    EXPECT_EQ(report.targets[2].outcome, TargetOutcome::Failed);
    EXPECT_EQ(report.targets[3].outcome, TargetOutcome::Partial);
    EXPECT_EQ(report.count(TargetOutcome::OK), 3u);
    EXPECT_EQ(report.outcome, PassOutcome::SomeDegraded);
}

TEST_F(OrchestratorTest, ActivityLog_RecordsTargetAndPassLines) {
    const Target lone = makeTarget("activity-probe", tmp.path());
    makeHealthy(*client, lone, todayName, yesterdayName);

    auto orch = make();
    (void)orch.runPass({lone}, today);
    hs::log::Registry::activity()->flush();

    const auto text = readFile(hs::log::Registry::activityLogPath());
    EXPECT_NE(text.find("[activity-probe] Sync successful"), std::string::npos);
    EXPECT_NE(text.find("Pass all_ok: 1 ok, 0 partial, 0 failed"), std::string::npos);
}

TEST(OrchestratorCtorTest, RejectsNullClient) {
    EXPECT_THROW(Orchestrator(nullptr, Orchestrator::Options{}), std::invalid_argument);
}
