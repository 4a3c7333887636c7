#include <gtest/gtest.h>
#include "status/StatusReporter.hpp"
#include "runtime/PidFile.hpp"
#include "ChildProcess.hpp"
#include "FakeRemoteCopyClient.hpp"
#include "TempDir.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

using namespace hs::status;
using namespace hs::test;
using namespace std::chrono_literals;

class StatusReporterTest : public ::testing::Test {
protected:
    TempDir tmp;
    hs::types::Target bot = makeTarget("bot", tmp.path());

    hs::config::Config config() const {
        auto cfg = hs::config::defaultConfig();
        cfg.remote.host = "127.0.0.1";
        cfg.runtime.pid_file = tmp.path() / "harborsync.pid";
        cfg.runtime.activity_log = tmp.path() / "state" / "sync-daemon.log";
        cfg.runtime.last_pass_file = tmp.path() / "state" / "last-pass.json";
        cfg.targets = {bot};
        return cfg;
    }

    void populateLogs() const {
        for (int day = 10; day <= 16; ++day) {
            const auto folder = bot.local_log_root / ("2026-10-" + std::to_string(day));
            writeFile(folder / "app.log", "0123456789");
            writeFile(folder / "error.log", "01234");
        }
        writeFile(bot.local_log_root / "2026-10-16" / "notes.txt", "x");
        std::filesystem::create_directories(bot.local_log_root / "archive");
    }

    void populateData() const {
        writeFile(bot.local_data_root / "db.sqlite", std::string(2048, 'd'));
        writeFile(bot.local_data_root / "backups" / "db-1.sqlite", "b1");
        writeFile(bot.local_data_root / "backups" / "db-2.sqlite", "b2");
    }
};

TEST_F(StatusReporterTest, InspectTarget_ListsFiveMostRecentDayFolders) {
    populateLogs();

    const auto ts = StatusReporter::inspectTarget(bot);
    ASSERT_EQ(ts.recent_days.size(), StatusReporter::RECENT_DAYS);
    EXPECT_EQ(ts.recent_days.front().name, "2026-10-12");
    EXPECT_EQ(ts.recent_days.back().name, "2026-10-16");
    EXPECT_EQ(ts.recent_days.back().log_files, 2u);
    EXPECT_EQ(ts.recent_days.back().bytes, 16u);
}

TEST_F(StatusReporterTest, InspectTarget_CountsDataAndBackups) {
    populateData();

    const auto ts = StatusReporter::inspectTarget(bot);
    EXPECT_TRUE(ts.data_synced);
    EXPECT_EQ(ts.data_files, 3u);
    EXPECT_EQ(ts.data_bytes, 2052u);
    EXPECT_EQ(ts.backups, 2u);
}

TEST_F(StatusReporterTest, InspectTarget_NothingSyncedYet) {
    const auto ts = StatusReporter::inspectTarget(bot);
    EXPECT_TRUE(ts.recent_days.empty());
    EXPECT_FALSE(ts.data_synced);

    const auto text = StatusReporter::render(Status{.targets = {ts}});
    EXPECT_NE(text.find("(no log folders synced yet)"), std::string::npos);
    EXPECT_NE(text.find("(not synced yet)"), std::string::npos);
}

TEST_F(StatusReporterTest, Collect_NotRunning) {
    const auto s = StatusReporter(config()).collect();
    EXPECT_FALSE(s.running);
    EXPECT_FALSE(s.stale_pid_removed);
    EXPECT_FALSE(s.pid.has_value());
    EXPECT_NE(StatusReporter::render(s).find("Daemon not running"), std::string::npos);
}

TEST_F(StatusReporterTest, Collect_RemovesStalePidFile) {
    hs::runtime::PidFile(tmp.path() / "harborsync.pid").write(reapedPid());

    const auto s = StatusReporter(config()).collect();
    EXPECT_FALSE(s.running);
    EXPECT_TRUE(s.stale_pid_removed);
    EXPECT_FALSE(std::filesystem::exists(tmp.path() / "harborsync.pid"));
}

TEST_F(StatusReporterTest, Collect_RunningDaemon) {
    const ChildProcess daemon;
    hs::runtime::PidFile(tmp.path() / "harborsync.pid").write(daemon.pid());
    writeFile(tmp.path() / "state" / "sync-daemon.log", "[2026-10-19 10:00:00] Daemon started\n[2026-10-19 10:00:01] [bot] Sync successful\n");
    populateLogs();
    populateData();

    const auto s = StatusReporter(config()).collect();
    EXPECT_TRUE(s.running);
    EXPECT_EQ(s.pid, daemon.pid());
    EXPECT_TRUE(s.started_at.has_value());
    EXPECT_EQ(s.last_activity, "[2026-10-19 10:00:01] [bot] Sync successful");

    const auto text = StatusReporter::render(s);
    EXPECT_NE(text.find("Daemon is running (PID: " + std::to_string(daemon.pid()) + ")"), std::string::npos);
    EXPECT_NE(text.find("2026-10-16/ (2 logs, 16B)"), std::string::npos);
    EXPECT_NE(text.find("Backups: 2"), std::string::npos);

    const nlohmann::json j = s;
    EXPECT_TRUE(j.at("running").get<bool>());
    EXPECT_EQ(j.at("pid").get<pid_t>(), daemon.pid());
    EXPECT_EQ(j.at("targets").size(), 1u);
    EXPECT_EQ(j.at("targets")[0].at("backups").get<uint64_t>(), 2u);
    EXPECT_EQ(j.at("targets")[0].at("recent_days").size(), StatusReporter::RECENT_DAYS);
}

TEST_F(StatusReporterTest, Collect_ShowsLastRecordedPass) {
    const auto cfg = config();
    EXPECT_FALSE(StatusReporter(cfg).collect().last_pass.has_value());

    hs::types::PassReport report;
    report.targets = {
        {"bot", hs::types::SyncResult::success(), hs::types::SyncResult::success(), hs::types::TargetOutcome::OK},
        {"web", hs::types::SyncResult::failed("transfer failed"), hs::types::SyncResult::failed("transfer failed"),
         hs::types::TargetOutcome::Failed}
    };
    report.outcome = hs::types::aggregate(report.targets);
    report.started_at = report.finished_at = std::chrono::system_clock::now();
    ASSERT_TRUE(hs::sync::PassRecord(cfg.runtime.last_pass_file).save(report));

    const auto s = StatusReporter(cfg).collect();
    ASSERT_TRUE(s.last_pass.has_value());
    EXPECT_EQ(s.last_pass->outcome, "some_degraded");
    EXPECT_NE(StatusReporter::render(s).find("Last pass: some_degraded at "), std::string::npos);
    EXPECT_NE(StatusReporter::render(s).find("(1 ok, 0 partial, 1 failed)"), std::string::npos);

    const nlohmann::json j = s;
    EXPECT_EQ(j.at("last_pass").at("failed").get<unsigned int>(), 1u);
    EXPECT_EQ(j.at("last_pass").at("ok").get<unsigned int>(), 1u);
}

TEST_F(StatusReporterTest, Collect_IgnoresUnreadableLastPassFile) {
    const auto cfg = config();
    writeFile(cfg.runtime.last_pass_file, "{ not json");

    const auto s = StatusReporter(cfg).collect();
    EXPECT_FALSE(s.last_pass.has_value());
    const nlohmann::json j = s;
    EXPECT_TRUE(j.at("last_pass").is_null());
}

TEST_F(StatusReporterTest, LastLine_SkipsTrailingBlankLines) {
    const auto file = tmp.path() / "a.log";
    writeFile(file, "first\nsecond\n\n");
    EXPECT_EQ(StatusReporter::lastLine(file), "second");
    EXPECT_FALSE(StatusReporter::lastLine(tmp.path() / "missing.log").has_value());
}

TEST_F(StatusReporterTest, Follow_MissingLogReturnsFalse) {
    std::ostringstream out;
    const std::atomic<bool> stop{true};
    EXPECT_FALSE(StatusReporter(config()).follow(out, stop));
    EXPECT_TRUE(out.str().empty());
}

TEST_F(StatusReporterTest, Follow_PrintsTailThenAppendedLines) {
    const auto log = tmp.path() / "state" / "sync-daemon.log";
    std::string content;
    for (int i = 1; i <= 15; ++i) content += "line " + std::to_string(i) + "\n";
    writeFile(log, content);

    const StatusReporter reporter(config());
    std::ostringstream out;
    std::atomic<bool> stop{false};

    std::thread follower([&] { (void)reporter.follow(out, stop, 10); });

    std::this_thread::sleep_for(200ms);
    {
        std::ofstream append(log, std::ios::app);
        append << "line 16\n";
    }
    std::this_thread::sleep_for(1200ms);
    stop = true;
    follower.join();

    const auto text = out.str();
    EXPECT_EQ(text.find("line 5\n"), std::string::npos);
    EXPECT_NE(text.find("line 6\n"), std::string::npos);
    EXPECT_NE(text.find("line 15\n"), std::string::npos);
    EXPECT_NE(text.find("line 16\n"), std::string::npos);
}

TEST_F(StatusReporterTest, Follow_HoldsPartialLineUntilNewline) {
    const auto log = tmp.path() / "state" / "sync-daemon.log";
    writeFile(log, "line 1\npart");

    const StatusReporter reporter(config());
    std::ostringstream out;
    std::atomic<bool> stop{false};

    std::thread follower([&] { (void)reporter.follow(out, stop, 10); });

    std::this_thread::sleep_for(700ms);
    {
        std::ofstream append(log, std::ios::app);
        append << "ial\n";
    }
    std::this_thread::sleep_for(1200ms);
    stop = true;
    follower.join();

    const auto text = out.str();
    EXPECT_EQ(text, "line 1\npartial\n");
}
