#include <gtest/gtest.h>
#include "util/bytes.hpp"
#include "util/date.hpp"
#include "util/paths.hpp"

#include <cstdlib>

using namespace hs::util;
using namespace std::chrono;

TEST(DateTest, ToString_ZeroPads) {
    EXPECT_EQ(toString(year{2026} / March / 4), "2026-03-04");
}

TEST(DateTest, Window_NewestFirst) {
    const auto w = window(year{2026} / January / 1, 3);
    ASSERT_EQ(w.size(), 3u);
    EXPECT_EQ(toString(w[0]), "2026-01-01");
    EXPECT_EQ(toString(w[1]), "2025-12-31");
    EXPECT_EQ(toString(w[2]), "2025-12-30");
}

TEST(DateTest, Window_LeapDay) {
    const auto w = window(year{2028} / March / 1, 2);
    EXPECT_EQ(toString(w[1]), "2028-02-29");
}

TEST(DateTest, IsDateFolderName) {
    EXPECT_TRUE(isDateFolderName("2026-10-19"));
    EXPECT_FALSE(isDateFolderName("2026-1-19"));
    EXPECT_FALSE(isDateFolderName("archive"));
    EXPECT_FALSE(isDateFolderName("2026_10_19"));
    EXPECT_FALSE(isDateFolderName("2026-10-1x"));
}

TEST(DateTest, Today_IsValid) {
    EXPECT_TRUE(today().ok());
}

TEST(BytesTest, HumanBytes) {
    EXPECT_EQ(humanBytes(512), "512B");
    EXPECT_EQ(humanBytes(1229), "1.2K");
    EXPECT_EQ(humanBytes(34 * MEGABYTE), "34.0M");
    EXPECT_EQ(humanBytes(GIGABYTE + GIGABYTE / 2), "1.5G");
}

class PathsTest : public ::testing::Test {
protected:
    std::string savedHome;

    void SetUp() override {
        if (const char* h = std::getenv("HOME")) savedHome = h;
        ::setenv("HOME", "/home/op", 1);
        ::unsetenv("HARBORSYNC_CONFIG");
        ::unsetenv("XDG_CONFIG_HOME");
        ::unsetenv("XDG_STATE_HOME");
    }

    void TearDown() override {
        if (savedHome.empty()) ::unsetenv("HOME");
        else ::setenv("HOME", savedHome.c_str(), 1);
        ::unsetenv("HARBORSYNC_CONFIG");
        ::unsetenv("XDG_CONFIG_HOME");
    }
};

TEST_F(PathsTest, ExpandHome) {
    EXPECT_EQ(hs::paths::expandHome("~"), "/home/op");
    EXPECT_EQ(hs::paths::expandHome("~/mirror"), "/home/op/mirror");
    EXPECT_EQ(hs::paths::expandHome("/abs/~x"), "/abs/~x");
}

TEST_F(PathsTest, ConfigPath_ResolutionOrder) {
    EXPECT_EQ(hs::paths::getConfigPath(), "/home/op/.config/harborsync/config.yaml");

    ::setenv("XDG_CONFIG_HOME", "/xdg", 1);
    EXPECT_EQ(hs::paths::getConfigPath(), "/xdg/harborsync/config.yaml");

    ::setenv("HARBORSYNC_CONFIG", "~/hs.yaml", 1);
    EXPECT_EQ(hs::paths::getConfigPath(), "/home/op/hs.yaml");

    EXPECT_EQ(hs::paths::getConfigPath("/etc/harborsync.yaml"), "/etc/harborsync.yaml");
}

TEST_F(PathsTest, Defaults) {
    EXPECT_EQ(hs::paths::getDefaultPidFile(), "/home/op/.harborsync.pid");
    EXPECT_EQ(hs::paths::getDefaultActivityLog(), "/home/op/.local/state/harborsync/sync-daemon.log");
}
