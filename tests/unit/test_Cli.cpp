#include <gtest/gtest.h>
#include "cli/Router.hpp"
#include "cli/types.hpp"

using namespace hs::cli;

static std::vector<std::string> normalize(std::vector<std::string> args) {
    args.insert(args.begin(), "harborsync");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return normalizeArgs(static_cast<int>(argv.size()), argv.data());
}

TEST(CliArgsTest, NormalizeArgs_SplitsKeyValueAndDropsProgramName) {
    const auto out = normalize({"--config=/etc/hs.yaml", "status", "--json"});
    EXPECT_EQ(out, (std::vector<std::string>{"--config", "/etc/hs.yaml", "status", "--json"}));
}

TEST(CliArgsTest, ParseArgs_ConfigBeforeCommand) {
    const auto call = parseArgs({"--config", "/etc/hs.yaml", "status", "--json"});
    EXPECT_EQ(call.name, "status");
    EXPECT_EQ(optVal(call, "config"), "/etc/hs.yaml");
    EXPECT_TRUE(hasFlag(call, "json"));
    EXPECT_FALSE(hasFlag(call, "config"));
}

TEST(CliArgsTest, ParseArgs_ShortConfigAfterCommand) {
    const auto call = parseArgs({"start", "-c", "hs.yaml"});
    EXPECT_EQ(call.name, "start");
    EXPECT_EQ(optVal(call, "c"), "hs.yaml");
    EXPECT_TRUE(call.positionals.empty());
}

TEST(CliArgsTest, ParseArgs_MissingValueThrows) {
    EXPECT_THROW(parseArgs({"status", "--config"}), std::invalid_argument);
}

TEST(CliArgsTest, ParseArgs_PositionalsAfterName) {
    const auto call = parseArgs({"logs", "extra", "--", "--not-a-flag"});
    EXPECT_EQ(call.name, "logs");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"extra", "--not-a-flag"}));
}

TEST(CliArgsTest, ParseArgs_Empty) {
    const auto call = parseArgs({});
    EXPECT_TRUE(call.name.empty());
    EXPECT_FALSE(optVal(call, "config").has_value());
}

class RouterTest : public ::testing::Test {
protected:
    Router router;
    std::vector<std::string> seen;

    void SetUp() override {
        router.registerCommand("start", "Start", [this](const CommandCall& c) { seen.push_back(c.name); return 0; });
        router.registerCommand("status", "Status", [](const CommandCall&) { return 1; });
        router.registerCommand("daemon", "Internal", [](const CommandCall&) { return 0; }, true);
    }
};

TEST_F(RouterTest, Execute_DispatchesCaseInsensitively) {
    EXPECT_EQ(router.execute(parseArgs({"START"})), 0);
    EXPECT_EQ(seen, std::vector<std::string>{"START"});
}

TEST_F(RouterTest, Execute_PropagatesHandlerExitCode) {
    EXPECT_EQ(router.execute(parseArgs({"status"})), 1);
}

TEST_F(RouterTest, Execute_UnknownCommandFails) {
    EXPECT_EQ(router.execute(parseArgs({"frobnicate"})), 1);
    EXPECT_TRUE(seen.empty());
}

TEST_F(RouterTest, Execute_NoCommandFails) {
    EXPECT_EQ(router.execute(parseArgs({})), 1);
}

TEST_F(RouterTest, Usage_HidesInternalCommands) {
    const auto text = router.usage();
    EXPECT_NE(text.find("start"), std::string::npos);
    EXPECT_NE(text.find("status"), std::string::npos);
    EXPECT_EQ(text.find("daemon "), std::string::npos);
    EXPECT_TRUE(router.has("daemon"));
}

TEST_F(RouterTest, RegisterCommand_RejectsDuplicates) {
    EXPECT_THROW(router.registerCommand("Start", "again", [](const CommandCall&) { return 0; }), std::logic_error);
}
