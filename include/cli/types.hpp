#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hs::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

// Returns the process exit code: 0 = success, 1 = failure/refusal
using CommandHandler = std::function<int(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    CommandHandler handler;
    bool hidden = false; // internal commands stay out of usage()
};

// Options that consume the following token as their value
inline const std::vector<std::string> VALUE_OPTIONS = {"config", "c"};

// Split --key=value into two tokens, keep everything else as-is
std::vector<std::string> normalizeArgs(int argc, char** argv);

CommandCall parseArgs(const std::vector<std::string>& args);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
bool hasFlag(const CommandCall& c, const std::string& key);

}
