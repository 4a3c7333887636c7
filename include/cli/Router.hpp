#pragma once

#include "cli/types.hpp"

#include <map>
#include <string>

namespace hs::cli {

class Router {
public:
    void registerCommand(const std::string& name, std::string description, CommandHandler handler, bool hidden = false);

    // Unknown or missing command prints usage to stderr and returns 1
    int execute(const CommandCall& call) const;

    [[nodiscard]] std::string usage() const;

    [[nodiscard]] bool has(const std::string& name) const;

private:
    std::map<std::string, CommandInfo> commands_;

    static std::string normalize(const std::string& s);
};

}
