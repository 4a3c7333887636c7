#include "cli/Router.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <fmt/core.h>
#include <iostream>
#include <stdexcept>

using namespace hs::cli;

void Router::registerCommand(const std::string& name, std::string description, CommandHandler handler, const bool hidden) {
    const auto key = normalize(name);
    if (commands_.contains(key)) throw std::logic_error("Command registered twice: " + key);
    commands_[key] = CommandInfo{std::move(description), std::move(handler), hidden};
}

int Router::execute(const CommandCall& call) const {
    if (call.name.empty()) {
        std::cerr << usage();
        return 1;
    }

    const auto key = normalize(call.name);
    const auto it = commands_.find(key);
    if (it == commands_.end()) {
        std::cerr << fmt::format("Unknown command: {}\n\n", call.name) << usage();
        return 1;
    }

    if (log::Registry::isInitialized()) log::Registry::cli()->debug("[Router] Executing command: '{}'", key);
    return it->second.handler(call);
}

std::string Router::usage() const {
    std::string out = "harborsync - keeps local mirrors of remote log and data folders\n\n";
    out += "Usage: harborsync [--config <path>] <command> [options]\n\nCommands:\n";
    for (const auto& [name, info] : commands_) {
        if (info.hidden) continue;
        out += fmt::format("  {:<8} - {}\n", name, info.description);
    }
    return out;
}

bool Router::has(const std::string& name) const {
    return commands_.contains(normalize(name));
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
