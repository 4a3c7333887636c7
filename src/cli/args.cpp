#include "cli/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace hs::cli {

static std::string strip_leading_dashes(const std::string& s) {
    size_t i = 0; while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

static bool takesValue(const std::string& key) {
    return std::ranges::find(VALUE_OPTIONS, key) != VALUE_OPTIONS.end();
}

std::vector<std::string> normalizeArgs(const int argc, char** argv) {
    std::vector<std::string> out;
    if (argc > 1) out.reserve(static_cast<size_t>(argc) - 1);

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        if (a.rfind("--", 0) == 0 && a.size() > 2) {
            const auto eq = a.find('=');
            if (eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));          // --key
                out.emplace_back(a.substr(eq + 1));         // value
                continue;
            }
        }

        out.emplace_back(std::move(a)); // plain arg
    }
    return out;
}

CommandCall parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    bool endOfOptions = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!endOfOptions && a == "--") { endOfOptions = true; continue; }

        if (!endOfOptions && a.size() > 1 && a[0] == '-') {
            const auto key = strip_leading_dashes(a);
            if (takesValue(key)) {
                if (i + 1 >= args.size()) throw std::invalid_argument("Option --" + key + " requires a value");
                call.options.push_back({key, args[++i]});
            } else {
                call.options.push_back({key, std::nullopt});
            }
            continue;
        }

        if (call.name.empty()) call.name = a;
        else call.positionals.push_back(a);
    }

    return call;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key && v) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key && !kv.value; });
}

}
