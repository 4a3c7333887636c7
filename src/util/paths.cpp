#include "util/paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace hs::paths {

static const char* envOrNull(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

fs::path getHome() {
    if (const auto* home = envOrNull("HOME")) return home;
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
    throw std::runtime_error("Unable to determine home directory");
}

fs::path expandHome(const fs::path& p) {
    const auto s = p.string();
    if (s == "~") return getHome();
    if (s.rfind("~/", 0) == 0) return getHome() / s.substr(2);
    return p;
}

fs::path getConfigPath(const fs::path& override) {
    if (!override.empty()) return expandHome(override);
    if (const auto* env = envOrNull("HARBORSYNC_CONFIG")) return expandHome(env);
    if (const auto* xdg = envOrNull("XDG_CONFIG_HOME")) return fs::path(xdg) / "harborsync" / "config.yaml";
    return getHome() / ".config" / "harborsync" / "config.yaml";
}

fs::path getStateDir() {
    if (const auto* xdg = envOrNull("XDG_STATE_HOME")) return fs::path(xdg) / "harborsync";
    return getHome() / ".local" / "state" / "harborsync";
}

fs::path getDefaultPidFile() { return getHome() / ".harborsync.pid"; }

fs::path getDefaultActivityLog() { return getStateDir() / "sync-daemon.log"; }

fs::path getSelfExe() {
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) throw std::runtime_error("Unable to resolve /proc/self/exe: " + ec.message());
    return exe;
}

}
