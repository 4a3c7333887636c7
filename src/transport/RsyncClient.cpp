#include "transport/RsyncClient.hpp"
#include "log/Registry.hpp"
#include "util/Subprocess.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/core.h>

using namespace hs::transport;
using namespace hs::util;

namespace fs = std::filesystem;

// ssh exits 255 on its own errors; `test -d` exits 1 when the path is missing
static constexpr int SSH_ERROR_EXIT = 255;
static constexpr int TEST_FALSE_EXIT = 1;

std::string hs::transport::to_string(const Presence p) {
    switch (p) {
    case Presence::Present: return "present";
    case Presence::Absent: return "absent";
    case Presence::Unreachable: return "unreachable";
    default: return "unknown";
    }
}

RsyncClient::RsyncClient(config::RemoteConfig remote) : remote_(std::move(remote)) {}

bool RsyncClient::mirror(const MirrorRequest& req) {
    std::error_code ec;
    fs::create_directories(req.local, ec);
    if (ec) {
        log::Registry::transport()->error("[RsyncClient] Cannot create {}: {}", req.local.string(), ec.message());
        return false;
    }

    const auto args = mirrorArgs(req);
    log::Registry::transport()->debug("[RsyncClient] {}", boost::algorithm::join(args, " "));

    try {
        const auto res = Subprocess::run(args);
        if (res.ok()) return true;

        log::Registry::transport()->warn("[RsyncClient] Mirror {} -> {} failed (exit {}): {}",
                                         req.remote.string(), req.local.string(), res.exit_code,
                                         boost::algorithm::trim_copy(res.stderr_text));
    } catch (const std::exception& e) {
        log::Registry::transport()->error("[RsyncClient] Unable to run {}: {}", remote_.rsync_binary, e.what());
    }
    return false;
}

Presence RsyncClient::probe(const fs::path& remotePath) {
    const auto args = probeArgs(remotePath);
    log::Registry::transport()->debug("[RsyncClient] {}", boost::algorithm::join(args, " "));

    try {
        const auto res = Subprocess::run(args);
        if (res.exit_code == 0) return Presence::Present;
        if (res.exit_code == TEST_FALSE_EXIT) return Presence::Absent;

        log::Registry::transport()->warn("[RsyncClient] Probe of {} failed (exit {}{}): {}",
                                         remotePath.string(), res.exit_code,
                                         res.exit_code == SSH_ERROR_EXIT ? ", ssh error" : "",
                                         boost::algorithm::trim_copy(res.stderr_text));
    } catch (const std::exception& e) {
        log::Registry::transport()->error("[RsyncClient] Unable to run {}: {}", remote_.ssh_binary, e.what());
    }
    return Presence::Unreachable;
}

std::vector<std::string> RsyncClient::sshOptions() const {
    std::vector<std::string> opts;
    if (!remote_.ssh_key.empty()) {
        opts.emplace_back("-i");
        opts.emplace_back(remote_.ssh_key.string());
    }
    opts.emplace_back("-o");
    opts.emplace_back(fmt::format("ConnectTimeout={}", remote_.connect_timeout.count()));
    opts.emplace_back("-o");
    opts.emplace_back(fmt::format("StrictHostKeyChecking={}", remote_.strict_host_key_checking));
    opts.emplace_back("-o");
    opts.emplace_back("BatchMode=yes");
    return opts;
}

std::string RsyncClient::sshCommandLine() const {
    std::vector<std::string> parts{remote_.ssh_binary};
    for (const auto& o : sshOptions()) parts.push_back(shellQuote(o));
    return boost::algorithm::join(parts, " ");
}

std::vector<std::string> RsyncClient::mirrorArgs(const MirrorRequest& req) const {
    std::vector<std::string> args{
        remote_.rsync_binary,
        "-az",
        fmt::format("--timeout={}", remote_.connect_timeout.count()),
        "-e", sshCommandLine()
    };
    if (req.delete_extraneous) args.emplace_back("--delete");
    for (const auto& ex : req.excludes) args.push_back("--exclude=" + ex);
    args.push_back(fmt::format("{}:{}", remote_.destination(), withTrailingSlash(req.remote)));
    args.push_back(withTrailingSlash(req.local));
    return args;
}

std::vector<std::string> RsyncClient::probeArgs(const fs::path& remotePath) const {
    std::vector<std::string> args{remote_.ssh_binary};
    for (auto& o : sshOptions()) args.push_back(std::move(o));
    args.push_back(remote_.destination());
    args.push_back("test -d " + shellQuote(remotePath.string()));
    return args;
}

std::string RsyncClient::shellQuote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (const char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string RsyncClient::withTrailingSlash(const fs::path& p) {
    auto s = p.string();
    if (s.empty() || s.back() != '/') s.push_back('/');
    return s;
}
