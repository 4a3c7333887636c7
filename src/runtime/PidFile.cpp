#include "runtime/PidFile.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <cerrno>
#include <csignal>
#include <fmt/core.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace hs::runtime;

namespace fs = std::filesystem;

PidFile::PidFile(fs::path path) : path_(std::move(path)) {}

std::optional<pid_t> PidFile::read() const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;

    std::stringstream buf;
    buf << in.rdbuf();
    const auto text = boost::algorithm::trim_copy(buf.str());
    if (text.empty()) return std::nullopt;

    try {
        size_t consumed = 0;
        const long v = std::stol(text, &consumed);
        if (consumed != text.size() || v <= 0) return std::nullopt;
        return static_cast<pid_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void PidFile::write(const pid_t pid) const {
    if (const auto dir = path_.parent_path(); !dir.empty()) fs::create_directories(dir);

    const auto tmp = fs::path(path_.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) throw std::runtime_error(fmt::format("Failed to open PID file {} for writing", tmp.string()));
        out << pid << '\n';
        if (!out) throw std::runtime_error(fmt::format("Failed to write PID file {}", tmp.string()));
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error(fmt::format("Failed to install PID file {}", path_.string()));
    }
}

bool PidFile::remove() const {
    std::error_code ec;
    return fs::remove(path_, ec);
}

bool PidFile::removeIfOwnedBy(const pid_t pid) const {
    if (read() != pid) return false;
    return remove();
}

bool PidFile::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::optional<std::chrono::system_clock::time_point> PidFile::modifiedAt() const {
    std::error_code ec;
    const auto ft = fs::last_write_time(path_, ec);
    if (ec) return std::nullopt;
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ft - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

PidFile::Inspection PidFile::inspect() const {
    if (!exists()) return {State::Absent, std::nullopt};

    const auto pid = read();
    if (pid && isAlive(*pid)) return {State::Running, pid};
    return {State::Stale, pid};
}

bool PidFile::isAlive(const pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) != 0 && errno != EPERM) return false;

    // A zombie still answers kill(0) until its parent reaps it
    std::ifstream stat(fmt::format("/proc/{}/stat", pid));
    if (!stat.is_open()) return true;

    std::string line;
    std::getline(stat, line);
    const auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) return true;
    return line[close + 2] != 'Z';
}
