#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <sys/types.h>

namespace hs::runtime {

// Single integer PID as text. The only shared mutable resource of the daemon.
class PidFile {
public:
    enum class State { Absent, Running, Stale };

    struct Inspection {
        State state = State::Absent;
        std::optional<pid_t> pid;
    };

    explicit PidFile(std::filesystem::path path);

    [[nodiscard]] std::optional<pid_t> read() const;

    // Write-then-rename so readers never observe a half-written PID
    void write(pid_t pid) const;

    bool remove() const;

    // Only removes the file while it still names `pid`
    bool removeIfOwnedBy(pid_t pid) const;

    [[nodiscard]] bool exists() const;

    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> modifiedAt() const;

    // Absent, Running (recorded process alive) or Stale (dead process or unreadable content)
    [[nodiscard]] Inspection inspect() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // kill(pid, 0) succeeds (or EPERM) and the process is not a zombie
    static bool isAlive(pid_t pid);

private:
    std::filesystem::path path_;
};

}
