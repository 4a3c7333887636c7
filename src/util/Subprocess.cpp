#include "util/Subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fmt/core.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

using namespace hs::util;

namespace {

std::vector<char*> toArgv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

// Child side, right before exec: unblock every signal and close descriptors
// opened without O_CLOEXEC (spdlog file sinks among them).
void resetInheritedState() {
    sigset_t none;
    sigemptyset(&none);
    ::pthread_sigmask(SIG_SETMASK, &none, nullptr);

    if (::close_range(3, ~0U, 0) != 0) {
        const long maxFd = ::sysconf(_SC_OPEN_MAX);
        for (long fd = 3; fd < (maxFd > 0 ? maxFd : 1024); ++fd) ::close(static_cast<int>(fd));
    }
}

void redirectToDevNull(const int fd, const int flags) {
    const int devnull = ::open("/dev/null", flags);
    if (devnull < 0) _exit(126);
    ::dup2(devnull, fd);
    if (devnull != fd) ::close(devnull);
}

}

ProcessResult Subprocess::run(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::invalid_argument("Subprocess::run called with empty argv");

    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) == -1)
        throw std::runtime_error(fmt::format("Failed to create stderr pipe for {}: {}", argv[0], std::strerror(errno)));

    auto cargv = toArgv(argv);

    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        throw std::runtime_error(fmt::format("Failed to fork {}: {}", argv[0], std::strerror(errno)));
    }

    if (pid == 0) {
        redirectToDevNull(STDIN_FILENO, O_RDONLY);
        redirectToDevNull(STDOUT_FILENO, O_WRONLY);
        ::dup2(errPipe[1], STDERR_FILENO);
        resetInheritedState();
        ::execvp(cargv[0], cargv.data());
        _exit(127); // exec failed
    }

    ::close(errPipe[1]);

    ProcessResult result;
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(errPipe[0], buf, sizeof(buf));
        if (n > 0) {
            result.stderr_text.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    ::close(errPipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw std::runtime_error(fmt::format("waitpid failed for {}: {}", argv[0], std::strerror(errno)));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.term_signal = WTERMSIG(status);

    return result;
}

pid_t Subprocess::spawnDetached(const std::filesystem::path& exe, const std::vector<std::string>& argv) {
    auto cargv = toArgv(argv);
    const std::string exePath = exe.string();

    const pid_t pid = ::fork();
    if (pid < 0) throw std::runtime_error(fmt::format("Failed to fork daemon: {}", std::strerror(errno)));

    if (pid == 0) {
        ::setsid();
        redirectToDevNull(STDIN_FILENO, O_RDONLY);
        redirectToDevNull(STDOUT_FILENO, O_WRONLY);
        redirectToDevNull(STDERR_FILENO, O_WRONLY);
        resetInheritedState();
        ::execv(exePath.c_str(), cargv.data());
        _exit(127);
    }

    return pid;
}
