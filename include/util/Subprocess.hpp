#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <sys/types.h>

namespace hs::util {

struct ProcessResult {
    int exit_code = -1;       // -1 when the child did not exit normally
    int term_signal = 0;
    std::string stderr_text;

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

class Subprocess {
public:
    // Run argv[0] from $PATH, discard stdout, capture stderr, wait for exit.
    static ProcessResult run(const std::vector<std::string>& argv);

    // Fork a session leader with stdio on /dev/null and exec argv. Does not wait.
    static pid_t spawnDetached(const std::filesystem::path& exe, const std::vector<std::string>& argv);
};

}
