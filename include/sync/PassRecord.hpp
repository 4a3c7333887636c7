#pragma once

#include "types/Outcome.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace hs::sync {

// What `status` shows about the most recent pass the daemon completed.
struct PassSummary {
    std::string outcome;
    std::string finished_at;
    unsigned int ok = 0;
    unsigned int partial = 0;
    unsigned int failed = 0;
};

// The JSON report of the last finished pass, replaced atomically after every pass.
class PassRecord {
public:
    explicit PassRecord(std::filesystem::path path);

    // Never throws: a report that cannot be written is logged and dropped.
    bool save(const types::PassReport& report) const;

    // nullopt when the file is missing or unreadable.
    [[nodiscard]] std::optional<PassSummary> load() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
