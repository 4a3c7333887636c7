#pragma once

#include <filesystem>
#include <string>

namespace hs::types {

// One independently synchronized service: its remote and local log/data roots.
struct Target {
    std::string label;
    std::filesystem::path remote_log_root;
    std::filesystem::path remote_data_root;
    std::filesystem::path local_log_root;
    std::filesystem::path local_data_root;
};

}
