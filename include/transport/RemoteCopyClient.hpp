#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hs::transport {

struct MirrorRequest {
    std::filesystem::path remote;
    std::filesystem::path local;
    std::vector<std::string> excludes;
    bool delete_extraneous = false; // remove local files that vanished remotely
};

enum class Presence : uint8_t { Present, Absent, Unreachable };

std::string to_string(Presence p);

// One-way remote -> local mirroring plus an existence probe. Implementations must bound
// every network call with a connection timeout and must be safe to call from several
// threads at once for disjoint paths.
class RemoteCopyClient {
public:
    virtual ~RemoteCopyClient() = default;

    virtual bool mirror(const MirrorRequest& req) = 0;

    virtual Presence probe(const std::filesystem::path& remotePath) = 0;
};

}
