#pragma once

#include "transport/RemoteCopyClient.hpp"
#include "config/Config.hpp"

namespace hs::transport {

class RsyncClient final : public RemoteCopyClient {
public:
    explicit RsyncClient(config::RemoteConfig remote);

    bool mirror(const MirrorRequest& req) override;

    Presence probe(const std::filesystem::path& remotePath) override;

    // Exposed for tests and dry-run diagnostics
    [[nodiscard]] std::vector<std::string> mirrorArgs(const MirrorRequest& req) const;
    [[nodiscard]] std::vector<std::string> probeArgs(const std::filesystem::path& remotePath) const;

private:
    config::RemoteConfig remote_;

    [[nodiscard]] std::vector<std::string> sshOptions() const;
    [[nodiscard]] std::string sshCommandLine() const;

    static std::string shellQuote(const std::string& s);
    static std::string withTrailingSlash(const std::filesystem::path& p);
};

}
