#pragma once

#include <quilt/vcs/client.hpp>
#include <string>
#include <vector>

namespace quilt::vcs {

// Bazaar working trees driven through the `bzr` command-line client
class BzrClient : public VcsClient {
public:
    using VcsClient::VcsClient;

    ScmType type() const override { return ScmType::Bzr; }
    bool detect_presence() const override;
    Result<std::string> get_url() const override;
    Status checkout(const std::string& uri,
                    const std::optional<std::string>& version) const override;
    Status update(const std::optional<std::string>& version) const override;
    Result<std::string> get_version() const override;
    Result<std::string> get_status(const std::filesystem::path& basepath,
                                   bool untracked) const override;
    Result<std::string> get_diff(const std::filesystem::path& basepath) const override;

    // `bzr status -S` output without the unknown ('?') entries
    static std::string drop_untracked(const std::string& status);

    static std::vector<std::string> diff_command(const std::string& rel);
};

} // namespace quilt::vcs
