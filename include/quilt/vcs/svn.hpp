#pragma once

#include <quilt/vcs/client.hpp>
#include <string>
#include <vector>

namespace quilt::vcs {

// Subversion working trees driven through the `svn` command-line client
class SvnClient : public VcsClient {
public:
    using VcsClient::VcsClient;

    ScmType type() const override { return ScmType::Svn; }
    bool detect_presence() const override;
    Result<std::string> get_url() const override;
    Status checkout(const std::string& uri,
                    const std::optional<std::string>& version) const override;
    Status update(const std::optional<std::string>& version) const override;
    Result<std::string> get_version() const override;
    Result<std::string> get_status(const std::filesystem::path& basepath,
                                   bool untracked) const override;
    Result<std::string> get_diff(const std::filesystem::path& basepath) const override;

    // svn echoes the paths it is given, so both commands name the tree by
    // its path relative to the directory they run in
    static std::vector<std::string> status_command(const std::string& rel, bool untracked);
    static std::vector<std::string> diff_command(const std::string& rel);
};

} // namespace quilt::vcs
