#pragma once

#include <quilt/vcs/client.hpp>

namespace quilt::vcs {

// git working trees driven through the `git` command-line client
class GitClient : public VcsClient {
public:
    using VcsClient::VcsClient;

    ScmType type() const override { return ScmType::Git; }
    bool detect_presence() const override;
    Result<std::string> get_url() const override;
    Status checkout(const std::string& uri,
                    const std::optional<std::string>& version) const override;
    Status update(const std::optional<std::string>& version) const override;
    Result<std::string> get_version() const override;
    Result<std::string> get_status(const std::filesystem::path& basepath,
                                   bool untracked) const override;
    Result<std::string> get_diff(const std::filesystem::path& basepath) const override;

private:
    // HEAD is a branch with a configured upstream
    bool tracks_upstream() const;
};

} // namespace quilt::vcs
