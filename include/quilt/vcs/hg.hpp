#pragma once

#include <quilt/vcs/client.hpp>

namespace quilt::vcs {

// Mercurial working trees driven through the `hg` command-line client
class HgClient : public VcsClient {
public:
    using VcsClient::VcsClient;

    ScmType type() const override { return ScmType::Hg; }
    bool detect_presence() const override;
    Result<std::string> get_url() const override;
    Status checkout(const std::string& uri,
                    const std::optional<std::string>& version) const override;
    Status update(const std::optional<std::string>& version) const override;
    Result<std::string> get_version() const override;
    Result<std::string> get_status(const std::filesystem::path& basepath,
                                   bool untracked) const override;
    Result<std::string> get_diff(const std::filesystem::path& basepath) const override;

    // Prefix the a/ and b/ paths of git-style diff headers with rel
    static std::string rewrite_diff_headers(const std::string& diff, const std::string& rel);
};

} // namespace quilt::vcs
