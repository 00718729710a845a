#pragma once

#include <quilt/result.hpp>
#include <quilt/path_spec.hpp>
#include <quilt/preparation.hpp>
#include <quilt/vcs/client.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace quilt {

// One declared tree of the workspace. Elements are immutable after
// configuration building; install only changes the filesystem at path().
class Element {
public:
    Element(std::string local_name, std::filesystem::path path)
        : local_name_(std::move(local_name)), path_(std::move(path)) {}
    virtual ~Element() = default;

    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    const std::string& local_name() const { return local_name_; }
    const std::filesystem::path& path() const { return path_; }

    virtual bool is_vcs_element() const = 0;
    virtual ScmType scm_type() const = 0;

    // Declaration that reproduces this element when persisted
    virtual PathSpec path_spec() const = 0;

    // Inspect the filesystem against the declared state. An empty optional
    // means there is nothing to install.
    virtual Result<std::optional<PreparationReport>> prepare_install(
        const std::optional<std::filesystem::path>& backup_path,
        InstallMode mode, bool robust) const = 0;

    virtual Status install(const PreparationReport& report) const = 0;

    // Empty optional when the element has no version control
    virtual Result<std::optional<std::string>> get_status(
        const std::filesystem::path& basepath, bool untracked) const = 0;
    virtual Result<std::optional<std::string>> get_diff(
        const std::filesystem::path& basepath) const = 0;
    virtual Result<std::optional<std::string>> get_version() const = 0;

private:
    std::string local_name_;
    std::filesystem::path path_;
};

// A plain directory kept in the workspace without version control
class OtherElement : public Element {
public:
    using Element::Element;

    bool is_vcs_element() const override { return false; }
    ScmType scm_type() const override { return ScmType::None; }
    PathSpec path_spec() const override;

    Result<std::optional<PreparationReport>> prepare_install(
        const std::optional<std::filesystem::path>& backup_path,
        InstallMode mode, bool robust) const override;
    Status install(const PreparationReport& report) const override;

    Result<std::optional<std::string>> get_status(
        const std::filesystem::path& basepath, bool untracked) const override;
    Result<std::optional<std::string>> get_diff(
        const std::filesystem::path& basepath) const override;
    Result<std::optional<std::string>> get_version() const override;
};

// A tree checked out from a remote repository through a VcsClient
class VcsElement : public Element {
public:
    VcsElement(std::string local_name, std::filesystem::path path,
               std::unique_ptr<vcs::VcsClient> client,
               std::string uri, std::optional<std::string> version);

    bool is_vcs_element() const override { return true; }
    ScmType scm_type() const override { return client_->type(); }
    PathSpec path_spec() const override;

    const std::string& uri() const { return uri_; }
    const std::optional<std::string>& version() const { return version_; }
    const vcs::VcsClient& client() const { return *client_; }

    Result<std::optional<PreparationReport>> prepare_install(
        const std::optional<std::filesystem::path>& backup_path,
        InstallMode mode, bool robust) const override;
    Status install(const PreparationReport& report) const override;

    Result<std::optional<std::string>> get_status(
        const std::filesystem::path& basepath, bool untracked) const override;
    Result<std::optional<std::string>> get_diff(
        const std::filesystem::path& basepath) const override;
    Result<std::optional<std::string>> get_version() const override;

    // Move the tree at path() to target, which must not exist yet
    Status backup(const std::filesystem::path& target) const;

private:
    std::unique_ptr<vcs::VcsClient> client_;
    std::string uri_;
    std::optional<std::string> version_;

    // Why the existing tree cannot simply be updated, if it cannot
    std::optional<std::string> conflict() const;
};

} // namespace quilt
