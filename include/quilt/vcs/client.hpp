#pragma once

#include <quilt/result.hpp>
#include <quilt/scm.hpp>
#include <quilt/process.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quilt::vcs {

// Backend operations on one working tree. All methods only touch the
// filesystem below path(), so clients of different trees may run in parallel.
class VcsClient {
public:
    VcsClient(std::filesystem::path path, int timeout_seconds)
        : path_(std::move(path)), timeout_seconds_(timeout_seconds) {}
    virtual ~VcsClient() = default;

    VcsClient(const VcsClient&) = delete;
    VcsClient& operator=(const VcsClient&) = delete;

    virtual ScmType type() const = 0;

    // True when path() holds a working tree of this backend
    virtual bool detect_presence() const = 0;

    // Remote the working tree was checked out from
    virtual Result<std::string> get_url() const = 0;

    // Whether an existing checkout of `current` satisfies a request for `requested`
    virtual bool url_matches(const std::string& current,
                             const std::string& requested) const;

    // Create a fresh working tree at path(); path() must not exist
    virtual Status checkout(const std::string& uri,
                            const std::optional<std::string>& version) const = 0;

    // Bring an existing working tree to version (or the latest remote state)
    virtual Status update(const std::optional<std::string>& version) const = 0;

    virtual Result<std::string> get_version() const = 0;

    // Status lines with file names relative to basepath; empty text when clean
    virtual Result<std::string> get_status(const std::filesystem::path& basepath,
                                           bool untracked) const = 0;

    // Diff with file names relative to basepath
    virtual Result<std::string> get_diff(const std::filesystem::path& basepath) const = 0;

    const std::filesystem::path& path() const { return path_; }
    int timeout_seconds() const { return timeout_seconds_; }

    // Insert prefix after the first `columns` characters of every line
    static std::string prefix_paths(const std::string& text, size_t columns,
                                    const std::string& prefix);

protected:
    // Run a backend command, turning a non-zero exit into a Vcs error
    Result<std::string> run_checked(const std::vector<std::string>& args,
                                    const std::string& working_dir = "") const;

    Result<CommandResult> run(const std::vector<std::string>& args,
                              const std::string& working_dir = "") const;

    // path() relative to basepath, or the absolute path when outside it
    std::string relative_to(const std::filesystem::path& basepath) const;

private:
    std::filesystem::path path_;
    int timeout_seconds_;
};

using VcsFactory = std::function<std::unique_ptr<VcsClient>(const std::filesystem::path&)>;

// Table of backend implementations, handed to configuration building
class VcsRegistry {
public:
    void register_backend(ScmType type, VcsFactory factory);
    bool has_backend(ScmType type) const;

    Result<std::unique_ptr<VcsClient>> create(ScmType type,
                                              const std::filesystem::path& path) const;

private:
    std::unordered_map<ScmType, VcsFactory> factories_;
};

// Registry with the git, hg, svn and bzr command-line backends
VcsRegistry default_registry(int timeout_seconds = 600);

std::string trim_trailing_newlines(std::string s);

} // namespace quilt::vcs
