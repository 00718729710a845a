#include <quilt/vcs/git.hpp>
#include <quilt/log.hpp>

namespace quilt::vcs {

namespace fs = std::filesystem;

bool GitClient::detect_presence() const {
    std::error_code ec;
    return fs::exists(path() / ".git", ec);
}

Result<std::string> GitClient::get_url() const {
    auto r = run_checked({"git", "-C", path().string(),
                          "config", "--get", "remote.origin.url"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(std::move(r).value()));
}

Status GitClient::checkout(const std::string& uri,
                           const std::optional<std::string>& version) const {
    std::error_code ec;
    if (fs::exists(path(), ec)) {
        return QuiltError{QuiltError::Vcs,
            "cannot clone into existing path: " + path().string()};
    }
    if (path().has_parent_path()) {
        fs::create_directories(path().parent_path(), ec);
        if (ec) {
            return QuiltError{QuiltError::IO,
                "cannot create " + path().parent_path().string() + ": " + ec.message()};
        }
    }

    QUILT_TRY(run_checked({"git", "clone", "--recursive", uri, path().string()}));

    if (version.has_value() && !version->empty()) {
        QUILT_TRY(run_checked({"git", "-C", path().string(), "checkout", *version}));
        QUILT_TRY(run_checked({"git", "-C", path().string(),
                               "submodule", "update", "--init", "--recursive"}));
    }
    return ok_status();
}

bool GitClient::tracks_upstream() const {
    auto r = run({"git", "-C", path().string(),
                  "rev-parse", "--abbrev-ref", "--symbolic-full-name", "@{u}"});
    return r.is_ok() && r.value().succeeded();
}

Status GitClient::update(const std::optional<std::string>& version) const {
    if (!detect_presence()) {
        return QuiltError{QuiltError::Vcs,
            "not a git working tree: " + path().string()};
    }

    QUILT_TRY(run_checked({"git", "-C", path().string(), "fetch", "--tags", "origin"}));

    if (version.has_value() && !version->empty()) {
        QUILT_TRY(run_checked({"git", "-C", path().string(), "checkout", *version}));
    }

    // Detached heads (tags, shas) are already where they need to be
    if (tracks_upstream()) {
        QUILT_TRY(run_checked({"git", "-C", path().string(), "merge", "--ff-only", "@{u}"}));
    }

    QUILT_TRY(run_checked({"git", "-C", path().string(),
                           "submodule", "update", "--init", "--recursive"}));
    return ok_status();
}

Result<std::string> GitClient::get_version() const {
    auto r = run_checked({"git", "-C", path().string(), "rev-parse", "HEAD"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(std::move(r).value()));
}

Result<std::string> GitClient::get_status(const fs::path& basepath,
                                          bool untracked) const {
    auto r = run_checked({"git", "-C", path().string(), "status", "--porcelain",
                          untracked ? "--untracked-files=all" : "--untracked-files=no"});
    if (r.is_err()) return std::move(r).error();

    // porcelain: "XY <file>", the marker occupies three columns
    return Result<std::string>::ok(
        prefix_paths(r.value(), 3, relative_to(basepath)));
}

Result<std::string> GitClient::get_diff(const fs::path& basepath) const {
    std::string rel = relative_to(basepath);
    std::vector<std::string> args = {"git", "-C", path().string(), "diff"};
    if (!rel.empty() && rel != ".") {
        args.push_back("--src-prefix=a/" + rel + "/");
        args.push_back("--dst-prefix=b/" + rel + "/");
    }
    return run_checked(args);
}

} // namespace quilt::vcs
