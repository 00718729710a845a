#include <quilt/vcs/svn.hpp>

namespace quilt::vcs {

namespace fs = std::filesystem;

bool SvnClient::detect_presence() const {
    std::error_code ec;
    return fs::is_directory(path() / ".svn", ec);
}

Result<std::string> SvnClient::get_url() const {
    auto r = run_checked({"svn", "info", "--non-interactive",
                          "--show-item", "url", path().string()});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(std::move(r).value()));
}

Status SvnClient::checkout(const std::string& uri,
                           const std::optional<std::string>& version) const {
    std::error_code ec;
    if (fs::exists(path(), ec)) {
        return QuiltError{QuiltError::Vcs,
            "cannot check out into existing path: " + path().string()};
    }

    std::vector<std::string> args = {"svn", "checkout", "--non-interactive"};
    if (version.has_value() && !version->empty()) {
        args.push_back("-r");
        args.push_back(*version);
    }
    args.push_back(uri);
    args.push_back(path().string());
    QUILT_TRY(run_checked(args));
    return ok_status();
}

Status SvnClient::update(const std::optional<std::string>& version) const {
    if (!detect_presence()) {
        return QuiltError{QuiltError::Vcs,
            "not a subversion working copy: " + path().string()};
    }

    std::vector<std::string> args = {"svn", "update", "--non-interactive"};
    if (version.has_value() && !version->empty()) {
        args.push_back("-r");
        args.push_back(*version);
    }
    args.push_back(path().string());
    QUILT_TRY(run_checked(args));
    return ok_status();
}

Result<std::string> SvnClient::get_version() const {
    auto r = run_checked({"svn", "info", "--non-interactive",
                          "--show-item", "revision", path().string()});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok("-r" + trim_trailing_newlines(std::move(r).value()));
}

// svn prints paths as given on the command line, so run from basepath
// with the relative path instead of rewriting its output.
Result<std::string> SvnClient::get_status(const fs::path& basepath,
                                          bool untracked) const {
    return run_checked(status_command(relative_to(basepath), untracked), basepath.string());
}

Result<std::string> SvnClient::get_diff(const fs::path& basepath) const {
    return run_checked(diff_command(relative_to(basepath)), basepath.string());
}

std::vector<std::string> SvnClient::status_command(const std::string& rel, bool untracked) {
    std::vector<std::string> args = {"svn", "status", "--non-interactive"};
    if (!untracked) args.push_back("-q");
    args.push_back(rel);
    return args;
}

std::vector<std::string> SvnClient::diff_command(const std::string& rel) {
    return {"svn", "diff", "--non-interactive", rel};
}

} // namespace quilt::vcs
