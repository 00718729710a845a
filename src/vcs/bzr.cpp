#include <quilt/vcs/bzr.hpp>
#include <sstream>

namespace quilt::vcs {

namespace fs = std::filesystem;

bool BzrClient::detect_presence() const {
    std::error_code ec;
    return fs::is_directory(path() / ".bzr", ec);
}

Result<std::string> BzrClient::get_url() const {
    auto r = run_checked({"bzr", "config", "parent_location"}, path().string());
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(std::move(r).value()));
}

Status BzrClient::checkout(const std::string& uri,
                           const std::optional<std::string>& version) const {
    std::error_code ec;
    if (fs::exists(path(), ec)) {
        return QuiltError{QuiltError::Vcs,
            "cannot branch into existing path: " + path().string()};
    }
    if (path().has_parent_path()) {
        fs::create_directories(path().parent_path(), ec);
        if (ec) {
            return QuiltError{QuiltError::IO,
                "cannot create " + path().parent_path().string() + ": " + ec.message()};
        }
    }

    std::vector<std::string> args = {"bzr", "branch"};
    if (version.has_value() && !version->empty()) {
        args.push_back("-r");
        args.push_back(*version);
    }
    args.push_back(uri);
    args.push_back(path().string());
    QUILT_TRY(run_checked(args));
    return ok_status();
}

Status BzrClient::update(const std::optional<std::string>& version) const {
    if (!detect_presence()) {
        return QuiltError{QuiltError::Vcs,
            "not a bazaar branch: " + path().string()};
    }

    std::vector<std::string> args = {"bzr", "pull"};
    if (version.has_value() && !version->empty()) {
        args.push_back("-r");
        args.push_back(*version);
    }
    QUILT_TRY(run_checked(args, path().string()));
    return ok_status();
}

Result<std::string> BzrClient::get_version() const {
    auto r = run_checked({"bzr", "revno", "--tree"}, path().string());
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok("-r" + trim_trailing_newlines(std::move(r).value()));
}

Result<std::string> BzrClient::get_status(const fs::path& basepath,
                                          bool untracked) const {
    auto r = run_checked({"bzr", "status", "-S"}, path().string());
    if (r.is_err()) return std::move(r).error();

    std::string lines = untracked ? r.value() : drop_untracked(r.value());

    // "+N  <file>": four marker columns
    return Result<std::string>::ok(prefix_paths(lines, 4, relative_to(basepath)));
}

std::string BzrClient::drop_untracked(const std::string& status) {
    std::string tracked;
    std::istringstream stream(status);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line[0] == '?') continue;
        tracked += line;
        tracked += '\n';
    }
    return tracked;
}

std::vector<std::string> BzrClient::diff_command(const std::string& rel) {
    std::vector<std::string> args = {"bzr", "diff"};
    if (!rel.empty() && rel != ".") {
        args.push_back("--prefix=" + rel + "/:" + rel + "/");
    }
    return args;
}

Result<std::string> BzrClient::get_diff(const fs::path& basepath) const {
    auto r = run(diff_command(relative_to(basepath)), path().string());
    if (r.is_err()) return std::move(r).error();

    // bzr diff exits 1 when there are differences
    auto& cmd = r.value();
    if (cmd.exit_code != 0 && cmd.exit_code != 1) {
        return QuiltError{QuiltError::Vcs,
            "bzr diff failed: " + trim_trailing_newlines(cmd.stderr_str)};
    }
    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

} // namespace quilt::vcs
