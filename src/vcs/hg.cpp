#include <quilt/vcs/hg.hpp>
#include <sstream>

namespace quilt::vcs {

namespace fs = std::filesystem;

bool HgClient::detect_presence() const {
    std::error_code ec;
    return fs::is_directory(path() / ".hg", ec);
}

Result<std::string> HgClient::get_url() const {
    auto r = run_checked({"hg", "paths", "default"}, path().string());
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(std::move(r).value()));
}

Status HgClient::checkout(const std::string& uri,
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

    QUILT_TRY(run_checked({"hg", "clone", "--noninteractive", uri, path().string()}));
    if (version.has_value() && !version->empty()) {
        QUILT_TRY(run_checked({"hg", "update", "--noninteractive", "-r", *version},
                              path().string()));
    }
    return ok_status();
}

Status HgClient::update(const std::optional<std::string>& version) const {
    if (!detect_presence()) {
        return QuiltError{QuiltError::Vcs,
            "not a mercurial working tree: " + path().string()};
    }

    QUILT_TRY(run_checked({"hg", "pull", "--noninteractive"}, path().string()));
    std::vector<std::string> args = {"hg", "update", "--noninteractive"};
    if (version.has_value() && !version->empty()) {
        args.push_back("-r");
        args.push_back(*version);
    }
    QUILT_TRY(run_checked(args, path().string()));
    return ok_status();
}

Result<std::string> HgClient::get_version() const {
    auto r = run_checked({"hg", "identify", "-i", "--debug"}, path().string());
    if (r.is_err()) return std::move(r).error();
    std::string id = trim_trailing_newlines(std::move(r).value());
    // A trailing '+' marks uncommitted changes
    if (!id.empty() && id.back() == '+') id.pop_back();
    return Result<std::string>::ok(std::move(id));
}

Result<std::string> HgClient::get_status(const fs::path& basepath,
                                         bool untracked) const {
    std::vector<std::string> args = {"hg", "status"};
    if (!untracked) args.push_back("-mard");
    auto r = run_checked(args, path().string());
    if (r.is_err()) return std::move(r).error();

    // "M <file>": two marker columns
    return Result<std::string>::ok(
        prefix_paths(r.value(), 2, relative_to(basepath)));
}

Result<std::string> HgClient::get_diff(const fs::path& basepath) const {
    auto r = run_checked({"hg", "diff", "-g"}, path().string());
    if (r.is_err()) return std::move(r).error();

    return Result<std::string>::ok(rewrite_diff_headers(r.value(), relative_to(basepath)));
}

std::string HgClient::rewrite_diff_headers(const std::string& diff, const std::string& rel) {
    if (rel.empty() || rel == ".") return diff;

    std::string out;
    std::istringstream stream(diff);
    std::string line;
    while (std::getline(stream, line)) {
        for (const char* head : {"--- a/", "+++ b/", "diff --git a/"}) {
            std::string h(head);
            if (line.compare(0, h.size(), h) == 0) {
                line.insert(h.size(), rel + "/");
                auto b = line.find(" b/", h.size() + rel.size() + 1);
                if (h == "diff --git a/" && b != std::string::npos) {
                    line.insert(b + 3, rel + "/");
                }
                break;
            }
        }
        out += line;
        out += '\n';
    }
    return out;
}

} // namespace quilt::vcs
