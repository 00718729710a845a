#include <quilt/vcs/client.hpp>
#include <quilt/vcs/git.hpp>
#include <quilt/vcs/hg.hpp>
#include <quilt/vcs/svn.hpp>
#include <quilt/vcs/bzr.hpp>
#include <quilt/log.hpp>
#include <sstream>

namespace quilt::vcs {

namespace fs = std::filesystem;

static std::string strip_trailing_slashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

bool VcsClient::url_matches(const std::string& current,
                            const std::string& requested) const {
    std::string cur = strip_trailing_slashes(current);
    std::string req = strip_trailing_slashes(requested);
    if (cur == req) return true;

    // Local repositories may be spelled differently but name the same directory
    std::error_code ec;
    if (fs::is_directory(cur, ec) && fs::is_directory(req, ec)) {
        return fs::equivalent(cur, req, ec);
    }
    return false;
}

Result<CommandResult> VcsClient::run(const std::vector<std::string>& args,
                                     const std::string& working_dir) const {
    quilt::log::debug("%s", describe_command(args).c_str());
    return run_command(args, working_dir, timeout_seconds_);
}

Result<std::string> VcsClient::run_checked(const std::vector<std::string>& args,
                                           const std::string& working_dir) const {
    auto r = run(args, working_dir);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (!cmd.succeeded()) {
        return QuiltError{QuiltError::Vcs,
            describe_command(args) + " failed: " + trim_trailing_newlines(cmd.stderr_str)};
    }
    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

std::string VcsClient::relative_to(const fs::path& basepath) const {
    std::error_code ec;
    fs::path rel = fs::relative(path_, basepath, ec);
    if (ec || rel.empty()) return path_.string();
    std::string s = rel.string();
    if (s.rfind("..", 0) == 0) return path_.string();
    return s;
}

std::string VcsClient::prefix_paths(const std::string& text, size_t columns,
                                    const std::string& prefix) {
    if (prefix.empty() || prefix == ".") return text;

    std::string out;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.size() > columns) {
            out += line.substr(0, columns);
            out += prefix;
            out += '/';
            out += line.substr(columns);
        } else {
            out += line;
        }
        out += '\n';
    }
    return out;
}

std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

// ---------------------------------------------------------------------------
// VcsRegistry
// ---------------------------------------------------------------------------

void VcsRegistry::register_backend(ScmType type, VcsFactory factory) {
    factories_[type] = std::move(factory);
}

bool VcsRegistry::has_backend(ScmType type) const {
    return factories_.count(type) > 0;
}

Result<std::unique_ptr<VcsClient>> VcsRegistry::create(ScmType type,
                                                       const fs::path& path) const {
    auto it = factories_.find(type);
    if (it == factories_.end()) {
        return QuiltError{QuiltError::Config,
            std::string("no backend registered for scm '") + scm_name(type) + "'",
            "supported backends: git, hg, svn, bzr"};
    }
    auto client = it->second(path);
    if (!client) {
        return QuiltError{QuiltError::Internal,
            std::string("backend factory for '") + scm_name(type) + "' returned no client"};
    }
    return Result<std::unique_ptr<VcsClient>>::ok(std::move(client));
}

VcsRegistry default_registry(int timeout_seconds) {
    VcsRegistry registry;
    registry.register_backend(ScmType::Git, [timeout_seconds](const fs::path& p) {
        return std::make_unique<GitClient>(p, timeout_seconds);
    });
    registry.register_backend(ScmType::Hg, [timeout_seconds](const fs::path& p) {
        return std::make_unique<HgClient>(p, timeout_seconds);
    });
    registry.register_backend(ScmType::Svn, [timeout_seconds](const fs::path& p) {
        return std::make_unique<SvnClient>(p, timeout_seconds);
    });
    registry.register_backend(ScmType::Bzr, [timeout_seconds](const fs::path& p) {
        return std::make_unique<BzrClient>(p, timeout_seconds);
    });
    return registry;
}

} // namespace quilt::vcs
