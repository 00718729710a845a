#include <quilt/workspace.hpp>
#include <quilt/config_file.hpp>
#include <quilt/log.hpp>

namespace quilt {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

Result<fs::path> Workspace::find_root(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return QuiltError{QuiltError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        if (fs::is_regular_file(dir / kDefaultConfigFilename, ec)) {
            return Result<fs::path>::ok(dir);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return QuiltError{QuiltError::NotFound,
                "no workspace root found from: " + start_dir.string(),
                std::string("create a ") + kDefaultConfigFilename + " declaring the trees"};
        }
        dir = parent;
    }
}

Result<Workspace> Workspace::discover(const fs::path& start_dir) {
    auto root = find_root(start_dir);
    if (root.is_err()) return std::move(root).error();
    return Workspace::load(root.value());
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

Result<Settings> Workspace::load_settings(const fs::path& config_file) {
    std::optional<Settings> global;
    auto gpath = global_settings_path();
    std::error_code ec;
    if (!gpath.empty() && fs::exists(gpath, ec)) {
        auto gs = Settings::load(gpath);
        if (gs.is_err()) return std::move(gs).error();
        global = std::move(gs).value();
    }

    std::optional<Settings> workspace;
    if (fs::exists(config_file, ec)) {
        auto ws = Settings::load(config_file.string());
        if (ws.is_err()) return std::move(ws).error();
        workspace = std::move(ws).value();
    }

    return Result<Settings>::ok(Settings::effective(global, workspace, std::nullopt));
}

Result<Workspace> Workspace::load(const fs::path& workspace_root) {
    auto settings = load_settings(workspace_root / kDefaultConfigFilename);
    if (settings.is_err()) return std::move(settings).error();

    auto registry = vcs::default_registry(settings.value().sync.timeout);
    return load_with(workspace_root, std::move(settings).value(), registry);
}

Result<Workspace> Workspace::load(const fs::path& workspace_root,
                                  const vcs::VcsRegistry& registry) {
    auto settings = load_settings(workspace_root / kDefaultConfigFilename);
    if (settings.is_err()) return std::move(settings).error();
    return load_with(workspace_root, std::move(settings).value(), registry);
}

Result<Workspace> Workspace::load_with(const fs::path& workspace_root, Settings settings,
                                       const vcs::VcsRegistry& registry) {
    settings.apply_logging();

    auto config = get_config(workspace_root, std::nullopt,
                             std::string(kDefaultConfigFilename), registry);
    if (config.is_err()) return std::move(config).error();

    quilt::log::debug("workspace %s: %zu trees",
                      config.value().base_path().c_str(), config.value().size());
    return Result<Workspace>::ok(
        Workspace(std::move(config).value(), std::move(settings)));
}

fs::path Workspace::config_file() const {
    const std::string& name = config_.config_filename().empty()
        ? std::string(kDefaultConfigFilename) : config_.config_filename();
    return config_.base_path() / name;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

Result<std::vector<StatusEntry>> Workspace::status(const std::optional<std::string>& local_name,
                                                   bool untracked) const {
    return cmd_status(config_, local_name, untracked, settings_.sync.jobs);
}

Result<std::vector<DiffEntry>> Workspace::diff(const std::optional<std::string>& local_name) const {
    return cmd_diff(config_, local_name, settings_.sync.jobs);
}

InstallOptions Workspace::install_options() const {
    InstallOptions options;
    options.backup_dir = settings_.sync.backup_dir;
    options.mode = settings_.sync.mode;
    options.robust = settings_.sync.robust;
    options.jobs = settings_.sync.jobs;
    return options;
}

Result<InstallReport> Workspace::install_or_update(const InstallOptions& options) const {
    return cmd_install_or_update_report(config_, options);
}

Status Workspace::persist(const std::string& header) const {
    return persist_config(config_, config_file(), header);
}

} // namespace quilt
