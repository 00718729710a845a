#pragma once

#include <quilt/result.hpp>
#include <quilt/commands.hpp>
#include <quilt/config.hpp>
#include <quilt/settings.hpp>
#include <quilt/vcs/client.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace quilt {

// A workspace root holding a declaration file, with its settings and
// configuration loaded
class Workspace {
public:
    // Walk up from start_dir to the nearest directory containing .quilt.toml
    static Result<std::filesystem::path> find_root(const std::filesystem::path& start_dir);

    static Result<Workspace> discover(const std::filesystem::path& start_dir);

    // Load using the command-line backends, timed out per the settings
    static Result<Workspace> load(const std::filesystem::path& workspace_root);

    // Load with an explicit backend registry
    static Result<Workspace> load(const std::filesystem::path& workspace_root,
                                  const vcs::VcsRegistry& registry);

    const Config& config() const { return config_; }
    const Settings& settings() const { return settings_; }
    const std::filesystem::path& root_dir() const { return config_.base_path(); }
    std::filesystem::path config_file() const;

    Result<std::vector<StatusEntry>> status(const std::optional<std::string>& local_name,
                                            bool untracked) const;
    Result<std::vector<DiffEntry>> diff(const std::optional<std::string>& local_name) const;

    // Install options seeded from the [sync] settings
    InstallOptions install_options() const;
    Result<InstallReport> install_or_update(const InstallOptions& options) const;

    // Write the current configuration back to the declaration file
    Status persist(const std::string& header = "") const;

private:
    Workspace(Config config, Settings settings)
        : config_(std::move(config)), settings_(std::move(settings)) {}

    static Result<Settings> load_settings(const std::filesystem::path& config_file);

    static Result<Workspace> load_with(const std::filesystem::path& workspace_root,
                                       Settings settings,
                                       const vcs::VcsRegistry& registry);

    Config config_;
    Settings settings_;
};

} // namespace quilt
