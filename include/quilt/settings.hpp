#pragma once

#include <quilt/result.hpp>
#include <quilt/log.hpp>
#include <quilt/preparation.hpp>
#include <optional>
#include <string>

namespace quilt {

// [sync] section
struct SyncSettings {
    size_t jobs = 0;            // worker cap, 0 = automatic
    int timeout = 600;          // seconds per backend command
    bool robust = false;
    InstallMode mode = InstallMode::Abort;
    std::optional<std::string> backup_dir;
};

// [log] section
struct LogSettings {
    log::Level level = log::Info;
    std::optional<bool> color;  // unset: detect from the terminal
};

// Layered tool settings: global > workspace > local
// Lower layers override higher layers, key by key
struct Settings {
    SyncSettings sync;
    LogSettings logging;
    // Track which fields were explicitly set (for merge)
    bool jobs_set = false;
    bool timeout_set = false;
    bool robust_set = false;
    bool mode_set = false;
    bool level_set = false;

    // Load from a TOML file (global config or workspace declaration file)
    static Result<Settings> load(const std::string& path);

    // Parse from TOML string; tables other than [sync] and [log] are ignored
    static Result<Settings> parse(const std::string& toml_str);

    // Merge another layer on top (other's explicitly set values override this)
    void merge(const Settings& other);

    // Build effective settings from layers: global -> workspace -> local
    static Settings effective(const std::optional<Settings>& global,
                              const std::optional<Settings>& workspace,
                              const std::optional<Settings>& local);

    // Push the [log] values into quilt::log
    void apply_logging() const;
};

// Discover the global settings file path: ~/.quilt/config.toml
std::string global_settings_path();

} // namespace quilt
