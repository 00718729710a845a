#include <quilt/settings.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace quilt {

Result<Settings> Settings::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return QuiltError{QuiltError::Parse,
            std::string("settings TOML parse error: ") + e.what()};
    }

    Settings s;

    // [sync] section
    if (auto sync = doc["sync"].as_table()) {
        if (auto v = (*sync)["jobs"].value<int64_t>()) {
            if (*v < 0) {
                return QuiltError{QuiltError::Config,
                    "sync.jobs must not be negative", "use 0 for automatic"};
            }
            s.sync.jobs = static_cast<size_t>(*v);
            s.jobs_set = true;
        }
        if (auto v = (*sync)["timeout"].value<int64_t>()) {
            if (*v <= 0) {
                return QuiltError{QuiltError::Config,
                    "sync.timeout must be a positive number of seconds"};
            }
            s.sync.timeout = static_cast<int>(*v);
            s.timeout_set = true;
        }
        if (auto v = (*sync)["robust"].value<bool>()) {
            s.sync.robust = *v;
            s.robust_set = true;
        }
        if (auto v = (*sync)["mode"].value<std::string>()) {
            auto mode = parse_install_mode(*v);
            if (mode.is_err()) return std::move(mode).error();
            s.sync.mode = mode.value();
            s.mode_set = true;
        }
        if (auto v = (*sync)["backup-dir"].value<std::string>()) {
            s.sync.backup_dir = std::string(*v);
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto level = log::parse_level(*v);
            if (level.is_err()) return std::move(level).error();
            s.logging.level = level.value();
            s.level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            s.logging.color = *v;
        }
    }

    return Result<Settings>::ok(std::move(s));
}

Result<Settings> Settings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return QuiltError{QuiltError::IO,
            "cannot open settings file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto parsed = Settings::parse(ss.str());
    if (parsed.is_err()) {
        auto err = std::move(parsed).error();
        err.file = path;
        return err;
    }
    return parsed;
}

void Settings::merge(const Settings& other) {
    if (other.jobs_set) {
        sync.jobs = other.sync.jobs;
        jobs_set = true;
    }
    if (other.timeout_set) {
        sync.timeout = other.sync.timeout;
        timeout_set = true;
    }
    if (other.robust_set) {
        sync.robust = other.sync.robust;
        robust_set = true;
    }
    if (other.mode_set) {
        sync.mode = other.sync.mode;
        mode_set = true;
    }
    if (other.sync.backup_dir) {
        sync.backup_dir = other.sync.backup_dir;
    }
    if (other.level_set) {
        logging.level = other.logging.level;
        level_set = true;
    }
    if (other.logging.color) {
        logging.color = other.logging.color;
    }
}

Settings Settings::effective(const std::optional<Settings>& global,
                             const std::optional<Settings>& workspace,
                             const std::optional<Settings>& local) {
    Settings result;
    if (global.has_value()) result.merge(global.value());
    if (workspace.has_value()) result.merge(workspace.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Settings::apply_logging() const {
    log::set_level(logging.level);
    if (logging.color) log::set_color_enabled(*logging.color);
}

std::string global_settings_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.quilt/config.toml";
}

} // namespace quilt
