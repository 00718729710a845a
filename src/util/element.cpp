#include <quilt/element.hpp>
#include <quilt/log.hpp>
#include <ctime>
#include <set>
#include <string>

namespace quilt {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// InstallMode
// ---------------------------------------------------------------------------

const char* install_mode_name(InstallMode mode) {
    switch (mode) {
        case InstallMode::Abort:  return "abort";
        case InstallMode::Delete: return "delete";
        case InstallMode::Backup: return "backup";
        case InstallMode::Skip:   return "skip";
    }
    return "unknown";
}

Result<InstallMode> parse_install_mode(const std::string& name) {
    if (name == "overwrite") return Result<InstallMode>::ok(InstallMode::Delete);
    for (InstallMode m : {InstallMode::Abort, InstallMode::Delete,
                          InstallMode::Backup, InstallMode::Skip}) {
        if (name == install_mode_name(m)) return Result<InstallMode>::ok(m);
    }
    return QuiltError{QuiltError::InvalidArg,
        "unknown install mode '" + name + "'",
        "expected one of: abort, delete, backup, skip"};
}

// ---------------------------------------------------------------------------
// OtherElement
// ---------------------------------------------------------------------------

PathSpec OtherElement::path_spec() const {
    PathSpec spec;
    spec.local_name = local_name();
    spec.path = path().string();
    return spec;
}

Result<std::optional<PreparationReport>> OtherElement::prepare_install(
    const std::optional<fs::path>&, InstallMode, bool) const {
    return Result<std::optional<PreparationReport>>::ok(std::nullopt);
}

Status OtherElement::install(const PreparationReport&) const {
    return ok_status();
}

Result<std::optional<std::string>> OtherElement::get_status(const fs::path&, bool) const {
    return Result<std::optional<std::string>>::ok(std::nullopt);
}

Result<std::optional<std::string>> OtherElement::get_diff(const fs::path&) const {
    return Result<std::optional<std::string>>::ok(std::nullopt);
}

Result<std::optional<std::string>> OtherElement::get_version() const {
    return Result<std::optional<std::string>>::ok(std::nullopt);
}

// ---------------------------------------------------------------------------
// VcsElement
// ---------------------------------------------------------------------------

VcsElement::VcsElement(std::string local_name, fs::path path,
                       std::unique_ptr<vcs::VcsClient> client,
                       std::string uri, std::optional<std::string> version)
    : Element(std::move(local_name), std::move(path)),
      client_(std::move(client)),
      uri_(std::move(uri)),
      version_(std::move(version)) {}

PathSpec VcsElement::path_spec() const {
    PathSpec spec;
    spec.local_name = local_name();
    spec.path = path().string();
    spec.scm = scm_type();
    spec.uri = uri_;
    spec.version = version_;
    return spec;
}

std::optional<std::string> VcsElement::conflict() const {
    if (!client_->detect_presence()) {
        return std::string("Failed to detect ") + scm_name(scm_type()) +
               " presence at " + path().string();
    }

    auto url = client_->get_url();
    if (url.is_err()) {
        return "Cannot determine url of " + path().string() + ": " + url.error().message;
    }
    if (url.value().empty() || !client_->url_matches(url.value(), uri_)) {
        return "Url " + url.value() + " does not match " + uri_ + " requested";
    }
    return std::nullopt;
}

Result<std::optional<PreparationReport>> VcsElement::prepare_install(
    const std::optional<fs::path>& backup_path,
    InstallMode mode, bool robust) const {
    PreparationReport report(this);

    std::error_code ec;
    if (!fs::exists(path(), ec) && !client_->detect_presence()) {
        report.checkout = true;
        return Result<std::optional<PreparationReport>>::ok(std::move(report));
    }

    auto problem = conflict();
    if (!problem) {
        report.checkout = false;
        return Result<std::optional<PreparationReport>>::ok(std::move(report));
    }

    // Robust runs never resolve conflicts, the orchestrator moves on
    if (robust) {
        return QuiltError{QuiltError::Preparation,
            "Update Failed of " + path().string() + ": " + *problem};
    }

    switch (mode) {
        case InstallMode::Abort:
            report.abort = true;
            report.error = *problem;
            break;
        case InstallMode::Skip:
            report.skip = true;
            report.error = *problem;
            break;
        case InstallMode::Delete:
            report.checkout = true;
            report.backup = false;
            break;
        case InstallMode::Backup:
            if (!backup_path) {
                return QuiltError{QuiltError::Preparation,
                    "cannot back up " + path().string() + ": no backup directory given",
                    *problem};
            }
            report.checkout = true;
            report.backup = true;
            report.backup_path = backup_path;
            break;
    }
    return Result<std::optional<PreparationReport>>::ok(std::move(report));
}

static std::string timestamp_suffix() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "_%Y-%m-%d-%H-%M-%S", &tm_buf);
    return buf;
}

// Local names may be absolute or climb out with "..", keep them below the
// backup directory.
static fs::path backup_entry_name(const std::string& local_name) {
    fs::path rel = fs::path(local_name).relative_path().lexically_normal();
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        rel = fs::path(local_name).lexically_normal().filename();
    }
    if (rel.empty() || rel == "." || rel == "..") rel = "tree";
    return rel;
}

fs::path reserve_backup_target(const fs::path& backup_dir,
                               const std::string& local_name,
                               std::set<fs::path>& claimed) {
    auto taken = [&claimed](const fs::path& p) {
        std::error_code ec;
        return claimed.count(p) > 0 || fs::exists(fs::symlink_status(p, ec));
    };

    fs::path base = backup_dir / backup_entry_name(local_name);
    fs::path target = base;
    if (taken(target)) {
        base += timestamp_suffix();
        target = base;
        for (int n = 1; taken(target); ++n) {
            target = base;
            target += "_" + std::to_string(n);
        }
    }
    claimed.insert(target);
    return target;
}

Status VcsElement::backup(const fs::path& target) const {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return QuiltError{QuiltError::Install,
            "[" + local_name() + "] cannot create backup directory " +
            target.parent_path().string() + ": " + ec.message()};
    }
    if (fs::exists(fs::symlink_status(target, ec))) {
        return QuiltError{QuiltError::Install,
            "[" + local_name() + "] backup target " + target.string() +
            " already exists"};
    }

    quilt::log::info("[%s] Backing up %s to %s", local_name().c_str(),
                     path().c_str(), target.c_str());
    ec.clear();
    fs::rename(path(), target, ec);
    if (ec == std::errc::cross_device_link) {
        ec.clear();
        fs::copy(path(), target, fs::copy_options::recursive |
                                 fs::copy_options::copy_symlinks, ec);
        if (!ec) fs::remove_all(path(), ec);
    }
    if (ec) {
        return QuiltError{QuiltError::Install,
            "[" + local_name() + "] backup of " + path().string() + " to " +
            target.string() + " failed: " + ec.message()};
    }
    return ok_status();
}

Status VcsElement::install(const PreparationReport& report) const {
    if (!report.checkout) {
        quilt::log::info("[%s] Updating %s", local_name().c_str(), path().c_str());
        auto st = client_->update(version_);
        if (st.is_err()) {
            return QuiltError{QuiltError::Install,
                "[" + local_name() + "] Update Failed of " + path().string() +
                ": " + st.error().message};
        }
        quilt::log::info("[%s] Done.", local_name().c_str());
        return ok_status();
    }

    std::error_code ec;
    if (fs::exists(path(), ec)) {
        if (report.backup) {
            if (!report.backup_path) {
                return QuiltError{QuiltError::Install,
                    "[" + local_name() + "] Cannot install " + path().string() +
                    ", backup disabled"};
            }
            fs::path target;
            if (report.backup_target) {
                target = *report.backup_target;
            } else {
                std::set<fs::path> claimed;
                target = reserve_backup_target(*report.backup_path, local_name(), claimed);
            }
            QUILT_TRY(backup(target));
        } else {
            fs::remove_all(path(), ec);
            if (ec) {
                return QuiltError{QuiltError::Install,
                    "[" + local_name() + "] cannot remove " + path().string() +
                    ": " + ec.message()};
            }
        }
    }

    quilt::log::info("[%s] Fetching %s (version %s) to %s", local_name().c_str(),
                     uri_.c_str(), version_ ? version_->c_str() : "default",
                     path().c_str());
    auto st = client_->checkout(uri_, version_);
    if (st.is_err()) {
        return QuiltError{QuiltError::Install,
            "[" + local_name() + "] Checkout of " + uri_ + " into " +
            path().string() + " failed: " + st.error().message};
    }
    quilt::log::info("[%s] Done.", local_name().c_str());
    return ok_status();
}

Result<std::optional<std::string>> VcsElement::get_status(const fs::path& basepath,
                                                          bool untracked) const {
    std::error_code ec;
    if (!fs::exists(path(), ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    auto r = client_->get_status(basepath, untracked);
    if (r.is_err()) return std::move(r).error();
    return Result<std::optional<std::string>>::ok(std::move(r).value());
}

Result<std::optional<std::string>> VcsElement::get_diff(const fs::path& basepath) const {
    std::error_code ec;
    if (!fs::exists(path(), ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    auto r = client_->get_diff(basepath);
    if (r.is_err()) return std::move(r).error();
    return Result<std::optional<std::string>>::ok(std::move(r).value());
}

Result<std::optional<std::string>> VcsElement::get_version() const {
    if (!client_->detect_presence()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    auto r = client_->get_version();
    if (r.is_err()) return std::move(r).error();
    return Result<std::optional<std::string>>::ok(std::move(r).value());
}

} // namespace quilt
