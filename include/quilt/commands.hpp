#pragma once

#include <quilt/result.hpp>
#include <quilt/config.hpp>
#include <quilt/preparation.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quilt {

struct StatusEntry {
    const Element* element;
    std::optional<std::string> status;  // aligned to kAlignedStatusColumns
};

struct DiffEntry {
    const Element* element;
    std::optional<std::string> diff;
};

// Status of every version-controlled element, or only of the selected one,
// gathered in parallel and returned in configuration order.
Result<std::vector<StatusEntry>> cmd_status(const Config& config,
                                            const std::optional<std::string>& local_name = std::nullopt,
                                            bool untracked = false,
                                            size_t jobs = 0);

Result<std::vector<DiffEntry>> cmd_diff(const Config& config,
                                        const std::optional<std::string>& local_name = std::nullopt,
                                        size_t jobs = 0);

struct InstallOptions {
    // Relative to the configuration's base path
    std::optional<std::string> backup_dir;
    InstallMode mode = InstallMode::Abort;
    // Record failures and carry on with the remaining elements
    bool robust = false;
    // Worker cap for the install phase, 0 for automatic
    size_t jobs = 0;
};

struct ElementOutcome {
    enum Kind { NoAction, Checkout, Update, Skipped, Failed };

    const Element* element;
    Kind kind;
    std::string message;

    static const char* kind_name(Kind k);
};

struct InstallReport {
    bool success = true;
    std::vector<ElementOutcome> outcomes;  // configuration order
};

// Prepare every element in order, then install the prepared ones in
// parallel. Without robust the first failure is returned as the error.
Result<InstallReport> cmd_install_or_update_report(const Config& config,
                                                   const InstallOptions& options);

// Same run, reporting only whether everything succeeded
Result<bool> cmd_install_or_update(const Config& config, const InstallOptions& options);

// base_path/backup_dir, or nothing without a backup_dir
std::optional<std::filesystem::path> absolute_backup_path(
    const std::filesystem::path& base_path,
    const std::optional<std::string>& backup_dir);

} // namespace quilt
