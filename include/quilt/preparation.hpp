#pragma once

#include <quilt/result.hpp>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace quilt {

class Element;

// Conflict resolution when a path exists but does not hold the declared tree
enum class InstallMode {
    Abort,   // stop the whole run
    Delete,  // remove the existing tree and check out fresh
    Backup,  // move the existing tree to the backup directory first
    Skip     // leave the element untouched
};

const char* install_mode_name(InstallMode mode);

// Accepts abort, delete, backup, skip, and overwrite as an alias of delete
Result<InstallMode> parse_install_mode(const std::string& name);

// Pick the location below backup_dir that a tree named local_name is moved
// to: backup_dir/<local_name>, then with a timestamp suffix, then with a
// counter, skipping anything that exists or is already in `claimed`. The
// result is added to `claimed`.
std::filesystem::path reserve_backup_target(const std::filesystem::path& backup_dir,
                                            const std::string& local_name,
                                            std::set<std::filesystem::path>& claimed);

// Outcome of the prepare phase for one element, consumed by the install phase
struct PreparationReport {
    const Element* element = nullptr;   // non-owning
    bool checkout = true;                // false: update the existing tree
    bool backup = false;
    std::optional<std::filesystem::path> backup_path;    // backup directory
    std::optional<std::filesystem::path> backup_target;  // where this tree goes
    bool abort = false;
    bool skip = false;
    std::optional<std::string> error;

    explicit PreparationReport(const Element* e) : element(e) {}

    // Neither aborted nor skipped
    bool proceeds() const { return !abort && !skip; }
};

} // namespace quilt
