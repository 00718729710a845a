#include <quilt/commands.hpp>
#include <quilt/distributed_work.hpp>
#include <quilt/selector.hpp>
#include <quilt/log.hpp>
#include <set>

namespace quilt {

namespace fs = std::filesystem;

// Elements a status or diff run covers: the selected one, or every
// version-controlled element
static Result<std::vector<const Element*>> query_targets(const Config& config,
                                                         const std::optional<std::string>& local_name) {
    auto selected = select_element(config.elements(), local_name);
    if (selected.is_err()) return std::move(selected).error();

    std::vector<const Element*> targets;
    if (selected.value() != nullptr) {
        targets.push_back(selected.value());
    } else {
        for (const auto& e : config.elements()) {
            if (e->is_vcs_element()) targets.push_back(e.get());
        }
    }
    return Result<std::vector<const Element*>>::ok(std::move(targets));
}

// ---------------------------------------------------------------------------
// Status / diff
// ---------------------------------------------------------------------------

Result<std::vector<StatusEntry>> cmd_status(const Config& config,
                                            const std::optional<std::string>& local_name,
                                            bool untracked,
                                            size_t jobs) {
    auto targets = query_targets(config, local_name);
    if (targets.is_err()) return std::move(targets).error();

    const fs::path& base = config.base_path();
    DistributedWork<StatusEntry> work(jobs);
    for (const Element* element : targets.value()) {
        work.add([element, &base, untracked]() -> Result<StatusEntry> {
            auto status = element->get_status(base, untracked);
            if (status.is_err()) return std::move(status).error();

            StatusEntry entry{element, std::move(status).value()};
            if (entry.status) {
                entry.status = align_status(element->scm_type(), *entry.status);
            }
            return Result<StatusEntry>::ok(std::move(entry));
        });
    }
    return work.run();
}

Result<std::vector<DiffEntry>> cmd_diff(const Config& config,
                                        const std::optional<std::string>& local_name,
                                        size_t jobs) {
    auto targets = query_targets(config, local_name);
    if (targets.is_err()) return std::move(targets).error();

    const fs::path& base = config.base_path();
    DistributedWork<DiffEntry> work(jobs);
    for (const Element* element : targets.value()) {
        work.add([element, &base]() -> Result<DiffEntry> {
            auto diff = element->get_diff(base);
            if (diff.is_err()) return std::move(diff).error();
            return Result<DiffEntry>::ok(DiffEntry{element, std::move(diff).value()});
        });
    }
    return work.run();
}

// ---------------------------------------------------------------------------
// Install / update
// ---------------------------------------------------------------------------

const char* ElementOutcome::kind_name(Kind k) {
    switch (k) {
        case NoAction: return "no-action";
        case Checkout: return "checkout";
        case Update:   return "update";
        case Skipped:  return "skipped";
        case Failed:   return "failed";
    }
    return "unknown";
}

std::optional<fs::path> absolute_backup_path(const fs::path& base_path,
                                             const std::optional<std::string>& backup_dir) {
    if (!backup_dir.has_value()) return std::nullopt;
    return base_path / *backup_dir;
}

Result<InstallReport> cmd_install_or_update_report(const Config& config,
                                                   const InstallOptions& options) {
    InstallReport report;

    std::error_code ec;
    if (!fs::exists(config.base_path(), ec)) {
        fs::create_directories(config.base_path(), ec);
        if (ec) {
            return QuiltError{QuiltError::IO,
                "cannot create workspace " + config.base_path().string() +
                ": " + ec.message()};
        }
    }

    // One outcome slot per element, filled in by either phase
    const auto& elements = config.elements();
    report.outcomes.reserve(elements.size());
    for (const auto& e : elements) {
        report.outcomes.push_back({e.get(), ElementOutcome::NoAction, ""});
    }

    // Phase 1: sequential preparation in configuration order
    auto backup_path = absolute_backup_path(config.base_path(), options.backup_dir);
    std::vector<PreparationReport> prepared;
    std::vector<size_t> prepared_index;
    std::set<fs::path> claimed_backups;

    for (size_t i = 0; i < elements.size(); ++i) {
        const Element& element = *elements[i];

        auto prep = element.prepare_install(backup_path, options.mode, options.robust);
        std::optional<QuiltError> failure;
        if (prep.is_err()) {
            failure = std::move(prep).error();
        } else if (prep.value() && prep.value()->abort) {
            failure = QuiltError{QuiltError::Preparation,
                "Aborting install because of " +
                prep.value()->error.value_or("a conflict")};
        }

        if (failure) {
            std::string fail_str = "Failed to install tree '" + element.path().string() +
                                   "'\n " + failure->message;
            if (!options.robust) {
                return QuiltError{QuiltError::Preparation, fail_str, failure->hint};
            }
            report.success = false;
            report.outcomes[i].kind = ElementOutcome::Failed;
            report.outcomes[i].message = failure->message;
            quilt::log::warn("Continuing despite %s", fail_str.c_str());
            continue;
        }

        if (!prep.value()) continue;

        PreparationReport& pr = *prep.value();
        if (pr.skip) {
            std::string reason = pr.error.value_or("");
            quilt::log::info("Skipping install of %s because: %s",
                             element.local_name().c_str(), reason.c_str());
            report.outcomes[i].kind = ElementOutcome::Skipped;
            report.outcomes[i].message = reason;
            continue;
        }

        // Backup targets are fixed here so parallel installs never collide
        if (pr.backup && pr.backup_path) {
            pr.backup_target = reserve_backup_target(*pr.backup_path, element.local_name(),
                                                     claimed_backups);
        }

        report.outcomes[i].kind = pr.checkout ? ElementOutcome::Checkout
                                              : ElementOutcome::Update;
        prepared.push_back(std::move(pr));
        prepared_index.push_back(i);
    }

    // Phase 2: parallel installation
    DistributedWork<std::monostate> work(options.jobs);
    for (const auto& pr : prepared) {
        work.add([&pr]() -> Status {
            return pr.element->install(pr);
        });
    }
    auto results = work.run_all();

    std::optional<QuiltError> first_error;
    for (size_t k = 0; k < results.size(); ++k) {
        if (results[k].is_ok()) continue;

        const QuiltError& err = results[k].error();
        auto& outcome = report.outcomes[prepared_index[k]];
        outcome.kind = ElementOutcome::Failed;
        outcome.message = err.message;
        report.success = false;
        if (!first_error) first_error = err;
        if (options.robust) {
            quilt::log::error("Errors during install %s", err.message.c_str());
        }
    }

    if (first_error && !options.robust) {
        return *first_error;
    }
    return Result<InstallReport>::ok(std::move(report));
}

Result<bool> cmd_install_or_update(const Config& config, const InstallOptions& options) {
    auto report = cmd_install_or_update_report(config, options);
    if (report.is_err()) return std::move(report).error();
    return Result<bool>::ok(report.value().success);
}

} // namespace quilt
