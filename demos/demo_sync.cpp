// demo_sync.cpp
//
// Runs the workspace commands against a directory holding a .quilt.toml:
//
//     ./demo_sync                       # status of the workspace around cwd
//     ./demo_sync ~/ws status [name]    # aligned status of all trees or one
//     ./demo_sync ~/ws diff [name]
//     ./demo_sync ~/ws install          # check out / update everything
//
// Install honours the [sync] settings of the workspace (mode, robust,
// backup-dir, jobs, timeout).

#include <quilt/workspace.hpp>
#include <quilt/log.hpp>

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace quilt;

static int report_error(const QuiltError& err) {
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return 1;
}

static int run_status(const Workspace& ws, const std::optional<std::string>& name) {
    auto entries = ws.status(name, false);
    if (entries.is_err()) return report_error(entries.error());

    for (const auto& entry : entries.value()) {
        if (entry.status && !entry.status->empty()) {
            std::fputs(entry.status->c_str(), stdout);
        }
    }
    return 0;
}

static int run_diff(const Workspace& ws, const std::optional<std::string>& name) {
    auto entries = ws.diff(name);
    if (entries.is_err()) return report_error(entries.error());

    for (const auto& entry : entries.value()) {
        if (entry.diff && !entry.diff->empty()) {
            std::fputs(entry.diff->c_str(), stdout);
        }
    }
    return 0;
}

static int run_install(const Workspace& ws) {
    auto report = ws.install_or_update(ws.install_options());
    if (report.is_err()) return report_error(report.error());

    for (const auto& outcome : report.value().outcomes) {
        std::printf("%-10s %s%s%s\n",
                    ElementOutcome::kind_name(outcome.kind),
                    outcome.element->local_name().c_str(),
                    outcome.message.empty() ? "" : ": ",
                    outcome.message.c_str());
    }

    if (!report.value().success) {
        quilt::log::error("install finished with errors");
        return 1;
    }
    quilt::log::info("update complete");
    return 0;
}

int main(int argc, char** argv) {
    fs::path start = argc > 1 ? fs::path(argv[1]) : fs::current_path();
    std::string command = argc > 2 ? argv[2] : "status";
    std::optional<std::string> name;
    if (argc > 3) name = std::string(argv[3]);

    auto ws = Workspace::discover(start);
    if (ws.is_err()) return report_error(ws.error());

    if (command == "status") return run_status(ws.value(), name);
    if (command == "diff") return run_diff(ws.value(), name);
    if (command == "install") return run_install(ws.value());

    return report_error(QuiltError{QuiltError::InvalidArg,
        "unknown command '" + command + "'",
        "usage: demo_sync [workspace] [status|diff|install] [name]"});
}
