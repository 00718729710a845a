#include <catch2/catch.hpp>
#include <quilt/commands.hpp>
#include "fake_vcs.hpp"
#include "temp_dir.hpp"
#include <algorithm>
#include <vector>

using namespace quilt;
namespace fs = std::filesystem;
using quilt_test::TempDir;
using quilt_test::FakeBackend;

static PathSpec git(const std::string& name) {
    PathSpec spec;
    spec.local_name = name;
    spec.scm = ScmType::Git;
    spec.uri = "https://example.com/" + name + ".git";
    return spec;
}

static PathSpec plain(const std::string& name) {
    PathSpec spec;
    spec.local_name = name;
    return spec;
}

static Config build(const std::vector<PathSpec>& specs, const fs::path& base,
                    FakeBackend& backend) {
    auto r = Config::build(specs, base, backend.registry());
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// Mark base/name as an existing checkout of the declared repository
static void checked_out(FakeBackend& backend, const TempDir& td, const std::string& name) {
    td.make_dir(name);
    auto tree = backend.tree(td.path / name);
    tree->present = true;
    tree->url = "https://example.com/" + name + ".git";
}

// ===== Install / update =====

TEST_CASE("fresh workspace checks out every tree", "[commands]") {
    TempDir td;
    FakeBackend backend;
    auto config = build({git("a"), plain("notes"), git("b")}, td.path / "ws", backend);

    auto r = cmd_install_or_update_report(config, InstallOptions{});
    REQUIRE(r.is_ok());
    const auto& report = r.value();
    REQUIRE(report.success);
    REQUIRE(report.outcomes.size() == 3);
    REQUIRE(report.outcomes[0].kind == ElementOutcome::Checkout);
    REQUIRE(report.outcomes[1].kind == ElementOutcome::NoAction);
    REQUIRE(report.outcomes[2].kind == ElementOutcome::Checkout);

    // Workspace directory is created on demand
    REQUIRE(fs::is_directory(td.path / "ws"));
    REQUIRE(backend.tree(td.path / "ws/a")->checkouts.load() == 1);
    REQUIRE(backend.tree(td.path / "ws/b")->checkouts.load() == 1);
}

TEST_CASE("existing checkouts are updated", "[commands]") {
    TempDir td;
    FakeBackend backend;
    checked_out(backend, td, "a");
    auto config = build({git("a"), git("b")}, td.path, backend);

    auto r = cmd_install_or_update_report(config, InstallOptions{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().outcomes[0].kind == ElementOutcome::Update);
    REQUIRE(r.value().outcomes[1].kind == ElementOutcome::Checkout);
    REQUIRE(backend.tree(td.path / "a")->updates.load() == 1);
    REQUIRE(backend.tree(td.path / "a")->checkouts.load() == 0);
}

TEST_CASE("conflict without robust stops preparation", "[commands]") {
    TempDir td;
    FakeBackend backend;
    checked_out(backend, td, "a");
    td.write_file("b/foreign.txt", "x");
    checked_out(backend, td, "c");
    auto config = build({git("a"), git("b"), git("c")}, td.path, backend);

    auto r = cmd_install_or_update(config, InstallOptions{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == QuiltError::Preparation);
    REQUIRE(r.error().message.find("Failed to install tree '" +
                                   (td.path / "b").string() + "'") == 0);
    REQUIRE(r.error().message.find("Aborting install because of") != std::string::npos);

    // Nothing was installed and the third tree was never looked at
    REQUIRE(backend.was_called("detect:b"));
    REQUIRE_FALSE(backend.was_called("detect:c"));
    REQUIRE_FALSE(backend.was_called("update:a"));
}

TEST_CASE("conflict with robust carries on", "[commands]") {
    TempDir td;
    FakeBackend backend;
    checked_out(backend, td, "a");
    td.write_file("b/foreign.txt", "x");
    checked_out(backend, td, "c");
    auto config = build({git("a"), git("b"), git("c")}, td.path, backend);

    InstallOptions options;
    options.robust = true;
    options.mode = InstallMode::Delete;

    auto r = cmd_install_or_update_report(config, options);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().success);
    REQUIRE(r.value().outcomes[0].kind == ElementOutcome::Update);
    REQUIRE(r.value().outcomes[1].kind == ElementOutcome::Failed);
    REQUIRE(r.value().outcomes[2].kind == ElementOutcome::Update);

    // Robust runs never delete a conflicting tree
    REQUIRE(fs::exists(td.path / "b/foreign.txt"));
    REQUIRE(backend.was_called("update:c"));

    auto plain_result = cmd_install_or_update(config, options);
    REQUIRE(plain_result.is_ok());
    REQUIRE_FALSE(plain_result.value());
}

TEST_CASE("skip mode leaves conflicting trees alone", "[commands]") {
    TempDir td;
    FakeBackend backend;
    td.write_file("a/foreign.txt", "x");
    auto config = build({git("a"), git("b")}, td.path, backend);

    InstallOptions options;
    options.mode = InstallMode::Skip;
    auto r = cmd_install_or_update_report(config, options);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().success);
    REQUIRE(r.value().outcomes[0].kind == ElementOutcome::Skipped);
    REQUIRE(r.value().outcomes[0].message.find("Failed to detect") == 0);
    REQUIRE(r.value().outcomes[1].kind == ElementOutcome::Checkout);
    REQUIRE(fs::exists(td.path / "a/foreign.txt"));
}

TEST_CASE("backup mode uses the backup directory below the base", "[commands]") {
    TempDir td;
    FakeBackend backend;
    td.write_file("a/foreign.txt", "x");
    auto config = build({git("a")}, td.path, backend);

    InstallOptions options;
    options.mode = InstallMode::Backup;
    options.backup_dir = ".backup";
    auto r = cmd_install_or_update_report(config, options);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().success);
    REQUIRE(td.read_file(".backup/a/foreign.txt") == "x");
    REQUIRE(backend.tree(td.path / "a")->checkouts.load() == 1);
}

TEST_CASE("backup mode gives same-named trees their own backups", "[commands]") {
    TempDir td;
    FakeBackend backend;
    td.write_file("one/foreign.txt", "first");
    td.write_file("two/foreign.txt", "second");
    PathSpec one = git("dup");
    one.path = "one";
    PathSpec two = git("dup");
    two.path = "two";
    auto config = build({one, two}, td.path, backend);

    InstallOptions options;
    options.mode = InstallMode::Backup;
    options.backup_dir = ".backup";
    options.jobs = 2;
    auto r = cmd_install_or_update_report(config, options);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().success);

    std::vector<std::string> kept;
    for (const auto& entry : fs::directory_iterator(td.path / ".backup")) {
        kept.push_back(td.read_file(
            (fs::relative(entry.path(), td.path) / "foreign.txt").string()));
    }
    std::sort(kept.begin(), kept.end());
    REQUIRE(kept == std::vector<std::string>{"first", "second"});
    REQUIRE(backend.tree(td.path / "one")->checkouts.load() == 1);
    REQUIRE(backend.tree(td.path / "two")->checkouts.load() == 1);
}

TEST_CASE("install failure without robust", "[commands]") {
    TempDir td;
    FakeBackend backend;
    backend.tree(td.path / "a")->fail_checkout = true;
    auto config = build({git("a"), git("b")}, td.path, backend);

    auto r = cmd_install_or_update(config, InstallOptions{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == QuiltError::Install);
    // Other installs still ran to completion
    REQUIRE(backend.tree(td.path / "b")->checkouts.load() == 1);
}

TEST_CASE("install failure with robust is reported", "[commands]") {
    TempDir td;
    FakeBackend backend;
    checked_out(backend, td, "b");
    backend.tree(td.path / "b")->fail_update = true;
    auto config = build({git("a"), git("b")}, td.path, backend);

    InstallOptions options;
    options.robust = true;
    auto r = cmd_install_or_update_report(config, options);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().success);
    REQUIRE(r.value().outcomes[0].kind == ElementOutcome::Checkout);
    REQUIRE(r.value().outcomes[1].kind == ElementOutcome::Failed);
    REQUIRE(r.value().outcomes[1].message.find("Update Failed") != std::string::npos);
}

TEST_CASE("installs overlap in time", "[commands]") {
    TempDir td;
    FakeBackend backend;
    std::vector<PathSpec> specs;
    for (int i = 0; i < 4; ++i) {
        std::string name = "t" + std::to_string(i);
        backend.tree(td.path / name)->delay_ms = 200;
        specs.push_back(git(name));
    }
    auto config = build(specs, td.path, backend);

    auto start = std::chrono::steady_clock::now();
    auto r = cmd_install_or_update(config, InstallOptions{});
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.is_ok());
    REQUIRE(r.value());
    REQUIRE(elapsed < std::chrono::milliseconds(700));
}

TEST_CASE("outcome kind names", "[commands]") {
    REQUIRE(std::string(ElementOutcome::kind_name(ElementOutcome::Skipped)) == "skipped");
    REQUIRE(std::string(ElementOutcome::kind_name(ElementOutcome::NoAction)) == "no-action");
}

TEST_CASE("backup path is relative to the base", "[commands]") {
    REQUIRE_FALSE(absolute_backup_path("/ws", std::nullopt).has_value());
    REQUIRE(absolute_backup_path("/ws", std::string(".backup")).value() ==
            fs::path("/ws/.backup"));
}

// ===== Status / diff =====

TEST_CASE("status covers version-controlled trees in order", "[commands]") {
    TempDir td;
    FakeBackend backend;
    checked_out(backend, td, "a");
    checked_out(backend, td, "b");
    backend.tree(td.path / "a")->status_text = "M  a/file.txt\n";
    backend.tree(td.path / "a")->delay_ms = 100;
    backend.tree(td.path / "b")->status_text = "?? b/new.txt\n";
    auto config = build({git("a"), plain("notes"), git("b")}, td.path, backend);

    auto r = cmd_status(config);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].element->local_name() == "a");
    REQUIRE(r.value()[0].status.value() == "M       a/file.txt\n");
    REQUIRE(r.value()[1].status.value() == "??      b/new.txt\n");
}

TEST_CASE("status of one selected tree", "[commands]") {
    TempDir td;
    FakeBackend backend;
    checked_out(backend, td, "a");
    checked_out(backend, td, "b");
    auto config = build({git("a"), git("b")}, td.path, backend);

    auto r = cmd_status(config, std::string("b"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].element->local_name() == "b");

    auto missing = cmd_status(config, std::string("zzz"));
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == QuiltError::Selection);
}

TEST_CASE("selected plain tree has no status", "[commands]") {
    TempDir td;
    FakeBackend backend;
    auto config = build({plain("notes")}, td.path, backend);

    auto r = cmd_status(config, std::string("notes"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE_FALSE(r.value()[0].status.has_value());
}

TEST_CASE("status failure is returned", "[commands]") {
    TempDir td;
    FakeBackend backend;
    checked_out(backend, td, "a");
    backend.tree(td.path / "a")->fail_status = true;
    auto config = build({git("a")}, td.path, backend);

    auto r = cmd_status(config);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "scripted status failure");
}

TEST_CASE("diff of every tree", "[commands]") {
    TempDir td;
    FakeBackend backend;
    checked_out(backend, td, "a");
    backend.tree(td.path / "a")->diff_text = "--- a/a/x\n+++ b/a/x\n";
    auto config = build({git("a"), git("missing")}, td.path, backend);

    auto r = cmd_diff(config);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].diff.value() == "--- a/a/x\n+++ b/a/x\n");
    // Not checked out yet
    REQUIRE_FALSE(r.value()[1].diff.has_value());
}
