#include <catch2/catch.hpp>
#include <quilt/vcs/bzr.hpp>
#include <quilt/vcs/hg.hpp>
#include <quilt/vcs/svn.hpp>

using namespace quilt::vcs;

// ===== Path prefixes =====

TEST_CASE("prefix_paths inserts after the marker columns", "[vcs]") {
    REQUIRE(VcsClient::prefix_paths(" M a.txt\n?? b.txt\n", 3, "lib") ==
            " M lib/a.txt\n?? lib/b.txt\n");
}

TEST_CASE("prefix_paths leaves short lines alone", "[vcs]") {
    REQUIRE(VcsClient::prefix_paths("M \nM x\n", 2, "lib") == "M \nM lib/x\n");
}

TEST_CASE("prefix_paths without a prefix returns the text", "[vcs]") {
    REQUIRE(VcsClient::prefix_paths("M x", 2, "") == "M x");
    REQUIRE(VcsClient::prefix_paths("M x", 2, ".") == "M x");
}

// ===== Mercurial =====

TEST_CASE("hg diff headers are relative to the base", "[vcs][hg]") {
    std::string diff =
        "diff --git a/src/x.c b/src/x.c\n"
        "--- a/src/x.c\n"
        "+++ b/src/x.c\n"
        "@@ -1 +1 @@\n"
        "-one\n"
        "+two\n";
    std::string expected =
        "diff --git a/lib/src/x.c b/lib/src/x.c\n"
        "--- a/lib/src/x.c\n"
        "+++ b/lib/src/x.c\n"
        "@@ -1 +1 @@\n"
        "-one\n"
        "+two\n";
    REQUIRE(HgClient::rewrite_diff_headers(diff, "lib") == expected);
}

TEST_CASE("hg diff at the base is unchanged", "[vcs][hg]") {
    std::string diff = "--- a/x\n+++ b/x\n";
    REQUIRE(HgClient::rewrite_diff_headers(diff, ".") == diff);
    REQUIRE(HgClient::rewrite_diff_headers(diff, "") == diff);
}

TEST_CASE("hg diff headers with a nested prefix", "[vcs][hg]") {
    REQUIRE(HgClient::rewrite_diff_headers("diff --git a/f b/f\n", "a b/c") ==
            "diff --git a/a b/c/f b/a b/c/f\n");
}

TEST_CASE("hg diff removal header keeps /dev/null", "[vcs][hg]") {
    REQUIRE(HgClient::rewrite_diff_headers("--- /dev/null\n+++ b/new\n", "lib") ==
            "--- /dev/null\n+++ b/lib/new\n");
}

// ===== Bazaar =====

TEST_CASE("bzr status drops unknown files", "[vcs][bzr]") {
    std::string status =
        " M  tracked.txt\n"
        "?   scratch.txt\n"
        "+N  added.txt\n";
    REQUIRE(BzrClient::drop_untracked(status) == " M  tracked.txt\n+N  added.txt\n");
}

TEST_CASE("bzr status with only unknown files is empty", "[vcs][bzr]") {
    REQUIRE(BzrClient::drop_untracked("?   a\n?   b\n").empty());
}

TEST_CASE("bzr diff prefixes both sides with the relative path", "[vcs][bzr]") {
    REQUIRE(BzrClient::diff_command("lib") ==
            std::vector<std::string>{"bzr", "diff", "--prefix=lib/:lib/"});
    REQUIRE(BzrClient::diff_command(".") == std::vector<std::string>{"bzr", "diff"});
}

// ===== Subversion =====

TEST_CASE("svn status names the tree relative to the base", "[vcs][svn]") {
    REQUIRE(SvnClient::status_command("lib", false) ==
            std::vector<std::string>{"svn", "status", "--non-interactive", "-q", "lib"});
    REQUIRE(SvnClient::status_command("lib", true) ==
            std::vector<std::string>{"svn", "status", "--non-interactive", "lib"});
}

TEST_CASE("svn diff names the tree relative to the base", "[vcs][svn]") {
    REQUIRE(SvnClient::diff_command("lib/core") ==
            std::vector<std::string>{"svn", "diff", "--non-interactive", "lib/core"});
}
