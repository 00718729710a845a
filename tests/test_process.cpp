#include <catch2/catch.hpp>
#include <quilt/process.hpp>
#include <chrono>
#include <thread>

using namespace quilt;

// ===== run_command() =====

TEST_CASE("run_command echo", "[process]") {
    auto r = run_command({"echo", "hello"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().succeeded());
    REQUIRE(r.value().stdout_str == "hello\n");
}

TEST_CASE("run_command false returns nonzero", "[process]") {
    auto r = run_command({"false"});
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().succeeded());
}

TEST_CASE("run_command captures stderr", "[process]") {
    auto r = run_command({"sh", "-c", "echo err >&2"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stderr_str.find("err") != std::string::npos);
}

TEST_CASE("run_command empty args error", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == QuiltError::InvalidArg);
}

TEST_CASE("run_command with working dir", "[process]") {
    auto r = run_command({"pwd"}, "/tmp");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.find("/tmp") != std::string::npos);
}

TEST_CASE("run_command nonexistent binary", "[process]") {
    auto r = run_command({"__quilt_nonexistent_binary_xyz__"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command times out", "[process]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == QuiltError::IO);
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("run_command gives the child no stdin", "[process]") {
    auto r = run_command({"cat"}, "", 5);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.empty());
}

// ===== helpers =====

TEST_CASE("run_command children do not inherit each other's pipes", "[process]") {
    std::thread slow([] {
        auto r = run_command({"sleep", "2"});
        REQUIRE(r.is_ok());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto r = run_command({"sh", "-c",
        "for f in /proc/$$/fd/*; do n=${f##*/}; "
        "if [ \"$n\" -gt 2 ]; then readlink \"$f\"; fi; done"});
    slow.join();
    REQUIRE(r.is_ok());
    INFO(r.value().stdout_str);
    REQUIRE(r.value().stdout_str.find("pipe:") == std::string::npos);
}

TEST_CASE("describe_command joins args", "[process]") {
    REQUIRE(describe_command({"git", "-C", "/ws/core", "status"}) == "git -C /ws/core status");
    REQUIRE(describe_command({}).empty());
}

TEST_CASE("find_executable", "[process]") {
    REQUIRE(find_executable("sh"));
    REQUIRE_FALSE(find_executable("__quilt_nonexistent_binary_xyz__"));
}
