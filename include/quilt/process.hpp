#pragma once

#include <quilt/result.hpp>
#include <string>
#include <vector>

namespace quilt {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;

    bool succeeded() const { return exit_code == 0; }
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout; a non-zero exit status is
// reported through CommandResult::exit_code, not as an error.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 600);

// Join args with spaces for log and error messages
std::string describe_command(const std::vector<std::string>& args);

// Check whether an executable can be found on PATH
bool find_executable(const std::string& name);

} // namespace quilt
