#pragma once

#include <string>
#include <vector>

namespace pkgdash {

// Execute a program and capture both stdout and stderr
struct ExecResult {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = -1;
    bool spawn_failed = false;
    bool timed_out = false;
};

// Runs argv[0] with PATH lookup, no shell involved.
// timeout_seconds <= 0 waits indefinitely.
ExecResult exec_command(const std::vector<std::string>& argv, int timeout_seconds = 0);

bool command_exists(const std::string& cmd);

} // namespace pkgdash
