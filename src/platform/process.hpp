#pragma once

#include <string>
#include <vector>

namespace platform {

// Captured outcome of a finished child process.
struct ProcessResult {
    int exit_code = -1;         // -1 if spawning failed, killed, or timed out
    std::string output;         // combined stdout + stderr
    bool timed_out = false;

    bool success() const { return exit_code == 0; }
};

// Run a program (looked up on PATH) to completion, capturing its output.
// stdin is closed. timeout_ms = -1 means wait indefinitely; on timeout the
// child is sent SIGTERM, then SIGKILL.
ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms = -1);

} // namespace platform
