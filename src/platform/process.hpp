#pragma once

#include <string>
#include <vector>

namespace platform {

struct ProcessOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    bool spawned = false;
};

// Runs program with stdin on /dev/null and both output streams captured.
// The child is killed once timeout_ms has elapsed.
ProcessOutput run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           int timeout_ms);

} // namespace platform
