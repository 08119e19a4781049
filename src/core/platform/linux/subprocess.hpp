#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace platform {

struct ProcessResult {
    int exit_code = -1; // 128 + signal number if the child was killed by a signal
    std::string out;    // everything the child wrote to stdout
};

// Runs argv[0] from PATH with stderr discarded and stdout captured. A zero
// timeout waits indefinitely; on expiry the child is killed and an error is
// returned. If input is non-null it is written to the child's stdin, otherwise
// stdin is /dev/null. Exec failure shows up as exit code 127.
std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv,
            std::chrono::milliseconds timeout = std::chrono::milliseconds{0},
            const std::string* input = nullptr);

} // namespace platform
