#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace directory {

struct RunResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string out;
    std::string err;
};

// Splits a command line on whitespace. Single or double quotes group a word.
std::vector<std::string> split_command(const std::string& cmd);

// Runs argv[0] with argv (no shell), stdin from /dev/null, capturing stdout and stderr up to
// max_output bytes each. On timeout the child gets SIGTERM, then SIGKILL after a grace period.
// Throws DirectoryError if the process cannot be started.
RunResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                      std::size_t max_output = 1024 * 1024);

}
