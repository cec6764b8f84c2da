#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace gitsync::util {

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string out;
    std::string err;

    [[nodiscard]] bool ok() const { return !timed_out && exit_code == 0; }
};

struct ProcessOptions {
    std::filesystem::path cwd;
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
    std::vector<std::pair<std::string, std::string>> env; // added to / overriding the inherited environment
    std::chrono::milliseconds kill_grace{std::chrono::seconds(2)};
};

// Runs argv[0] (PATH lookup) in its own process group with stdin from /dev/null.
// On timeout the group gets SIGTERM, then SIGKILL after kill_grace.
// Throws std::runtime_error only when the process cannot be started.
ProcessResult runProcess(const std::vector<std::string>& argv, const ProcessOptions& opts = {});

}
