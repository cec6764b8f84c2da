#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <nlohmann/json_fwd.hpp>

namespace gitsync::runtime {

struct DaemonError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Contents of the pidfile a background instance leaves behind.
struct DaemonState {
    pid_t pid = 0;
    std::filesystem::path log_file;
    std::time_t started_at = 0;

    void write(const std::filesystem::path& pidfile) const;

    // Accepts the JSON form and a bare integer pid; nullopt when missing or unreadable.
    static std::optional<DaemonState> read(const std::filesystem::path& pidfile);

    static void remove(const std::filesystem::path& pidfile) noexcept;
};

// Writes the state on construction; removes the pidfile again when it goes out of scope.
class PidfileGuard {
public:
    PidfileGuard(const DaemonState& state, std::filesystem::path pidfile);
    ~PidfileGuard();

    PidfileGuard(const PidfileGuard&) = delete;
    PidfileGuard& operator=(const PidfileGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return pidfile_; }

private:
    std::filesystem::path pidfile_;
};

void to_json(nlohmann::json& j, const DaemonState& s);
void from_json(const nlohmann::json& j, DaemonState& s);

// Detaches from the terminal (double fork + setsid) and points stdout/stderr at logfile.
// Returns in the grandchild only; the intermediate processes _exit(0).
void daemonize(const std::filesystem::path& logfile);

// Sends SIGTERM to the recorded pid and waits for it to exit. The pid is only trusted while it
// holds the instance lock at lockPath; false when nothing was running (a stale pidfile is removed).
bool stop(const std::filesystem::path& pidfile, const std::filesystem::path& lockPath,
          std::chrono::milliseconds wait = std::chrono::seconds(10));

// The recorded state when the pidfile names the live process holding the instance lock.
std::optional<DaemonState> status(const std::filesystem::path& pidfile, const std::filesystem::path& lockPath);

}
