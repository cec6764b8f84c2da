#include "runtime/Daemon.hpp"
#include "runtime/InstanceLock.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace gitsync::runtime {

void to_json(json& j, const DaemonState& s) {
    j = {
        {"pid", s.pid},
        {"log_file", s.log_file.string()},
        {"started_at", s.started_at}
    };
}

void from_json(const json& j, DaemonState& s) {
    s.pid = j.at("pid").get<pid_t>();
    s.log_file = j.value("log_file", std::string{});
    s.started_at = j.value("started_at", static_cast<std::time_t>(0));
}

void DaemonState::write(const fs::path& pidfile) const {
    if (pidfile.has_parent_path()) fs::create_directories(pidfile.parent_path());

    const auto tmp = fs::path(pidfile.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw DaemonError(fmt::format("Failed to write pidfile {}", tmp.string()));
        out << json(*this).dump() << '\n';
    }
    fs::rename(tmp, pidfile);
}

std::optional<DaemonState> DaemonState::read(const fs::path& pidfile) {
    std::ifstream in(pidfile);
    if (!in) return std::nullopt;

    std::stringstream ss;
    ss << in.rdbuf();
    const auto raw = ss.str();

    try {
        const auto j = json::parse(raw);
        if (j.is_number_integer()) return DaemonState{j.get<pid_t>(), {}, 0};
        return j.get<DaemonState>();
    } catch (const json::exception& e) {
        log::Registry::runtime()->warn("[Daemon] Unreadable pidfile {}: {}", pidfile.string(), e.what());
        return std::nullopt;
    }
}

void DaemonState::remove(const fs::path& pidfile) noexcept {
    std::error_code ec;
    fs::remove(pidfile, ec);
}

PidfileGuard::PidfileGuard(const DaemonState& state, fs::path pidfile) : pidfile_(std::move(pidfile)) {
    state.write(pidfile_);
}

PidfileGuard::~PidfileGuard() { DaemonState::remove(pidfile_); }

namespace {

void forkAndLeaveParent() {
    const pid_t pid = fork();
    if (pid < 0) throw DaemonError(fmt::format("fork failed: {}", std::strerror(errno)));
    if (pid > 0) _exit(0);
}

}

void daemonize(const fs::path& logfile) {
    if (logfile.has_parent_path()) fs::create_directories(logfile.parent_path());

    const int logFd = ::open(logfile.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (logFd < 0) throw DaemonError(fmt::format("Cannot open log file {}: {}", logfile.string(), std::strerror(errno)));

    const int nullFd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (nullFd < 0) {
        ::close(logFd);
        throw DaemonError(fmt::format("Cannot open /dev/null: {}", std::strerror(errno)));
    }

    spdlog::default_logger()->flush();
    std::fflush(stdout);
    std::fflush(stderr);

    forkAndLeaveParent();

    if (setsid() < 0) throw DaemonError(fmt::format("setsid failed: {}", std::strerror(errno)));

    forkAndLeaveParent();

    umask(022);
    if (chdir("/") != 0) throw DaemonError(fmt::format("chdir(/) failed: {}", std::strerror(errno)));

    if (dup2(nullFd, STDIN_FILENO) < 0 || dup2(logFd, STDOUT_FILENO) < 0 || dup2(logFd, STDERR_FILENO) < 0)
        throw DaemonError(fmt::format("dup2 failed: {}", std::strerror(errno)));

    ::close(nullFd);
    ::close(logFd);
}

namespace {

struct Lookup {
    std::optional<DaemonState> state;
    bool stale = false;     // pidfile exists but names no running instance
};

// A pid from the pidfile may have been reused since a crash; only the lock holder counts.
Lookup lookup(const fs::path& pidfile, const fs::path& lockPath) {
    std::error_code ec;
    if (!fs::exists(pidfile, ec)) return {};

    auto state = DaemonState::read(pidfile);
    if (!state) return {std::nullopt, true};

    const auto owner = InstanceLock::holder(lockPath);
    if (!owner) {
        log::Registry::runtime()->info("[Daemon] No instance holds {}; pid {} is stale", lockPath.string(), state->pid);
        return {std::nullopt, true};
    }
    if (*owner != 0 && *owner != state->pid) {
        log::Registry::runtime()->warn("[Daemon] Lock is held by pid {}, pidfile names {}; ignoring pidfile",
                                       *owner, state->pid);
        return {std::nullopt, true};
    }
    if (!InstanceLock::isAlive(state->pid)) {
        log::Registry::runtime()->info("[Daemon] Process {} not found", state->pid);
        return {std::nullopt, true};
    }
    return {std::move(state), false};
}

}

bool stop(const fs::path& pidfile, const fs::path& lockPath, const std::chrono::milliseconds wait) {
    const auto found = lookup(pidfile, lockPath);
    if (!found.state) {
        if (found.stale) {
            log::Registry::runtime()->info("[Daemon] Removing stale pidfile {}", pidfile.string());
            DaemonState::remove(pidfile);
        } else {
            log::Registry::runtime()->info("[Daemon] No pidfile at {}", pidfile.string());
        }
        return false;
    }

    const auto pid = found.state->pid;
    if (kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) {
            DaemonState::remove(pidfile);
            return false;
        }
        throw DaemonError(fmt::format("kill({}, SIGTERM) failed: {}", pid, std::strerror(errno)));
    }

    log::Registry::runtime()->info("[Daemon] Sent SIGTERM to {}", pid);

    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!InstanceLock::isAlive(pid)) {
            DaemonState::remove(pidfile);
            log::Registry::runtime()->info("[Daemon] Process {} stopped", pid);
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    throw DaemonError(fmt::format("Process {} still running after {}s", pid,
                                  std::chrono::duration_cast<std::chrono::seconds>(wait).count()));
}

std::optional<DaemonState> status(const fs::path& pidfile, const fs::path& lockPath) {
    return lookup(pidfile, lockPath).state;
}

}
