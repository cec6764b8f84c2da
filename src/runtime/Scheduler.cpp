#include "runtime/Scheduler.hpp"
#include "runtime/Daemon.hpp"
#include "runtime/InstanceLock.hpp"
#include "sync/CycleRunner.hpp"
#include "sync/Operator.hpp"
#include "log/Registry.hpp"

#include <csignal>
#include <ctime>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace gitsync::sync;

namespace gitsync::runtime {

namespace {

constexpr auto SLEEP_SLICE = std::chrono::milliseconds(250);

void signalHandler(const int) {
    Scheduler::requestStop();
}

}

std::string_view to_string(const State s) {
    switch (s) {
        case State::Idle: return "idle";
        case State::RunningForeground: return "running-foreground";
        case State::RunningBackground: return "running-background";
        case State::Cycling: return "cycling";
        case State::Stopping: return "stopping";
        case State::Stopped: return "stopped";
    }
    return "unknown";
}

Scheduler::Scheduler(config::Config cfg, fs::path lockPath, const Operator& op)
    : cfg_(std::move(cfg)), lockPath_(std::move(lockPath)), op_(op) {}

void Scheduler::installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void Scheduler::requestStop() noexcept { stop_.store(true); }

bool Scheduler::stopRequested() noexcept { return stop_.load(); }

void Scheduler::clearStop() noexcept { stop_.store(false); }

unsigned int Scheduler::effectiveInterval(const std::optional<unsigned int> requested, const unsigned int configured) {
    const auto interval = requested.value_or(configured);
    if (interval < config::MIN_INTERVAL_MINUTES) {
        log::Registry::runtime()->warn("[Scheduler] Interval {} below floor; using {} minute(s)",
                                       interval, config::MIN_INTERVAL_MINUTES);
        return config::MIN_INTERVAL_MINUTES;
    }
    return interval;
}

void Scheduler::transition(const State next) {
    const auto prev = state_.exchange(next);
    if (prev != next)
        log::Registry::runtime()->debug("[Scheduler] {} -> {}", to_string(prev), to_string(next));
}

CycleSummary Scheduler::cycle(const std::optional<bool> pushOverride) const {
    const CycleRunner runner(op_, &stop_);
    return runner.run(cfg_.entries, pushOverride);
}

void Scheduler::sleepFor(const std::chrono::minutes interval) {
    const auto deadline = std::chrono::steady_clock::now() + interval;
    while (!stopRequested() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(SLEEP_SLICE);
}

CycleSummary Scheduler::runOnce(const std::optional<bool> pushOverride) {
    auto lock = InstanceLock::acquire(lockPath_);
    installSignalHandlers();

    transition(State::RunningForeground);
    transition(State::Cycling);
    auto summary = cycle(pushOverride);

    transition(State::Stopping);
    lock.release();
    transition(State::Stopped);
    return summary;
}

CycleSummary Scheduler::run(const RunOptions& opts) {
    // Taken before detaching so a second instance fails on the caller's terminal
    auto lock = InstanceLock::acquire(lockPath_);
    std::optional<PidfileGuard> pidfile;

    const auto interval = effectiveInterval(opts.interval_minutes, cfg_.interval_minutes);
    const auto runningState = opts.daemon ? State::RunningBackground : State::RunningForeground;

    if (opts.daemon) {
        log::Registry::runtime()->info("[Scheduler] Detaching; logging to {}", opts.logfile.string());
        daemonize(opts.logfile);
        log::Registry::disableConsoleColor();
        lock.updatePid();

        pidfile.emplace(DaemonState{getpid(), opts.logfile, std::time(nullptr)}, opts.pidfile);
    } else if (!opts.logfile.empty()) {
        log::Registry::attachFile(opts.logfile);
    }

    transition(runningState);
    installSignalHandlers();

    log::Registry::runtime()->info("[Scheduler] Started (pid {}, {} entr{}, every {} min{})",
                                   getpid(), cfg_.entries.size(), cfg_.entries.size() == 1 ? "y" : "ies",
                                   interval, opts.once ? ", once" : "");

    CycleSummary last;
    while (!stopRequested()) {
        transition(State::Cycling);
        last = cycle(opts.pushOverride);
        transition(runningState);

        if (opts.once) break;
        sleepFor(std::chrono::minutes(interval));
    }

    transition(State::Stopping);
    if (stopRequested()) log::Registry::runtime()->info("[Scheduler] Stop requested; shutting down");

    // Pidfile goes first so a successor never loses its own
    pidfile.reset();
    lock.release();
    transition(State::Stopped);
    return last;
}

}
