#pragma once

#include "config/Config.hpp"
#include "sync/Outcome.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>

namespace gitsync::sync { class Operator; }

namespace gitsync::runtime {

struct RunOptions {
    std::optional<unsigned int> interval_minutes;   // overrides the configured interval
    bool once = false;
    bool daemon = false;
    std::filesystem::path pidfile;
    std::filesystem::path logfile;
    std::optional<bool> pushOverride;
};

enum class State {
    Idle,
    RunningForeground,
    RunningBackground,
    Cycling,
    Stopping,
    Stopped,
};

std::string_view to_string(State s);

class Scheduler {
public:
    Scheduler(config::Config cfg, std::filesystem::path lockPath, const sync::Operator& op);

    // One locked pass over every entry.
    sync::CycleSummary runOnce(std::optional<bool> pushOverride = std::nullopt);

    // Holds the instance lock until stopped; returns the summary of the last completed cycle.
    sync::CycleSummary run(const RunOptions& opts);

    [[nodiscard]] State state() const { return state_.load(); }

    static unsigned int effectiveInterval(std::optional<unsigned int> requested, unsigned int configured);

    static void installSignalHandlers();
    static void requestStop() noexcept;
    [[nodiscard]] static bool stopRequested() noexcept;
    static void clearStop() noexcept;

private:
    config::Config cfg_;
    std::filesystem::path lockPath_;
    const sync::Operator& op_;
    std::atomic<State> state_{State::Idle};

    static inline std::atomic<bool> stop_{false};

    void transition(State next);
    sync::CycleSummary cycle(std::optional<bool> pushOverride) const;
    static void sleepFor(std::chrono::minutes interval);
};

}
