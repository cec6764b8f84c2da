#pragma once

#include "sync/Outcome.hpp"

#include <atomic>
#include <optional>
#include <vector>

namespace gitsync::config { struct Entry; }

namespace gitsync::sync {

class Operator;

// One pass of the operator over every entry, in configured order.
class CycleRunner {
public:
    explicit CycleRunner(const Operator& op, const std::atomic<bool>* stopRequested = nullptr);

    CycleSummary run(const std::vector<config::Entry>& entries, std::optional<bool> pushOverride = std::nullopt) const;

private:
    const Operator& op_;
    const std::atomic<bool>* stopRequested_;

    [[nodiscard]] bool stopping() const;
    static void report(const EntryResult& r);
};

}
