#include "sync/CycleRunner.hpp"
#include "sync/Operator.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

namespace gitsync::sync {

CycleRunner::CycleRunner(const Operator& op, const std::atomic<bool>* stopRequested)
    : op_(op), stopRequested_(stopRequested) {}

bool CycleRunner::stopping() const {
    return stopRequested_ && stopRequested_->load(std::memory_order_acquire);
}

CycleSummary CycleRunner::run(const std::vector<config::Entry>& entries, const std::optional<bool> pushOverride) const {
    CycleSummary summary;

    if (entries.empty()) {
        log::Registry::sync()->info("No tracked paths; add one first.");
        return summary;
    }

    for (const auto& entry : entries) {
        // Finish the current entry, skip the rest
        if (stopping()) {
            summary.cancelled = true;
            log::Registry::sync()->warn("[CycleRunner] Stop requested, skipping remaining {} entr{}",
                                        entries.size() - summary.results.size(),
                                        entries.size() - summary.results.size() == 1 ? "y" : "ies");
            break;
        }

        EntryResult result;
        try {
            result = op_.run(entry, pushOverride);
        } catch (const std::exception& e) {
            result = {entry.path, Outcome::Failed, e.what()};
        }

        report(result);
        summary.record(std::move(result));
    }

    log::Registry::sync()->info("[CycleRunner] Cycle finished: {}", summary.str());
    return summary;
}

void CycleRunner::report(const EntryResult& r) {
    const auto path = r.path.string();
    const auto logger = log::Registry::sync();

    switch (r.outcome) {
    case Outcome::NoChange:
        logger->info("Idle: {}", path);
        break;
    case Outcome::CommittedOnly:
        logger->info("Committed (not pushed): {}{}", path, r.message.empty() ? "" : " - " + r.message);
        break;
    case Outcome::CommittedAndPushed:
        logger->info("Synced: {} ({})", path, r.message);
        break;
    case Outcome::PushSkippedOffline:
        logger->warn("Offline, push pending: {} ({})", path, r.message);
        break;
    case Outcome::PushSkippedDisabled:
        logger->info("Local only: {} ({})", path, r.message);
        break;
    case Outcome::Failed:
        logger->error("Failed: {} ({})", path, r.message);
        break;
    }
}

}
