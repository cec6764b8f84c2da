#include "sync/Outcome.hpp"

#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace gitsync::sync {

std::string_view to_string(const Outcome o) {
    switch (o) {
    case Outcome::NoChange: return "no-change";
    case Outcome::CommittedOnly: return "committed-only";
    case Outcome::CommittedAndPushed: return "committed-and-pushed";
    case Outcome::PushSkippedOffline: return "push-skipped-offline";
    case Outcome::PushSkippedDisabled: return "push-skipped-disabled";
    case Outcome::Failed: return "failed";
    }
    throw std::invalid_argument("Unknown sync outcome");
}

void CycleSummary::record(EntryResult result) {
    ++counts[static_cast<size_t>(result.outcome)];
    results.push_back(std::move(result));
}

std::string CycleSummary::str() const {
    std::string out = fmt::format("{} entr{}", results.size(), results.size() == 1 ? "y" : "ies");
    for (size_t i = 0; i < OUTCOME_COUNT; ++i) {
        if (counts[i] == 0) continue;
        out += fmt::format(", {} {}", counts[i], to_string(static_cast<Outcome>(i)));
    }
    if (cancelled) out += " (cancelled)";
    return out;
}

void to_json(nlohmann::json& j, const EntryResult& r) {
    j = {
        {"path", r.path.string()},
        {"outcome", std::string(to_string(r.outcome))},
        {"message", r.message}
    };
}

void to_json(nlohmann::json& j, const CycleSummary& s) {
    nlohmann::json counts = nlohmann::json::object();
    for (size_t i = 0; i < OUTCOME_COUNT; ++i)
        counts[std::string(to_string(static_cast<Outcome>(i)))] = s.counts[i];

    j = {
        {"results", s.results},
        {"counts", counts},
        {"cancelled", s.cancelled},
        {"failed", s.anyFailed()}
    };
}

}
