#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace gitsync::sync {

enum class Outcome {
    NoChange,
    CommittedOnly,
    CommittedAndPushed,
    PushSkippedOffline,
    PushSkippedDisabled,
    Failed,
};

inline constexpr size_t OUTCOME_COUNT = 6;

std::string_view to_string(Outcome o);

struct EntryResult {
    std::filesystem::path path;
    Outcome outcome = Outcome::NoChange;
    std::string message;     // diagnostic for failures, detail otherwise
};

struct CycleSummary {
    std::vector<EntryResult> results;
    std::array<size_t, OUTCOME_COUNT> counts{};
    bool cancelled = false;  // a stop request skipped the remaining entries

    void record(EntryResult result);

    [[nodiscard]] size_t count(Outcome o) const { return counts[static_cast<size_t>(o)]; }
    [[nodiscard]] bool anyFailed() const { return count(Outcome::Failed) > 0; }
    [[nodiscard]] std::string str() const;
};

void to_json(nlohmann::json& j, const EntryResult& r);
void to_json(nlohmann::json& j, const CycleSummary& s);

}
