#pragma once

#include "sync/Outcome.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gitsync::config { struct Entry; }
namespace gitsync::git { class VersionControl; }
namespace gitsync::net { class Prober; }

namespace gitsync::sync {

// Drives one entry through ensure -> commit -> gate -> fetch -> rebase -> push.
// A failing step ends the pass for that entry only; nothing escapes run().
class Operator {
public:
    Operator(git::VersionControl& vcs, net::Prober& prober,
             std::string fallbackHost, uint16_t fallbackPort);

    // pushOverride replaces the entry's push flag for this pass when set
    EntryResult run(const config::Entry& entry, std::optional<bool> pushOverride = std::nullopt) const;

    static std::string renderMessage(const std::string& tmpl, const std::filesystem::path& path, std::time_t now);

private:
    struct Pass;

    struct Stage {
        std::string_view name;
        std::function<bool(Pass&)> fn; // false ends the pass with the outcome already set
    };

    git::VersionControl& vcs_;
    net::Prober& prober_;
    std::string fallbackHost_;
    uint16_t fallbackPort_;

    static void runStages(std::span<const Stage> stages, Pass& pass);

    bool ensureRepo(Pass& pass) const;
    bool commit(Pass& pass) const;
    bool gate(Pass& pass) const;
    bool fetch(Pass& pass) const;
    bool rebase(Pass& pass) const;
    bool publish(Pass& pass) const;
};

}
