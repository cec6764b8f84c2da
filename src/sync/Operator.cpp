#include "sync/Operator.hpp"
#include "config/Config.hpp"
#include "git/VersionControl.hpp"
#include "net/Prober.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace gitsync::sync {

struct Operator::Pass {
    const config::Entry& entry;
    bool pushEnabled;
    EntryResult result;
    bool committed = false;
    bool remoteHasBranch = false;

    void finish(const Outcome o, std::string message = {}) {
        result.outcome = o;
        result.message = std::move(message);
    }
};

Operator::Operator(git::VersionControl& vcs, net::Prober& prober,
                   std::string fallbackHost, const uint16_t fallbackPort)
    : vcs_(vcs), prober_(prober), fallbackHost_(std::move(fallbackHost)), fallbackPort_(fallbackPort) {}

EntryResult Operator::run(const config::Entry& entry, const std::optional<bool> pushOverride) const {
    Pass pass{entry, pushOverride.value_or(entry.push), EntryResult{.path = entry.path}};

    const Stage stages[] = {
        {"ensure", [this](Pass& p) { return ensureRepo(p); }},
        {"commit", [this](Pass& p) { return commit(p); }},
        {"gate",   [this](Pass& p) { return gate(p); }},
        {"fetch",  [this](Pass& p) { return fetch(p); }},
        {"rebase", [this](Pass& p) { return rebase(p); }},
        {"push",   [this](Pass& p) { return publish(p); }},
    };

    runStages(stages, pass);
    return pass.result;
}

void Operator::runStages(const std::span<const Stage> stages, Pass& pass) {
    for (const auto& [name, fn] : stages) {
        try {
            if (!fn(pass)) return;
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[Operator:{}] {}: {}", name, pass.entry.path.string(), e.what());
            pass.finish(Outcome::Failed, fmt::format("{}: {}", name, e.what()));
            return;
        }
    }
}

bool Operator::ensureRepo(Pass& pass) const {
    vcs_.ensureRepo(pass.entry);
    vcs_.ensureBranch(pass.entry.path, pass.entry.branch);
    return true;
}

bool Operator::commit(Pass& pass) const {
    const auto& path = pass.entry.path;
    const auto message = renderMessage(pass.entry.commit_message, path, std::time(nullptr));

    pass.committed = vcs_.commitIfDirty(path, message);
    if (pass.committed) log::Registry::sync()->info("Committed changes in {}", path.string());
    else log::Registry::sync()->debug("Idle: {}", path.string());
    return true;
}

bool Operator::gate(Pass& pass) const {
    const auto& entry = pass.entry;

    if (!pass.pushEnabled || !entry.remote) {
        const auto why = entry.remote ? "push disabled" : "no remote configured";
        log::Registry::sync()->debug("{}: {}; skipping push", entry.path.string(), why);
        pass.finish(pass.committed ? Outcome::CommittedOnly : Outcome::PushSkippedDisabled, why);
        return false;
    }

    const auto endpoint = net::endpointFor(entry.remote, fallbackHost_, fallbackPort_);
    if (prober_.reachable(endpoint)) return true;

    if (pass.committed) {
        pass.finish(Outcome::CommittedOnly, fmt::format("{} unreachable", endpoint.str()));
    } else if (const auto pending = vcs_.unpushedCommits(entry.path, entry.branch); pending > 0) {
        pass.finish(Outcome::PushSkippedOffline,
                    fmt::format("{} unreachable, {} commit(s) waiting", endpoint.str(), pending));
    } else {
        pass.finish(Outcome::NoChange, fmt::format("{} unreachable", endpoint.str()));
    }

    log::Registry::sync()->info("Offline ({}); will push {} on next run", endpoint.str(), entry.path.string());
    return false;
}

bool Operator::fetch(Pass& pass) const {
    const auto& entry = pass.entry;
    pass.remoteHasBranch = vcs_.remoteBranchExists(entry.path, entry.branch);

    // First push will create the branch. A tracking ref left by an earlier remote or a deleted
    // branch would otherwise hide the local commits from publish().
    if (!pass.remoteHasBranch) {
        log::Registry::sync()->info("{}: origin has no branch {} yet", entry.path.string(), entry.branch);
        vcs_.forgetRemoteBranch(entry.path, entry.branch);
        return true;
    }

    vcs_.fetch(entry.path, entry.branch);
    return true;
}

bool Operator::rebase(Pass& pass) const {
    const auto& entry = pass.entry;
    if (!pass.remoteHasBranch) return true;
    if (vcs_.rebaseOnto(entry.path, entry.branch)) return true;

    const auto msg = fmt::format("rebase onto origin/{} conflicted and was aborted; "
                                 "manual intervention required in {}", entry.branch, entry.path.string());
    log::Registry::sync()->error("{}", msg);
    pass.finish(Outcome::Failed, msg);
    return false;
}

bool Operator::publish(Pass& pass) const {
    const auto& entry = pass.entry;

    // Earlier offline cycles may have left commits behind even when nothing changed now
    const auto pending = vcs_.unpushedCommits(entry.path, entry.branch);
    if (pending == 0) {
        pass.finish(Outcome::NoChange);
        return true;
    }

    vcs_.push(entry.path, entry.branch);
    log::Registry::sync()->info("Pushed {} commit(s) from {} to origin/{}", pending, entry.path.string(), entry.branch);
    pass.finish(Outcome::CommittedAndPushed, fmt::format("pushed {} commit(s)", pending));
    return true;
}

std::string Operator::renderMessage(const std::string& tmpl, const fs::path& path, const std::time_t now) {
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    const std::string ts(buf);

    std::string msg = tmpl;
    try {
        msg = fmt::format(fmt::runtime(tmpl), fmt::arg("timestamp", ts), fmt::arg("path", path.string()));
    } catch (const fmt::format_error& e) {
        log::Registry::sync()->warn("Commit message template '{}' is not usable ({}); using it verbatim", tmpl, e.what());
    }

    if (tmpl.find("{timestamp}") == std::string::npos) msg += fmt::format(" ({})", ts);
    return msg;
}

}
