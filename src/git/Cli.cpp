#include "git/Cli.hpp"
#include "log/Registry.hpp"

#include <charconv>
#include <cstdlib>
#include <fmt/core.h>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace gitsync::git {

namespace {

std::string trim(std::string s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string describe(const util::ProcessResult& r) {
    if (r.timed_out) return "timed out";
    auto msg = trim(r.err);
    if (msg.empty()) msg = trim(r.out);
    if (msg.empty()) msg = fmt::format("exit code {}", r.exit_code);
    return msg;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

}

Cli::Cli(config::GitConfig cnf) : cnf_(std::move(cnf)) {
    env_ = {{"GIT_TERMINAL_PROMPT", "0"}, {"LC_ALL", "C"}};
    // Never block on an ssh password prompt unless the user configured ssh explicitly
    if (!std::getenv("GIT_SSH_COMMAND") && !std::getenv("GIT_SSH"))
        env_.emplace_back("GIT_SSH_COMMAND", "ssh -o BatchMode=yes");
}

util::ProcessResult Cli::run(const fs::path& path, const std::vector<std::string>& args, const Reach reach) const {
    std::vector<std::string> argv{cnf_.binary, "-C", path.string()};
    argv.insert(argv.end(), args.begin(), args.end());

    util::ProcessOptions opts;
    opts.env = env_;
    opts.timeout = seconds(reach == Reach::Remote ? cnf_.remote_timeout_seconds : cnf_.local_timeout_seconds);

    log::Registry::git()->debug("[Git] {}: git {}", path.string(), joinArgs(args));

    util::ProcessResult res;
    try {
        res = util::runProcess(argv, opts);
    } catch (const std::runtime_error& e) {
        throw Error(fmt::format("git {}: {}", args.front(), e.what()));
    }

    if (res.exit_code == 127 && !res.timed_out && res.err.empty())
        throw Error(fmt::format("Failed to execute '{}'", cnf_.binary));
    if (res.timed_out)
        log::Registry::git()->warn("[Git] {}: git {} timed out after {}s", path.string(), args.front(),
                                   duration_cast<seconds>(opts.timeout).count());
    return res;
}

std::string Cli::check(const fs::path& path, const std::vector<std::string>& args, const Reach reach) const {
    const auto res = run(path, args, reach);
    if (!res.ok()) {
        log::Registry::git()->warn("[Git] {}: git {} failed: {}", path.string(), args.front(), describe(res));
        throw Error(fmt::format("git {} failed: {}", args.front(), describe(res)));
    }
    return trim(res.out);
}

bool Cli::hasCommits(const fs::path& path) const {
    return run(path, {"rev-parse", "--verify", "-q", "HEAD"}).ok();
}

void Cli::assertNoOperationInProgress(const fs::path& path) const {
    fs::path gitDir = check(path, {"rev-parse", "--git-dir"});
    if (gitDir.is_relative()) gitDir = path / gitDir;

    for (const auto* marker : {"rebase-merge", "rebase-apply", "MERGE_HEAD"})
        if (fs::exists(gitDir / marker))
            throw Error(fmt::format("{} has an unfinished rebase or merge; manual intervention required",
                                    path.string()));
}

void Cli::upsertRemote(const fs::path& path, const std::string& url) const {
    const auto current = run(path, {"remote", "get-url", "origin"});
    if (!current.ok()) {
        check(path, {"remote", "add", "origin", url});
        log::Registry::git()->info("[Git] {}: added remote origin {}", path.string(), url);
        return;
    }
    if (trim(current.out) != url) {
        check(path, {"remote", "set-url", "origin", url});
        log::Registry::git()->info("[Git] {}: remote origin now {}", path.string(), url);
    }
}

RepoState Cli::ensureRepo(const config::Entry& entry) {
    RepoState state;
    const auto& path = entry.path;

    std::error_code ec;
    if (fs::exists(path, ec) && !fs::is_directory(path, ec))
        throw Error(fmt::format("{} exists and is not a directory", path.string()));
    if (!fs::exists(path, ec)) {
        fs::create_directories(path, ec);
        if (ec) throw Error(fmt::format("Failed to create {}: {}", path.string(), ec.message()));
    }

    if (!fs::exists(path / ".git", ec)) {
        log::Registry::sync()->info("Initializing repo at {}", path.string());
        check(path, {"init", "-q"});
        check(path, {"symbolic-ref", "HEAD", "refs/heads/" + entry.branch});
        state.created = true;
    }

    assertNoOperationInProgress(path);
    if (entry.remote) upsertRemote(path, *entry.remote);

    state.hasCommits = hasCommits(path);
    return state;
}

void Cli::ensureBranch(const fs::path& path, const std::string& branch) {
    const auto current = run(path, {"symbolic-ref", "--short", "-q", "HEAD"});
    if (current.ok() && trim(current.out) == branch) return;

    const auto from = current.ok() ? trim(current.out) : std::string("detached HEAD");

    if (!hasCommits(path)) check(path, {"symbolic-ref", "HEAD", "refs/heads/" + branch});
    else if (run(path, {"show-ref", "--verify", "--quiet", "refs/heads/" + branch}).ok())
        check(path, {"checkout", "-q", branch});
    else check(path, {"checkout", "-q", "-b", branch});

    log::Registry::sync()->info("Switched {} from {} to branch {}", path.string(), from, branch);
}

bool Cli::commitIfDirty(const fs::path& path, const std::string& message) {
    if (check(path, {"status", "--porcelain"}).empty()) return false;

    check(path, {"add", "-A"});

    // Porcelain can list entries that stage to nothing (e.g. untracked empty dirs of submodules)
    if (hasCommits(path) && run(path, {"diff", "--cached", "--quiet"}).ok()) return false;

    check(path, {"commit", "-q", "-m", message});
    return true;
}

bool Cli::remoteBranchExists(const fs::path& path, const std::string& branch) {
    const auto res = run(path, {"ls-remote", "--exit-code", "--heads", "origin", "refs/heads/" + branch}, Reach::Remote);
    if (res.ok()) return true;
    if (!res.timed_out && res.exit_code == 2) return false;
    throw Error(fmt::format("git ls-remote failed: {}", describe(res)));
}

void Cli::fetch(const fs::path& path, const std::string& branch) {
    check(path, {"fetch", "-q", "--prune", "origin",
                 fmt::format("+refs/heads/{0}:refs/remotes/origin/{0}", branch)}, Reach::Remote);
}

void Cli::forgetRemoteBranch(const fs::path& path, const std::string& branch) {
    const auto tracking = "refs/remotes/origin/" + branch;
    if (!run(path, {"rev-parse", "--verify", "-q", tracking}).ok()) return;

    check(path, {"update-ref", "-d", tracking});
    log::Registry::git()->info("[Git] {}: origin has no {}; dropped stale {}", path.string(), branch, tracking);
}

bool Cli::rebaseOnto(const fs::path& path, const std::string& branch) {
    const auto upstream = "origin/" + branch;

    if (!hasCommits(path)) {
        // Nothing local to replay; adopt the remote history
        check(path, {"checkout", "-q", "-B", branch, upstream});
        return true;
    }

    const auto res = run(path, {"rebase", "-q", upstream});
    if (res.ok()) return true;

    const auto abort = run(path, {"rebase", "--abort"});
    if (!abort.ok()) throw Error(fmt::format("git rebase failed: {}", describe(res)));

    log::Registry::git()->warn("[Git] {}: rebase onto {} conflicted and was aborted: {}",
                               path.string(), upstream, describe(res));
    return false;
}

size_t Cli::unpushedCommits(const fs::path& path, const std::string& branch) {
    if (!hasCommits(path)) return 0;

    const auto tracking = "refs/remotes/origin/" + branch;
    const bool hasTracking = run(path, {"rev-parse", "--verify", "-q", tracking}).ok();
    const auto out = check(path, {"rev-list", "--count", hasTracking ? tracking + "..HEAD" : "HEAD"});

    size_t count = 0;
    const auto [ptr, ec] = std::from_chars(out.data(), out.data() + out.size(), count);
    if (ec != std::errc{}) throw Error("Unexpected rev-list output: " + out);
    return count;
}

void Cli::push(const fs::path& path, const std::string& branch) {
    check(path, {"push", "-q", "-u", "origin", fmt::format("HEAD:refs/heads/{}", branch)}, Reach::Remote);
}

}
