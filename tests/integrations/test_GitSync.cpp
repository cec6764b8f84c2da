#include <gtest/gtest.h>
#include "unit/support/fakes.hpp"
#include "config/Config.hpp"
#include "git/Cli.hpp"
#include "net/Prober.hpp"
#include "sync/CycleRunner.hpp"
#include "sync/Operator.hpp"
#include "util/Subprocess.hpp"

#include <cstdlib>
#include <fstream>

using namespace gitsync;
using namespace gitsync::sync;
using namespace gitsync::test;
using namespace std::chrono_literals;

namespace {

std::string runGit(const fs::path& dir, const std::vector<std::string>& args) {
    std::vector<std::string> argv{"git", "-C", dir.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    const auto res = util::runProcess(argv);
    if (!res.ok()) throw std::runtime_error("git " + args.front() + " failed: " + res.err);
    auto out = res.out;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    return out;
}

void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::trunc);
    out << content;
}

}

// Drives the real git binary against bare repositories in a scratch directory
class GitSyncTest : public ::testing::Test {
protected:
    TempDir dir{"gitsync-it"};
    config::GitConfig gitCnf;
    std::unique_ptr<git::Cli> vcs;
    net::TcpProber prober{500ms};
    std::unique_ptr<Operator> op;

    void SetUp() override {
        if (std::system("git --version > /dev/null 2>&1") != 0) GTEST_SKIP() << "git not installed";

        // Isolate from the user's git configuration and identity
        setenv("HOME", dir.path.c_str(), 1);
        setenv("GIT_CONFIG_NOSYSTEM", "1", 1);
        setenv("GIT_AUTHOR_NAME", "gitsync test", 1);
        setenv("GIT_AUTHOR_EMAIL", "gitsync@example.invalid", 1);
        setenv("GIT_COMMITTER_NAME", "gitsync test", 1);
        setenv("GIT_COMMITTER_EMAIL", "gitsync@example.invalid", 1);

        vcs = std::make_unique<git::Cli>(gitCnf);
        op = std::make_unique<Operator>(*vcs, prober, "127.0.0.1", 9);
    }

    fs::path bare(const std::string& name) const {
        const auto p = dir.path / name;
        fs::create_directories(p);
        runGit(p, {"init", "-q", "--bare"});
        return p;
    }

    config::Entry entry(const std::string& name, const std::optional<fs::path>& remote) const {
        config::Entry e;
        e.path = dir.path / name;
        if (remote) e.remote = remote->string();
        return e;
    }
};

TEST_F(GitSyncTest, FirstSyncInitializesCommitsAndPushes) {
    const auto remote = bare("remote.git");
    const auto e = entry("notes", remote);
    writeFile(e.path / "todo.md", "- buy milk\n");

    const auto r = op->run(e);

    EXPECT_EQ(r.outcome, Outcome::CommittedAndPushed) << r.message;
    EXPECT_EQ(runGit(e.path, {"symbolic-ref", "--short", "HEAD"}), "main");
    EXPECT_EQ(runGit(remote, {"rev-parse", "refs/heads/main"}), runGit(e.path, {"rev-parse", "HEAD"}));
}

TEST_F(GitSyncTest, SecondSyncWithoutChangesIsIdle) {
    const auto remote = bare("remote.git");
    const auto e = entry("notes", remote);
    writeFile(e.path / "todo.md", "- buy milk\n");
    ASSERT_EQ(op->run(e).outcome, Outcome::CommittedAndPushed);

    const auto r = op->run(e);

    EXPECT_EQ(r.outcome, Outcome::NoChange) << r.message;
    EXPECT_EQ(runGit(e.path, {"rev-list", "--count", "HEAD"}), "1");
}

TEST_F(GitSyncTest, UnreachableRemoteKeepsCommitForNextRun) {
    const auto remotePath = dir.path / "later.git";
    const auto e = entry("notes", remotePath);
    writeFile(e.path / "todo.md", "- buy milk\n");

    const auto offline = op->run(e);
    ASSERT_EQ(offline.outcome, Outcome::CommittedOnly) << offline.message;
    EXPECT_EQ(op->run(e).outcome, Outcome::PushSkippedOffline);

    bare("later.git");
    const auto online = op->run(e);

    EXPECT_EQ(online.outcome, Outcome::CommittedAndPushed) << online.message;
    EXPECT_EQ(runGit(remotePath, {"rev-parse", "refs/heads/main"}), runGit(e.path, {"rev-parse", "HEAD"}));
}

TEST_F(GitSyncTest, RebasesOntoRemoteChanges) {
    const auto remote = bare("remote.git");
    const auto a = entry("laptop", remote);
    const auto b = entry("desktop", remote);

    writeFile(a.path / "a.md", "from laptop\n");
    ASSERT_EQ(op->run(a).outcome, Outcome::CommittedAndPushed);

    // An empty clone adopts the remote history
    fs::create_directories(b.path);
    ASSERT_EQ(op->run(b).outcome, Outcome::NoChange);
    EXPECT_TRUE(fs::exists(b.path / "a.md"));

    writeFile(a.path / "a2.md", "more from laptop\n");
    ASSERT_EQ(op->run(a).outcome, Outcome::CommittedAndPushed);

    writeFile(b.path / "b.md", "from desktop\n");
    const auto r = op->run(b);

    EXPECT_EQ(r.outcome, Outcome::CommittedAndPushed) << r.message;
    EXPECT_TRUE(fs::exists(b.path / "a2.md"));
    EXPECT_EQ(runGit(b.path, {"rev-list", "--count", "HEAD"}), "3");
    EXPECT_EQ(runGit(b.path, {"rev-list", "--merges", "--count", "HEAD"}), "0");
}

TEST_F(GitSyncTest, ConflictIsAbortedAndOtherEntriesStillSync) {
    const auto remote = bare("shared.git");
    const auto a = entry("laptop", remote);
    const auto b = entry("desktop", remote);
    const auto c = entry("journal", bare("journal.git"));

    writeFile(a.path / "notes.md", "laptop version\n");
    ASSERT_EQ(op->run(a).outcome, Outcome::CommittedAndPushed);

    writeFile(b.path / "notes.md", "desktop version\n");
    writeFile(c.path / "day1.md", "hello\n");

    const CycleRunner runner(*op);
    const auto summary = runner.run({b, c});

    ASSERT_EQ(summary.results.size(), 2u);
    EXPECT_EQ(summary.results[0].outcome, Outcome::Failed);
    EXPECT_NE(summary.results[0].message.find("manual intervention"), std::string::npos);
    EXPECT_EQ(summary.results[1].outcome, Outcome::CommittedAndPushed) << summary.results[1].message;

    // Pre-rebase state: no rebase in progress, local commit intact, remote untouched
    EXPECT_FALSE(fs::exists(b.path / ".git" / "rebase-merge"));
    EXPECT_FALSE(fs::exists(b.path / ".git" / "rebase-apply"));
    EXPECT_EQ(runGit(b.path, {"show", "HEAD:notes.md"}), "desktop version");
    EXPECT_EQ(runGit(remote, {"show", "main:notes.md"}), "laptop version");

    // The next cycle still refuses to push over the remote
    EXPECT_EQ(op->run(b).outcome, Outcome::Failed);
}

TEST_F(GitSyncTest, NoRemoteCommitsLocally) {
    const auto e = entry("scratch", std::nullopt);
    writeFile(e.path / "idea.txt", "x\n");

    EXPECT_EQ(op->run(e).outcome, Outcome::CommittedOnly);
    EXPECT_EQ(op->run(e).outcome, Outcome::PushSkippedDisabled);
    EXPECT_EQ(runGit(e.path, {"rev-list", "--count", "HEAD"}), "1");
}

TEST_F(GitSyncTest, SwitchesToConfiguredBranch) {
    const auto remote = bare("remote.git");
    auto e = entry("notes", remote);
    writeFile(e.path / "todo.md", "- one\n");
    ASSERT_EQ(op->run(e).outcome, Outcome::CommittedAndPushed);

    e.branch = "archive";
    writeFile(e.path / "todo.md", "- two\n");
    const auto r = op->run(e);

    EXPECT_EQ(r.outcome, Outcome::CommittedAndPushed) << r.message;
    EXPECT_EQ(runGit(e.path, {"symbolic-ref", "--short", "HEAD"}), "archive");
    EXPECT_EQ(runGit(remote, {"rev-parse", "refs/heads/archive"}), runGit(e.path, {"rev-parse", "HEAD"}));
}

TEST_F(GitSyncTest, RemoteUrlIsUpdatedFromEntry) {
    const auto first = bare("first.git");
    const auto second = bare("second.git");
    auto e = entry("notes", first);
    writeFile(e.path / "todo.md", "- one\n");
    ASSERT_EQ(op->run(e).outcome, Outcome::CommittedAndPushed);

    // The new remote is empty; the history must be published there too
    e.remote = second.string();
    const auto r = op->run(e);

    EXPECT_EQ(r.outcome, Outcome::CommittedAndPushed) << r.message;
    EXPECT_EQ(runGit(e.path, {"remote", "get-url", "origin"}), second.string());
    EXPECT_EQ(runGit(second, {"rev-parse", "refs/heads/main"}), runGit(e.path, {"rev-parse", "HEAD"}));
}

TEST_F(GitSyncTest, DeletedRemoteBranchIsPublishedAgain) {
    const auto remote = bare("remote.git");
    const auto e = entry("notes", remote);
    writeFile(e.path / "todo.md", "- one\n");
    ASSERT_EQ(op->run(e).outcome, Outcome::CommittedAndPushed);

    runGit(remote, {"update-ref", "-d", "refs/heads/main"});
    const auto r = op->run(e);

    EXPECT_EQ(r.outcome, Outcome::CommittedAndPushed) << r.message;
    EXPECT_EQ(runGit(remote, {"rev-parse", "refs/heads/main"}), runGit(e.path, {"rev-parse", "HEAD"}));
}

TEST_F(GitSyncTest, EmptyHistoryAdoptsRemoteTip) {
    const auto remote = bare("remote.git");
    const auto a = entry("laptop", remote);
    writeFile(a.path / "a.md", "from laptop\n");
    ASSERT_EQ(op->run(a).outcome, Outcome::CommittedAndPushed);

    const auto b = entry("desktop", remote);
    const auto state = vcs->ensureRepo(b);
    ASSERT_TRUE(state.created);
    ASSERT_FALSE(state.hasCommits);

    vcs->fetch(b.path, b.branch);
    EXPECT_TRUE(vcs->rebaseOnto(b.path, b.branch));

    EXPECT_EQ(runGit(b.path, {"symbolic-ref", "--short", "HEAD"}), "main");
    EXPECT_EQ(runGit(b.path, {"rev-parse", "HEAD"}), runGit(remote, {"rev-parse", "refs/heads/main"}));
    EXPECT_TRUE(fs::exists(b.path / "a.md"));
}

TEST_F(GitSyncTest, DetachedHeadReturnsToConfiguredBranch) {
    const auto e = entry("scratch", std::nullopt);
    writeFile(e.path / "one.txt", "1\n");
    ASSERT_EQ(op->run(e).outcome, Outcome::CommittedOnly);
    writeFile(e.path / "two.txt", "2\n");
    ASSERT_EQ(op->run(e).outcome, Outcome::CommittedOnly);

    const auto tip = runGit(e.path, {"rev-parse", "HEAD"});
    const auto older = runGit(e.path, {"rev-parse", "HEAD~1"});

    // Existing branch: checked out again
    runGit(e.path, {"checkout", "-q", "--detach", "HEAD~1"});
    vcs->ensureBranch(e.path, "main");
    EXPECT_EQ(runGit(e.path, {"symbolic-ref", "--short", "HEAD"}), "main");
    EXPECT_EQ(runGit(e.path, {"rev-parse", "HEAD"}), tip);

    // Unknown branch: created at the detached commit
    runGit(e.path, {"checkout", "-q", "--detach", "HEAD~1"});
    vcs->ensureBranch(e.path, "side");
    EXPECT_EQ(runGit(e.path, {"symbolic-ref", "--short", "HEAD"}), "side");
    EXPECT_EQ(runGit(e.path, {"rev-parse", "HEAD"}), older);
}

TEST_F(GitSyncTest, PushDisabledNeverTouchesRemote) {
    const auto remote = bare("remote.git");
    auto e = entry("notes", remote);
    e.push = false;
    writeFile(e.path / "todo.md", "- one\n");

    EXPECT_EQ(op->run(e).outcome, Outcome::CommittedOnly);
    const auto heads = util::runProcess({"git", "-C", remote.string(), "show-ref", "--heads"});
    EXPECT_TRUE(heads.out.empty());
}
