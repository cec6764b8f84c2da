#pragma once

#include "config/Config.hpp"
#include "git/VersionControl.hpp"
#include "net/Prober.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>
#include <fmt/core.h>

namespace gitsync::test {

namespace fs = std::filesystem;

// In-memory repository the fake version control reads and mutates
struct FakeRepo {
    bool dirty = false;
    size_t unpushed = 0;        // relative to the tracking ref
    bool remoteHasBranch = true;
    bool conflict = false;
    bool failEnsure = false;
    bool failFetch = false;
    bool failPush = false;
    bool throwPlain = false;    // commit throws a non-git exception
    size_t commits = 0;
    size_t pushes = 0;
    std::string lastMessage;
    std::string branch;
};

class FakeVersionControl final : public git::VersionControl {
public:
    std::map<fs::path, FakeRepo> repos;
    std::vector<std::string> calls;             // "<op> <path>"
    std::function<void(const fs::path&)> onCommit;

    FakeRepo& repo(const fs::path& p) { return repos[p]; }

    [[nodiscard]] size_t count(const std::string& op) const {
        return std::ranges::count_if(calls, [&](const std::string& c) { return c.rfind(op + " ", 0) == 0; });
    }

    git::RepoState ensureRepo(const config::Entry& entry) override {
        record("ensureRepo", entry.path);
        auto& r = repo(entry.path);
        if (r.failEnsure) throw git::Error("git init failed: permission denied");
        return {false, r.commits > 0};
    }

    void ensureBranch(const fs::path& path, const std::string& branch) override {
        record("ensureBranch", path);
        repo(path).branch = branch;
    }

    bool commitIfDirty(const fs::path& path, const std::string& message) override {
        record("commit", path);
        auto& r = repo(path);
        if (onCommit) onCommit(path);
        if (r.throwPlain) throw std::runtime_error("disk full");
        if (!r.dirty) return false;
        r.dirty = false;
        ++r.commits;
        ++r.unpushed;
        r.lastMessage = message;
        return true;
    }

    bool remoteBranchExists(const fs::path& path, const std::string&) override {
        record("lsRemote", path);
        return repo(path).remoteHasBranch;
    }

    void fetch(const fs::path& path, const std::string&) override {
        record("fetch", path);
        if (repo(path).failFetch) throw git::Error("git fetch failed: Permission denied (publickey)");
    }

    // Without a tracking ref every local commit is pending
    void forgetRemoteBranch(const fs::path& path, const std::string&) override {
        record("forget", path);
        auto& r = repo(path);
        r.unpushed = r.commits;
    }

    bool rebaseOnto(const fs::path& path, const std::string&) override {
        record("rebase", path);
        return !repo(path).conflict;
    }

    size_t unpushedCommits(const fs::path& path, const std::string&) override {
        record("unpushed", path);
        return repo(path).unpushed;
    }

    void push(const fs::path& path, const std::string&) override {
        record("push", path);
        auto& r = repo(path);
        if (r.failPush) throw git::Error("git push failed: rejected (non-fast-forward)");
        r.unpushed = 0;
        r.remoteHasBranch = true;
        ++r.pushes;
    }

private:
    void record(const std::string& op, const fs::path& p) { calls.push_back(op + " " + p.string()); }
};

class FakeProber final : public net::Prober {
public:
    bool online = true;
    std::vector<net::Endpoint> probed;

    bool reachable(const net::Endpoint& ep) noexcept override {
        probed.push_back(ep);
        return online;
    }
};

inline config::Entry makeEntry(const fs::path& path, std::optional<std::string> remote = "git@github.com:me/notes.git",
                               const bool push = true) {
    config::Entry e;
    e.path = path;
    e.remote = std::move(remote);
    e.push = push;
    return e;
}

// Fresh directory under the system temp dir, removed on destruction
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& tag = "gitsync") {
        path = fs::temp_directory_path() / fmt::format("{}-{}-{}", tag, getpid(), counter()++);
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

private:
    static size_t& counter() { static size_t c = 0; return c; }
};

}
