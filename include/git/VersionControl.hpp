#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace gitsync::config { struct Entry; }

namespace gitsync::git {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct RepoState {
    bool created = false;     // initialized during this call
    bool hasCommits = false;
};

// Narrow capability surface the repository operator sequences. Failures throw git::Error.
class VersionControl {
public:
    virtual ~VersionControl() = default;

    // Creates the directory and repository when missing; points origin at entry.remote.
    virtual RepoState ensureRepo(const config::Entry& entry) = 0;

    // Switches to the branch, creating it from HEAD when it does not exist locally.
    virtual void ensureBranch(const std::filesystem::path& path, const std::string& branch) = 0;

    // Stages everything and commits; false when the tree was clean.
    virtual bool commitIfDirty(const std::filesystem::path& path, const std::string& message) = 0;

    virtual bool remoteBranchExists(const std::filesystem::path& path, const std::string& branch) = 0;

    virtual void fetch(const std::filesystem::path& path, const std::string& branch) = 0;

    // Drops the local origin/<branch> tracking ref once the remote no longer has the branch,
    // so every local commit counts as unpushed again.
    virtual void forgetRemoteBranch(const std::filesystem::path& path, const std::string& branch) = 0;

    // false when the rebase conflicted; the rebase has been aborted by then.
    virtual bool rebaseOnto(const std::filesystem::path& path, const std::string& branch) = 0;

    // Local commits not on origin/<branch>; every commit when there is no tracking ref.
    virtual size_t unpushedCommits(const std::filesystem::path& path, const std::string& branch) = 0;

    virtual void push(const std::filesystem::path& path, const std::string& branch) = 0;
};

}
