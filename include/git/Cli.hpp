#pragma once

#include "git/VersionControl.hpp"
#include "config/Config.hpp"
#include "util/Subprocess.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace gitsync::git {

// VersionControl backed by the git command line, one bounded subprocess per call.
class Cli final : public VersionControl {
public:
    explicit Cli(config::GitConfig cnf);

    RepoState ensureRepo(const config::Entry& entry) override;
    void ensureBranch(const std::filesystem::path& path, const std::string& branch) override;
    bool commitIfDirty(const std::filesystem::path& path, const std::string& message) override;
    bool remoteBranchExists(const std::filesystem::path& path, const std::string& branch) override;
    void fetch(const std::filesystem::path& path, const std::string& branch) override;
    void forgetRemoteBranch(const std::filesystem::path& path, const std::string& branch) override;
    bool rebaseOnto(const std::filesystem::path& path, const std::string& branch) override;
    size_t unpushedCommits(const std::filesystem::path& path, const std::string& branch) override;
    void push(const std::filesystem::path& path, const std::string& branch) override;

private:
    enum class Reach { Local, Remote };

    config::GitConfig cnf_;
    std::vector<std::pair<std::string, std::string>> env_;

    util::ProcessResult run(const std::filesystem::path& path, const std::vector<std::string>& args,
                            Reach reach = Reach::Local) const;

    // run() that throws git::Error unless the command exited 0; returns trimmed stdout
    std::string check(const std::filesystem::path& path, const std::vector<std::string>& args,
                      Reach reach = Reach::Local) const;

    [[nodiscard]] bool hasCommits(const std::filesystem::path& path) const;
    void assertNoOperationInProgress(const std::filesystem::path& path) const;
    void upsertRemote(const std::filesystem::path& path, const std::string& url) const;
};

}
