#include <gtest/gtest.h>
#include "support/fakes.hpp"
#include "runtime/InstanceLock.hpp"

#include <csignal>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

using namespace gitsync::runtime;
using namespace gitsync::test;

namespace {

std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

pid_t deadPid() {
    const pid_t pid = fork();
    if (pid == 0) _exit(0);
    waitpid(pid, nullptr, 0);
    return pid;
}

}

class InstanceLockTest : public ::testing::Test {
protected:
    TempDir dir{"gitsync-lock"};
    fs::path lockPath = dir.path / "gitsync.lock";
};

TEST_F(InstanceLockTest, AcquireRecordsPid) {
    const auto lock = InstanceLock::acquire(lockPath);

    EXPECT_TRUE(lock.held());
    EXPECT_EQ(slurp(lockPath), std::to_string(getpid()) + "\n");
}

TEST_F(InstanceLockTest, SecondAcquireFailsWhileHeld) {
    const auto lock = InstanceLock::acquire(lockPath);

    try {
        auto second = InstanceLock::acquire(lockPath);
        FAIL() << "second acquire should have thrown";
    } catch (const AlreadyRunning& e) {
        EXPECT_EQ(e.holder, getpid());
    }
}

TEST_F(InstanceLockTest, ReleaseAllowsReacquireAndClearsPid) {
    {
        auto lock = InstanceLock::acquire(lockPath);
        lock.release();
        EXPECT_FALSE(lock.held());
        EXPECT_TRUE(slurp(lockPath).empty());
    }
    EXPECT_NO_THROW(InstanceLock::acquire(lockPath));
}

TEST_F(InstanceLockTest, DestructorReleases) {
    { const auto lock = InstanceLock::acquire(lockPath); }
    EXPECT_NO_THROW(InstanceLock::acquire(lockPath));
}

TEST_F(InstanceLockTest, StaleLockFromDeadProcessIsReclaimed) {
    {
        std::ofstream out(lockPath);
        out << deadPid() << "\n";
    }

    const auto lock = InstanceLock::acquire(lockPath);
    EXPECT_EQ(slurp(lockPath), std::to_string(getpid()) + "\n");
}

TEST_F(InstanceLockTest, LockHeldByAnotherProcess) {
    int ready[2];
    ASSERT_EQ(pipe(ready), 0);

    const pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        close(ready[0]);
        try {
            const auto lock = InstanceLock::acquire(lockPath);
            const char ok = 1;
            if (write(ready[1], &ok, 1) != 1) _exit(2);
            pause();
        } catch (const std::exception&) {
            _exit(1);
        }
        _exit(0);
    }

    close(ready[1]);
    char byte = 0;
    ASSERT_EQ(read(ready[0], &byte, 1), 1);
    close(ready[0]);

    try {
        auto lock = InstanceLock::acquire(lockPath);
        ADD_FAILURE() << "acquire should fail while the child holds the lock";
    } catch (const AlreadyRunning& e) {
        EXPECT_EQ(e.holder, child);
    }

    kill(child, SIGKILL);
    waitpid(child, nullptr, 0);

    // Kernel dropped the lock with the process; the leftover pid is stale
    EXPECT_NO_THROW(InstanceLock::acquire(lockPath));
}

TEST_F(InstanceLockTest, HolderReportsOnlyALockedFile) {
    EXPECT_FALSE(InstanceLock::holder(lockPath).has_value());

    {
        const auto lock = InstanceLock::acquire(lockPath);
        const auto owner = InstanceLock::holder(lockPath);
        ASSERT_TRUE(owner.has_value());
        EXPECT_EQ(*owner, getpid());
    }

    // File and pid left behind without a lock do not count
    {
        std::ofstream out(lockPath);
        out << getpid() << "\n";
    }
    EXPECT_FALSE(InstanceLock::holder(lockPath).has_value());
}

TEST_F(InstanceLockTest, MoveTransfersOwnership) {
    auto a = InstanceLock::acquire(lockPath);
    InstanceLock b = std::move(a);

    EXPECT_FALSE(a.held());
    EXPECT_TRUE(b.held());
    EXPECT_NO_THROW(b.updatePid());
    EXPECT_THROW(a.updatePid(), std::logic_error);
}

TEST(InstanceLockLiveness, DetectsLiveAndDeadPids) {
    EXPECT_TRUE(InstanceLock::isAlive(getpid()));
    EXPECT_FALSE(InstanceLock::isAlive(deadPid()));
    EXPECT_FALSE(InstanceLock::isAlive(0));
}
