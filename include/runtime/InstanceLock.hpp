#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <sys/types.h>

namespace gitsync::runtime {

struct AlreadyRunning : std::runtime_error {
    AlreadyRunning(const std::string& what, pid_t holder) : std::runtime_error(what), holder(holder) {}
    pid_t holder;
};

// Exclusive flock() on a token file holding the owner's pid. The kernel drops the lock when
// the holder dies, so a leftover file is reclaimed by the next acquire().
class InstanceLock {
public:
    // Throws AlreadyRunning when a live process holds the lock.
    static InstanceLock acquire(const std::filesystem::path& path);

    InstanceLock(InstanceLock&& other) noexcept;
    InstanceLock& operator=(InstanceLock&& other) noexcept;
    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;
    ~InstanceLock();

    // Rewrites the recorded pid, e.g. after detaching into the background.
    void updatePid() const;

    void release() noexcept;

    [[nodiscard]] bool held() const { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    static bool isAlive(pid_t pid);

    // Pid recorded by the process currently holding the lock (0 when it wrote none yet);
    // nullopt when nobody holds it.
    static std::optional<pid_t> holder(const std::filesystem::path& path);

private:
    InstanceLock(std::filesystem::path path, int fd);

    std::filesystem::path path_;
    int fd_ = -1;
};

}
