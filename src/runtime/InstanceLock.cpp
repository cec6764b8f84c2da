#include "runtime/InstanceLock.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace gitsync::runtime {

namespace {

pid_t readPid(const int fd) {
    char buf[32] = {};
    const ssize_t n = pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0) return 0;
    try {
        return static_cast<pid_t>(std::stol(std::string(buf, static_cast<size_t>(n))));
    } catch (const std::exception&) {
        return 0;
    }
}

void writePid(const int fd, const pid_t pid) {
    const auto s = fmt::format("{}\n", pid);
    if (ftruncate(fd, 0) != 0 || pwrite(fd, s.data(), s.size(), 0) != static_cast<ssize_t>(s.size()))
        throw std::runtime_error(fmt::format("Failed to record pid in lock file: {}", std::strerror(errno)));
    fsync(fd);
}

}

bool InstanceLock::isAlive(const pid_t pid) {
    if (pid <= 0) return false;
    return kill(pid, 0) == 0 || errno == EPERM;
}

std::optional<pid_t> InstanceLock::holder(const fs::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) return std::nullopt;
        throw std::runtime_error(fmt::format("Failed to open lock file {}: {}", path.string(), std::strerror(errno)));
    }

    // A shared lock conflicts only with a running instance's exclusive one
    if (flock(fd, LOCK_SH | LOCK_NB) == 0) {
        flock(fd, LOCK_UN);
        ::close(fd);
        return std::nullopt;
    }

    const int err = errno;
    const pid_t pid = readPid(fd);
    ::close(fd);
    if (err != EWOULDBLOCK)
        throw std::runtime_error(fmt::format("Failed to probe lock {}: {}", path.string(), std::strerror(err)));
    return pid;
}

InstanceLock::InstanceLock(fs::path path, const int fd) : path_(std::move(path)), fd_(fd) {}

InstanceLock InstanceLock::acquire(const fs::path& path) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    const int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) throw std::runtime_error(fmt::format("Failed to open lock file {}: {}", path.string(), std::strerror(errno)));

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        const pid_t holder = readPid(fd);
        ::close(fd);
        if (err == EWOULDBLOCK)
            throw AlreadyRunning(fmt::format("Another gitsync instance is running (pid {})", holder), holder);
        throw std::runtime_error(fmt::format("Failed to lock {}: {}", path.string(), std::strerror(err)));
    }

    InstanceLock lock(path, fd);

    if (const pid_t previous = readPid(fd); previous > 0 && previous != getpid()) {
        if (isAlive(previous))
            log::Registry::runtime()->warn("[InstanceLock] Lock file names live pid {} but was not locked; taking over", previous);
        else
            log::Registry::runtime()->info("[InstanceLock] Reclaimed stale lock left by pid {}", previous);
    }

    writePid(fd, getpid());
    log::Registry::runtime()->debug("[InstanceLock] Acquired {}", path.string());
    return lock;
}

InstanceLock::InstanceLock(InstanceLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

InstanceLock& InstanceLock::operator=(InstanceLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

InstanceLock::~InstanceLock() { release(); }

void InstanceLock::updatePid() const {
    if (fd_ < 0) throw std::logic_error("InstanceLock::updatePid() on a released lock");
    writePid(fd_, getpid());
}

void InstanceLock::release() noexcept {
    if (fd_ < 0) return;
    // Truncate before unlocking so the next holder never reads our pid
    if (ftruncate(fd_, 0) != 0) { /* stale pid is harmless; the next acquire reclaims it */ }
    flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

}
