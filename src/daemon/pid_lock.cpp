#include "pid_lock.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace {

pid_t read_pid(int fd) {
    char buf[32] = {};
    ssize_t n = ::pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0) return 0;
    return static_cast<pid_t>(std::strtol(buf, nullptr, 10));
}

} // namespace

std::expected<PidLock, LockError> PidLock::acquire(const std::string& path) {
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(LockError{LockError::Kind::Io,
                                         "open(" + path + ") failed: " + std::strerror(errno)});
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        pid_t holder = read_pid(fd);
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return std::unexpected(LockError{
                LockError::Kind::Contention,
                "another instance is already running" +
                    (holder > 0 ? " (pid " + std::to_string(holder) + ")" : std::string()),
                holder});
        }
        return std::unexpected(LockError{LockError::Kind::Io,
                                         "flock(" + path + ") failed: " + std::strerror(err)});
    }

    PidLock lock(path, fd);
    if (auto res = lock.write_pid(); !res) {
        return std::unexpected(res.error());
    }
    return lock;
}

std::expected<void, LockError> PidLock::write_pid() {
    auto pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd_, 0) < 0 ||
        ::pwrite(fd_, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
        return std::unexpected(LockError{LockError::Kind::Io,
                                         "write(" + path_ + ") failed: " + std::strerror(errno)});
    }
    return {};
}

PidLock::PidLock(PidLock&& other) noexcept
    : path_(std::exchange(other.path_, {})), fd_(std::exchange(other.fd_, -1)) {}

PidLock& PidLock::operator=(PidLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::exchange(other.path_, {});
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

PidLock::~PidLock() {
    release();
}

void PidLock::release() {
    if (fd_ < 0) return;
    // Unlink while still holding the lock so a starting instance cannot lock
    // the file we are about to delete.
    if (::unlink(path_.c_str()) < 0 && errno != ENOENT) {
        std::println(stderr, "lock: unlink({}) failed: {}", path_, std::strerror(errno));
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}
