#pragma once

#include <expected>
#include <string>
#include <sys/types.h>

struct LockError {
    enum class Kind { Contention, Io } kind;
    std::string message;
    pid_t holder = 0; // PID recorded by the running instance, if readable
};

// Single-instance guard: an flock()ed file holding our PID. The kernel drops
// the lock when the holder dies, so a stale file never blocks a new instance.
// Released (and the file removed) on destruction.
class PidLock {
public:
    static std::expected<PidLock, LockError> acquire(const std::string& path);

    PidLock(PidLock&& other) noexcept;
    PidLock& operator=(PidLock&& other) noexcept;
    ~PidLock();

    PidLock(const PidLock&) = delete;
    PidLock& operator=(const PidLock&) = delete;

    const std::string& path() const { return path_; }

    // Record the calling process's PID. The lock survives fork(), so a
    // daemonizing process takes it first and calls this again from the child.
    std::expected<void, LockError> write_pid();

    void release();

private:
    PidLock(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

    std::string path_;
    int fd_ = -1;
};
