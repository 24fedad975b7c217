#pragma once

#include "core/errors/warden_errors.hpp"

namespace warden::audit {

// Owns a POSIX file descriptor and closes it on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd();

    UniqueFd(UniqueFd&& other) noexcept;
    UniqueFd& operator=(UniqueFd&& other) noexcept;
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

enum class LockMode {
    Shared,
    Exclusive
};

// Advisory flock() held for the lifetime of the object. Blocks until the lock
// is granted. The descriptor is borrowed and must outlive the lock.
class ScopedFileLock {
public:
    static core::errors::Result<ScopedFileLock> acquire(int fd, LockMode mode);
    ~ScopedFileLock();

    ScopedFileLock(ScopedFileLock&& other) noexcept;
    ScopedFileLock& operator=(ScopedFileLock&& other) noexcept;
    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

private:
    explicit ScopedFileLock(int fd) : fd_(fd) {}
    void release();

    int fd_ = -1;
};

}  // namespace warden::audit
