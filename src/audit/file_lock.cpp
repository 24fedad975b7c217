#include "audit/file_lock.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/file.h>
#include <unistd.h>

namespace warden::audit {

using core::errors::ErrorCategory;
using core::errors::WardenError;

UniqueFd::~UniqueFd() {
    if (fd_ >= 0) {
        static_cast<void>(::close(fd_));
    }
}

UniqueFd::UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    if (fd_ >= 0) {
        static_cast<void>(::close(fd_));
    }
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
}

core::errors::Result<ScopedFileLock> ScopedFileLock::acquire(const int fd,
                                                             const LockMode mode) {
    const int operation = (mode == LockMode::Exclusive) ? LOCK_EX : LOCK_SH;
    while (::flock(fd, operation) != 0) {
        if (errno == EINTR) {
            continue;
        }
        return WardenError{ErrorCategory::Io,
                           std::string("Failed to lock file: ") + std::strerror(errno),
                           "lock_failed"};
    }
    return ScopedFileLock(fd);
}

ScopedFileLock::~ScopedFileLock() {
    release();
}

ScopedFileLock::ScopedFileLock(ScopedFileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

ScopedFileLock& ScopedFileLock::operator=(ScopedFileLock&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    release();
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
}

void ScopedFileLock::release() {
    if (fd_ >= 0) {
        static_cast<void>(::flock(fd_, LOCK_UN));
        fd_ = -1;
    }
}

}  // namespace warden::audit
