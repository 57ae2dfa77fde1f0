#pragma once

/**
 * @file FdGuard.h
 * @brief RAII owner for POSIX file descriptors (sockets and regular files)
 */

#include <unistd.h>
#include <utility>

namespace FileCourier {

/**
 * @brief Closes the owned descriptor when it goes out of scope
 *
 * Usage:
 * @code
 * FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
 * if (!fd) { // inspect errno }
 * ::read(fd.get(), ...);
 * @endcode
 */
class FdGuard {
public:
    FdGuard() noexcept : fd_(-1) {}

    explicit FdGuard(int fd) noexcept : fd_(fd) {}

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    FdGuard(FdGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    FdGuard& operator=(FdGuard&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~FdGuard() {
        reset();
    }

    int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    /// Close current descriptor (if any) and take ownership of a new one
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

} // namespace FileCourier
