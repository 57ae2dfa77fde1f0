#pragma once

/**
 * @file SigpipeGuard.h
 * @brief Keeps SIGPIPE from killing the process during socket writes
 */

#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <cerrno>

namespace FileCourier {

/**
 * @brief Blocks SIGPIPE in the calling thread for the guard's lifetime
 *
 * OpenSSL writes through plain write(2), so MSG_NOSIGNAL is not available
 * on the TLS path. A SIGPIPE raised while the guard is held is consumed
 * before the previous mask is restored; the failed write still reports
 * EPIPE. A SIGPIPE already pending on entry is left untouched.
 *
 * @code
 * SigpipeGuard noSigpipe;
 * SSL_write(ssl, data, size);
 * @endcode
 */
class SigpipeGuard {
public:
    SigpipeGuard() noexcept {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
            return;
        }
        active_ = pthread_sigmask(SIG_BLOCK, &sigpipe_, &previous_) == 0;
    }

    ~SigpipeGuard() {
        if (!active_) return;

        int savedErrno = errno;
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
            struct timespec zero{0, 0};
            while (sigtimedwait(&sigpipe_, nullptr, &zero) < 0 && errno == EINTR) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
        errno = savedErrno;
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t sigpipe_;
    sigset_t previous_;
    bool active_{false};
};

} // namespace FileCourier
