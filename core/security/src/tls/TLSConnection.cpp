/**
 * @file TLSConnection.cpp
 * @brief Blocking read/write and teardown of an established SSL session
 */

#include "TLSContext.h"
#include "SigpipeGuard.h"
#include <openssl/err.h>
#include <cerrno>
#include <cstring>
#include <limits>

namespace FileCourier {

TLSConnection::TLSConnection(SSL* ssl) : ssl_(ssl) {}

TLSConnection::~TLSConnection() {
    close();
}

TLSConnection::TLSConnection(TLSConnection&& other) noexcept
    : ssl_(other.ssl_), lastError_(std::move(other.lastError_)) {
    other.ssl_ = nullptr;
}

TLSConnection& TLSConnection::operator=(TLSConnection&& other) noexcept {
    if (this != &other) {
        close();
        ssl_ = other.ssl_;
        lastError_ = std::move(other.lastError_);
        other.ssl_ = nullptr;
    }
    return *this;
}

ssize_t TLSConnection::read(void* buffer, size_t maxSize) {
    if (!ssl_) {
        lastError_ = "Connection closed";
        return -1;
    }

    // SSL_read may answer the peer with alerts or key updates
    SigpipeGuard noSigpipe;
    int request = static_cast<int>(std::min<size_t>(maxSize, std::numeric_limits<int>::max()));
    while (true) {
        int ret = SSL_read(ssl_, buffer, request);
        if (ret > 0) {
            return ret;
        }
        int err = SSL_get_error(ssl_, ret);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            continue;
        }
        if (err == SSL_ERROR_ZERO_RETURN) {
            return 0;
        }
        if (err == SSL_ERROR_SYSCALL && errno == 0) {
            // EOF without close_notify
            return 0;
        }
        recordError(ret, "read");
        return -1;
    }
}

ssize_t TLSConnection::write(const void* data, size_t size) {
    if (!ssl_) {
        lastError_ = "Connection closed";
        return -1;
    }

    SigpipeGuard noSigpipe;
    int request = static_cast<int>(std::min<size_t>(size, std::numeric_limits<int>::max()));
    while (true) {
        int ret = SSL_write(ssl_, data, request);
        if (ret > 0) {
            return ret;
        }
        int err = SSL_get_error(ssl_, ret);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            continue;
        }
        recordError(ret, "write");
        return -1;
    }
}

void TLSConnection::close() {
    if (ssl_) {
        // Best-effort close_notify; a peer that already left is not an error here
        SigpipeGuard noSigpipe;
        SSL_shutdown(ssl_);
        SSL_free(ssl_);
        ssl_ = nullptr;
        ERR_clear_error();
    }
}

std::string TLSConnection::getProtocolVersion() const {
    if (!ssl_) return "";
    return SSL_get_version(ssl_);
}

std::string TLSConnection::getCipherSuite() const {
    if (!ssl_) return "";
    const SSL_CIPHER* cipher = SSL_get_current_cipher(ssl_);
    return cipher ? SSL_CIPHER_get_name(cipher) : "";
}

void TLSConnection::recordError(int ret, const char* operation) {
    int err = SSL_get_error(ssl_, ret);
    if (err == SSL_ERROR_SYSCALL) {
        lastError_ = std::string("TLS ") + operation + " failed: " + strerror(errno);
    } else {
        unsigned long code = ERR_get_error();
        char buf[256];
        if (code != 0) {
            ERR_error_string_n(code, buf, sizeof(buf));
            lastError_ = std::string("TLS ") + operation + " failed: " + buf;
        } else {
            lastError_ = std::string("TLS ") + operation + " failed: SSL error " + std::to_string(err);
        }
    }
    ERR_clear_error();
}

} // namespace FileCourier
