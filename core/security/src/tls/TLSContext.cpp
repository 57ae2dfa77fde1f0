/**
 * @file TLSContext.cpp
 * @brief TLSContext setup: SSL_CTX creation, certificates, verification, handshake
 */

#include "TLSContext.h"
#include "Logger.h"
#include "SigpipeGuard.h"
#include <openssl/err.h>
#include <arpa/inet.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

namespace FileCourier {

namespace {
    // TLS 1.3 suites plus strong TLS 1.2 ciphers
    const char* DEFAULT_CIPHERS =
        "TLS_AES_256_GCM_SHA384:"
        "TLS_CHACHA20_POLY1305_SHA256:"
        "TLS_AES_128_GCM_SHA256:"
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256";

    std::string getOpenSSLError() {
        unsigned long err = ERR_get_error();
        if (err == 0) return "Unknown error";

        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        ERR_clear_error();
        return std::string(buf);
    }

    bool isIpLiteral(const std::string& host) {
        unsigned char buf[sizeof(struct in6_addr)];
        return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
               inet_pton(AF_INET6, host.c_str(), buf) == 1;
    }
}

TLSContext::TLSContext(Mode mode) : mode_(mode) {}

TLSContext::~TLSContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

TLSContext::TLSContext(TLSContext&& other) noexcept
    : mode_(other.mode_)
    , ctx_(other.ctx_)
    , verifyPeer_(other.verifyPeer_)
    , lastError_(std::move(other.lastError_))
{
    other.ctx_ = nullptr;
}

TLSContext& TLSContext::operator=(TLSContext&& other) noexcept {
    if (this != &other) {
        if (ctx_) SSL_CTX_free(ctx_);

        mode_ = other.mode_;
        ctx_ = other.ctx_;
        verifyPeer_ = other.verifyPeer_;
        lastError_ = std::move(other.lastError_);

        other.ctx_ = nullptr;
    }
    return *this;
}

bool TLSContext::initialize() {
    auto& logger = Logger::instance();

    if (ctx_) {
        return true;
    }

    const SSL_METHOD* method = (mode_ == Mode::SERVER)
        ? TLS_server_method()
        : TLS_client_method();

    ctx_ = SSL_CTX_new(method);
    if (!ctx_) {
        lastError_ = "Failed to create SSL context: " + getOpenSSLError();
        logger.log(LogLevel::ERROR, lastError_, "TLSContext");
        return false;
    }

    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    SSL_CTX_set_max_proto_version(ctx_, TLS1_3_VERSION);

    if (SSL_CTX_set_cipher_list(ctx_, DEFAULT_CIPHERS) != 1) {
        logger.log(LogLevel::WARN, "Failed to set cipher list, using defaults", "TLSContext");
    }

    SSL_CTX_set_options(ctx_,
        SSL_OP_NO_COMPRESSION |     // CRIME
        SSL_OP_NO_TICKET
    );
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // The tail stream ends when the peer closes; treat a missing close_notify as EOF
    SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    if (mode_ == Mode::SERVER) {
        SSL_CTX_set_options(ctx_, SSL_OP_CIPHER_SERVER_PREFERENCE);
    }

    // Blocking sockets: let OpenSSL retry reads interrupted by renegotiation
    SSL_CTX_set_mode(ctx_, SSL_MODE_AUTO_RETRY);

    applyVerifyMode();

    logger.log(LogLevel::DEBUG, std::string("TLS context initialized (") +
               (mode_ == Mode::SERVER ? "server" : "client") + ")", "TLSContext");
    return true;
}

bool TLSContext::loadCertificate(const std::string& certPath,
                                 const std::string& keyPath,
                                 const std::string& keyPassword) {
    auto& logger = Logger::instance();

    if (!ctx_) {
        lastError_ = "TLS context not initialized";
        return false;
    }

    if (SSL_CTX_use_certificate_chain_file(ctx_, certPath.c_str()) != 1) {
        lastError_ = "Failed to load certificate " + certPath + ": " + getOpenSSLError();
        logger.log(LogLevel::ERROR, lastError_, "TLSContext");
        return false;
    }

    // The default password callback reads the userdata as a C string; it
    // is only needed while the key is parsed
    std::string password = keyPassword;
    if (!password.empty()) {
        SSL_CTX_set_default_passwd_cb_userdata(ctx_, &password[0]);
    }
    int keyLoaded = SSL_CTX_use_PrivateKey_file(ctx_, keyPath.c_str(), SSL_FILETYPE_PEM);
    SSL_CTX_set_default_passwd_cb_userdata(ctx_, nullptr);

    if (keyLoaded != 1) {
        lastError_ = "Failed to load private key " + keyPath + ": " + getOpenSSLError();
        logger.log(LogLevel::ERROR, lastError_, "TLSContext");
        return false;
    }

    if (SSL_CTX_check_private_key(ctx_) != 1) {
        lastError_ = "Private key does not match certificate " + certPath;
        logger.log(LogLevel::ERROR, lastError_, "TLSContext");
        return false;
    }

    logger.log(LogLevel::INFO, "Loaded TLS certificate: " + certPath, "TLSContext");
    return true;
}

bool TLSContext::loadCACertificates(const std::string& caPath) {
    auto& logger = Logger::instance();

    if (!ctx_) {
        lastError_ = "TLS context not initialized";
        return false;
    }

    struct stat st;
    if (stat(caPath.c_str(), &st) != 0) {
        lastError_ = "CA path does not exist: " + caPath;
        logger.log(LogLevel::ERROR, lastError_, "TLSContext");
        return false;
    }

    int result;
    if (S_ISDIR(st.st_mode)) {
        result = SSL_CTX_load_verify_locations(ctx_, nullptr, caPath.c_str());
    } else {
        result = SSL_CTX_load_verify_locations(ctx_, caPath.c_str(), nullptr);
    }

    if (result != 1) {
        lastError_ = "Failed to load CA certificates: " + getOpenSSLError();
        logger.log(LogLevel::ERROR, lastError_, "TLSContext");
        return false;
    }

    logger.log(LogLevel::INFO, "Loaded CA certificates from: " + caPath, "TLSContext");
    return true;
}

bool TLSContext::useSystemCertificates() {
    if (!ctx_) {
        lastError_ = "TLS context not initialized";
        return false;
    }

    if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        lastError_ = "Failed to load system certificates: " + getOpenSSLError();
        Logger::instance().log(LogLevel::ERROR, lastError_, "TLSContext");
        return false;
    }

    Logger::instance().log(LogLevel::DEBUG, "Using system certificate store", "TLSContext");
    return true;
}

void TLSContext::setPeerVerification(bool enable) {
    verifyPeer_ = enable;
    applyVerifyMode();
}

void TLSContext::applyVerifyMode() {
    if (!ctx_) return;

    if (!verifyPeer_) {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
    } else if (mode_ == Mode::CLIENT) {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, verifyCallback);
    } else {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, verifyCallback);
    }
}

SSL* TLSContext::wrapSocket(int socket, const std::string& hostname) {
    if (!ctx_) {
        lastError_ = "TLS context not initialized";
        return nullptr;
    }

    SSL* ssl = SSL_new(ctx_);
    if (!ssl) {
        lastError_ = "Failed to create SSL object: " + getOpenSSLError();
        Logger::instance().log(LogLevel::ERROR, lastError_, "TLSContext");
        return nullptr;
    }

    if (SSL_set_fd(ssl, socket) != 1) {
        lastError_ = "Failed to attach socket: " + getOpenSSLError();
        SSL_free(ssl);
        return nullptr;
    }

    if (mode_ == Mode::CLIENT && !hostname.empty()) {
        if (!isIpLiteral(hostname)) {
            SSL_set_tlsext_host_name(ssl, hostname.c_str());
        }
        if (verifyPeer_) {
            SSL_set1_host(ssl, hostname.c_str());
        }
    }

    return ssl;
}

bool TLSContext::performHandshake(SSL* ssl) {
    auto& logger = Logger::instance();

    int ret;
    {
        SigpipeGuard noSigpipe;
        ret = (mode_ == Mode::CLIENT) ? SSL_connect(ssl) : SSL_accept(ssl);
    }
    if (ret == 1) {
        logger.log(LogLevel::DEBUG, std::string("TLS handshake complete: ") + SSL_get_version(ssl),
                   "TLSContext");
        return true;
    }

    int err = SSL_get_error(ssl, ret);
    switch (err) {
        case SSL_ERROR_ZERO_RETURN:
            lastError_ = "TLS connection closed during handshake";
            break;
        case SSL_ERROR_SYSCALL:
            lastError_ = errno != 0
                ? "TLS syscall error: " + std::string(strerror(errno))
                : "Peer closed connection during handshake";
            break;
        case SSL_ERROR_SSL: {
            long verifyResult = SSL_get_verify_result(ssl);
            if (verifyResult != X509_V_OK) {
                lastError_ = std::string("Certificate verification failed: ") +
                             X509_verify_cert_error_string(verifyResult);
            } else {
                lastError_ = "TLS error: " + getOpenSSLError();
            }
            break;
        }
        default:
            lastError_ = "Unknown TLS error: " + std::to_string(err);
    }

    logger.log(LogLevel::ERROR, lastError_, "TLSContext");
    return false;
}

int TLSContext::verifyCallback(int preverifyOk, X509_STORE_CTX* storeCtx) {
    if (!preverifyOk) {
        int depth = X509_STORE_CTX_get_error_depth(storeCtx);
        int err = X509_STORE_CTX_get_error(storeCtx);
        Logger::instance().log(LogLevel::WARN,
            "Certificate verify failed at depth " + std::to_string(depth) +
            ": " + X509_verify_cert_error_string(err), "TLSContext");
    }
    return preverifyOk;
}

} // namespace FileCourier
