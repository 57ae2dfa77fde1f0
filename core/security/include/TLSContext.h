#pragma once

#include <string>
#include <sys/types.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace FileCourier {

/**
 * @brief TLS configuration shared by every channel of a transfer client
 *
 * Provides:
 * - SSL_CTX creation for client or server sockets (TLS 1.2 minimum)
 * - Loading of the local certificate/private key pair from injected paths
 * - Optional peer verification against a CA file/dir or the system store
 */
class TLSContext {
public:
    /**
     * @brief TLS connection mode
     */
    enum class Mode {
        CLIENT,
        SERVER
    };

    /**
     * @brief Constructor
     * @param mode Client or server mode
     */
    explicit TLSContext(Mode mode);

    ~TLSContext();

    // Disable copy
    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    // Enable move
    TLSContext(TLSContext&&) noexcept;
    TLSContext& operator=(TLSContext&&) noexcept;

    /**
     * @brief Create the underlying SSL_CTX
     * @return true on success
     */
    bool initialize();

    /**
     * @brief Load the local certificate and private key
     * @param certPath Path to PEM certificate file
     * @param keyPath Path to PEM private key file
     * @param keyPassword Optional password for an encrypted key
     * @return true on success
     */
    bool loadCertificate(const std::string& certPath,
                         const std::string& keyPath,
                         const std::string& keyPassword = "");

    /**
     * @brief Trust the CA certificates at a file or hashed directory
     * @return true on success
     */
    bool loadCACertificates(const std::string& caPath);

    /**
     * @brief Trust the system default CA store
     * @return true on success
     */
    bool useSystemCertificates();

    /**
     * @brief Require a valid peer certificate during the handshake
     *
     * Off by default: the receiving service authenticates with a
     * self-issued certificate that clients do not pin.
     */
    void setPeerVerification(bool enable);

    /**
     * @brief Create an SSL object bound to a connected socket
     * @param socket Connected socket file descriptor (not owned)
     * @param hostname Peer name for SNI and, when verifying, name checks
     * @return SSL pointer on success, nullptr on failure
     */
    SSL* wrapSocket(int socket, const std::string& hostname = "");

    /**
     * @brief Run SSL_connect / SSL_accept to completion (blocking)
     * @return true on success; getLastError() describes failures
     */
    bool performHandshake(SSL* ssl);

    SSL_CTX* getContext() const { return ctx_; }

    Mode getMode() const { return mode_; }

    std::string getLastError() const { return lastError_; }

private:
    void applyVerifyMode();

    static int verifyCallback(int preverifyOk, X509_STORE_CTX* storeCtx);

    Mode mode_;
    SSL_CTX* ctx_{nullptr};
    bool verifyPeer_{false};
    std::string lastError_;
};

/**
 * @brief RAII wrapper for an SSL connection (does not own the socket)
 */
class TLSConnection {
public:
    TLSConnection() = default;
    explicit TLSConnection(SSL* ssl);
    ~TLSConnection();

    // Disable copy
    TLSConnection(const TLSConnection&) = delete;
    TLSConnection& operator=(const TLSConnection&) = delete;

    // Enable move
    TLSConnection(TLSConnection&&) noexcept;
    TLSConnection& operator=(TLSConnection&&) noexcept;

    /**
     * @brief Read decrypted bytes (blocking)
     * @return Bytes read, 0 on orderly close, -1 on error
     */
    ssize_t read(void* buffer, size_t maxSize);

    /**
     * @brief Write bytes (blocking)
     * @return Bytes written, -1 on error
     */
    ssize_t write(const void* data, size_t size);

    /**
     * @brief Send close_notify and release the SSL object
     */
    void close();

    bool isValid() const { return ssl_ != nullptr; }

    SSL* get() const { return ssl_; }

    /// Description of the last read/write failure
    std::string getLastError() const { return lastError_; }

    std::string getProtocolVersion() const;

    std::string getCipherSuite() const;

private:
    void recordError(int ret, const char* operation);

    SSL* ssl_{nullptr};
    std::string lastError_;
};

} // namespace FileCourier
