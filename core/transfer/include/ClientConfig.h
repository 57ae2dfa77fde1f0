#pragma once

#include "Config.h"
#include "FileChecksum.h"
#include "Logger.h"
#include "Result.h"
#include <cstddef>
#include <string>

namespace FileCourier {

/**
 * @brief Typed settings of the transfer client
 *
 * Keys read from Config (defaults in brackets):
 *   port [1055], tls_cert_file, tls_key_file, tls_key_password,
 *   tls_ca_file, tls_verify_peer [false], tls_server_name,
 *   chunk_size [65536, at most 16 MiB], max_frame_size [1048576],
 *   checksum_algorithm [md5], log_level [INFO], log_file
 */
struct ClientConfig {
    static constexpr int DEFAULT_PORT = 1055;
    static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
    static constexpr size_t DEFAULT_MAX_FRAME_SIZE = 1024 * 1024;

    int port{DEFAULT_PORT};

    std::string certFile;
    std::string keyFile;
    std::string keyPassword;
    std::string caFile;
    bool verifyPeer{false};
    std::string serverName;

    size_t chunkSize{DEFAULT_CHUNK_SIZE};
    size_t maxFrameSize{DEFAULT_MAX_FRAME_SIZE};
    ChecksumAlgorithm checksumAlgorithm{ChecksumAlgorithm::MD5};

    LogLevel logLevel{LogLevel::INFO};
    std::string logFile;

    /**
     * @brief Validate and convert a key=value store
     * @return InvalidConfig naming the offending key
     */
    static Result<ClientConfig> fromConfig(const Config& config);

    /// Peer verification is implied by a configured CA
    bool peerVerificationRequired() const { return verifyPeer || !caFile.empty(); }
};

} // namespace FileCourier
