#pragma once

#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace FileCourier {

/**
 * @brief Digest algorithm shared with the receiving service
 *
 * Both ends must agree, since the server trusts already-stored bytes
 * whenever the digest and size it receives match its own.
 */
enum class ChecksumAlgorithm {
    MD5,
    SHA256
};

/**
 * @brief Content digests of local files and buffers
 */
class FileChecksum {
public:
    static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

    /**
     * @brief Digest the full content of a file
     * @param filePath File to read
     * @param algorithm Digest algorithm
     * @return Lower-case hex digest, or FileNotFound / FileAccessDenied /
     *         FileReadError / ChecksumFailed
     */
    static Result<std::string> compute(const std::string& filePath,
                                       ChecksumAlgorithm algorithm = ChecksumAlgorithm::MD5);

    /**
     * @brief Digest an in-memory buffer
     */
    static Result<std::string> computeBytes(const uint8_t* data, size_t length,
                                            ChecksumAlgorithm algorithm = ChecksumAlgorithm::MD5);

    static const char* algorithmName(ChecksumAlgorithm algorithm);

    /// Accepts "md5" and "sha256" (case-insensitive)
    static bool parseAlgorithm(const std::string& name, ChecksumAlgorithm& algorithm);
};

} // namespace FileCourier
