#pragma once

#include "FileChecksum.h"
#include "Result.h"
#include "TransferTypes.h"
#include <string>

namespace FileCourier {

/**
 * @brief Builds the FileAttributes snapshot sent during negotiation
 *
 * Size comes from stat(2), the digest from a separate read pass. No lock
 * is held across the two, so a file modified in between yields an
 * inconsistent snapshot; the server will then report a mismatch or an
 * offset we simply trust.
 */
class FileAttributeReader {
public:
    explicit FileAttributeReader(ChecksumAlgorithm algorithm = ChecksumAlgorithm::MD5)
        : algorithm_(algorithm) {}

    Result<FileAttributes> read(const std::string& filePath) const;

    static std::string basenameOf(const std::string& filePath);

private:
    ChecksumAlgorithm algorithm_;
};

} // namespace FileCourier
