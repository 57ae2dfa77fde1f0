#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace FileCourier {

/**
 * @brief Place the file at an explicit path on the server
 */
struct DestinationPath {
    std::string path;
};

/**
 * @brief Place the file under a server-side object identifier
 */
struct DestinationUuid {
    std::string id;
};

/**
 * @brief Place the file inside a server-side directory, keeping its basename
 */
struct DestinationDirectory {
    std::string path;
};

/**
 * @brief Where the server should put the incoming file
 *
 * Exactly one placement is always present.
 */
using DestinationSelector = std::variant<DestinationPath, DestinationUuid, DestinationDirectory>;

/// Wire tag of the selector: "destination", "uuid" or "directory"
const char* selectorTag(const DestinationSelector& selector);

/// Path or identifier carried by the selector
const std::string& selectorValue(const DestinationSelector& selector);

struct TransferRequest {
    std::string host;
    int port{0};
    std::string filepath;
    DestinationSelector destination;
};

/**
 * @brief Snapshot of the local file taken before negotiation
 */
struct FileAttributes {
    uint64_t size{0};
    std::string checksum;   // Lower-case hex digest of the whole file
    std::string basename;
};

/**
 * @brief First frame sent by the client
 */
struct OutboundMessage {
    std::string filename;
    DestinationSelector destination;
    uint64_t size{0};
    std::string checksum;
};

/**
 * @brief The single frame the server answers with
 */
struct ServerResponse {
    enum class Type {
        ALREADY_DOWNLOADED,
        RESUME_AT,
        ERROR
    };

    Type type{Type::ERROR};
    uint64_t existingSize{0};   // Valid for RESUME_AT
    std::string errorReason;    // Valid for ERROR

    static ServerResponse alreadyDownloaded() {
        return ServerResponse{Type::ALREADY_DOWNLOADED, 0, ""};
    }

    static ServerResponse resumeAt(uint64_t existingSize) {
        return ServerResponse{Type::RESUME_AT, existingSize, ""};
    }

    static ServerResponse error(std::string reason) {
        return ServerResponse{Type::ERROR, 0, std::move(reason)};
    }
};

struct TransferResult {
    uint64_t bytesSent{0};   // Bytes streamed by this call only
    uint64_t fileSize{0};
};

} // namespace FileCourier
