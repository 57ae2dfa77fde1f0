#pragma once

#include "Result.h"
#include <string>

namespace FileCourier {

/**
 * @brief Failure categories reported to callers of a transfer
 */
enum class TransferErrorKind {
    CONNECTION_REFUSED,
    UNKNOWN_HOST,
    HANDSHAKE_FAILURE,
    FILE_NOT_FOUND,
    PERMISSION_DENIED,
    PROTOCOL_ERROR,
    CANCELLED,
    UNKNOWN
};

/// "connection-refused", "unknown-host", ...
const char* kindToString(TransferErrorKind kind);

/**
 * @brief Caller-facing failure of a transfer
 */
struct TransferError {
    TransferErrorKind kind{TransferErrorKind::UNKNOWN};
    std::string reason;    // Server reason or internal code name; may be empty
    std::string message;   // Diagnostic detail for logs

    /// "protocol-error enoent", or just the kind when there is no reason
    std::string describe() const;
};

/**
 * @brief Folds internal errors into TransferErrors
 *
 * Every failure leaving the transfer engine passes through map().
 * Unclassified errors are logged at ERROR level before being returned.
 */
class ErrorMapper {
public:
    static TransferError map(const Error& error);

    /// Server reasons that mean the destination refused access
    static bool isPermissionReason(const std::string& reason);
};

} // namespace FileCourier
