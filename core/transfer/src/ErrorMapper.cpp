#include "ErrorMapper.h"
#include "LoggerMacros.h"
#include <cerrno>

namespace FileCourier {

const char* kindToString(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::CONNECTION_REFUSED: return "connection-refused";
        case TransferErrorKind::UNKNOWN_HOST: return "unknown-host";
        case TransferErrorKind::HANDSHAKE_FAILURE: return "handshake-failure";
        case TransferErrorKind::FILE_NOT_FOUND: return "file-not-found";
        case TransferErrorKind::PERMISSION_DENIED: return "permission-denied";
        case TransferErrorKind::PROTOCOL_ERROR: return "protocol-error";
        case TransferErrorKind::CANCELLED: return "cancelled";
        case TransferErrorKind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string TransferError::describe() const {
    std::string text = kindToString(kind);
    if (!reason.empty()) {
        text += " " + reason;
    }
    return text;
}

bool ErrorMapper::isPermissionReason(const std::string& reason) {
    return reason == "eacces" || reason == "eperm" ||
           reason == "permission_denied" || reason == "permission-denied";
}

TransferError ErrorMapper::map(const Error& error) {
    TransferError result;
    result.message = error.message;

    switch (error.code) {
        case ErrorCode::ConnectionRefused:
            result.kind = TransferErrorKind::CONNECTION_REFUSED;
            return result;
        case ErrorCode::HostNotFound:
            result.kind = TransferErrorKind::UNKNOWN_HOST;
            return result;
        case ErrorCode::HandshakeFailed:
            result.kind = TransferErrorKind::HANDSHAKE_FAILURE;
            return result;
        case ErrorCode::FileNotFound:
            result.kind = TransferErrorKind::FILE_NOT_FOUND;
            return result;
        case ErrorCode::FileAccessDenied:
            result.kind = TransferErrorKind::PERMISSION_DENIED;
            return result;
        case ErrorCode::ServerRejected:
            // The engine stores the server's reason verbatim as the message
            result.reason = error.message;
            result.kind = isPermissionReason(error.message)
                ? TransferErrorKind::PERMISSION_DENIED
                : TransferErrorKind::PROTOCOL_ERROR;
            return result;
        case ErrorCode::UnrecognizedResponse:
        case ErrorCode::MalformedMessage:
        case ErrorCode::InvalidResumeOffset:
        case ErrorCode::FrameTooLarge:
            result.kind = TransferErrorKind::PROTOCOL_ERROR;
            result.reason = errorCodeToString(error.code);
            return result;
        case ErrorCode::Cancelled:
            result.kind = TransferErrorKind::CANCELLED;
            return result;
        default:
            break;
    }

    switch (error.sysError) {
        case ECONNREFUSED:
            result.kind = TransferErrorKind::CONNECTION_REFUSED;
            return result;
        case ENOENT:
            result.kind = TransferErrorKind::FILE_NOT_FOUND;
            return result;
        case EACCES:
        case EPERM:
            result.kind = TransferErrorKind::PERMISSION_DENIED;
            return result;
        default:
            break;
    }

    result.kind = TransferErrorKind::UNKNOWN;
    LOG_ERROR_COMP(std::string("Unclassified transfer failure (") + errorCodeToString(error.code) +
                   "): " + error.message, "ErrorMapper");
    return result;
}

} // namespace FileCourier
