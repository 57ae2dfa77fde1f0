#pragma once

/**
 * @file Result.h
 * @brief Error handling types for FileCourier
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Every step of the transfer path returns one of these instead of throwing.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace FileCourier {

/**
 * @brief Internal error codes raised by FileCourier components
 *
 * These never reach callers of Courier::sendFile directly; ErrorMapper
 * folds them into a TransferErrorKind first.
 */
enum class ErrorCode {
    Success = 0,

    // Network errors (100-199)
    NetworkError = 100,
    ConnectionFailed = 101,
    ConnectionRefused = 102,
    HostNotFound = 103,
    HandshakeFailed = 104,
    SendFailed = 105,
    ReceiveFailed = 106,
    ConnectionClosed = 107,

    // File system errors (200-299)
    FileNotFound = 200,
    FileAccessDenied = 201,
    FileReadError = 202,
    NotRegularFile = 203,
    ChecksumFailed = 204,

    // Protocol errors (300-399)
    MalformedMessage = 300,
    UnrecognizedResponse = 301,
    FrameTooLarge = 302,
    InvalidResumeOffset = 303,
    ServerRejected = 304,

    // TLS setup errors (400-499)
    TlsInitFailed = 400,
    CertificateLoadFailed = 401,

    // Configuration errors (600-699)
    ConfigError = 600,
    InvalidConfig = 601,
    MissingConfig = 602,

    // General errors (900-999)
    InvalidArgument = 900,
    Cancelled = 901,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionRefused: return "Connection refused";
        case ErrorCode::HostNotFound: return "Host not found";
        case ErrorCode::HandshakeFailed: return "Handshake failed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::ConnectionClosed: return "Connection closed by peer";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileAccessDenied: return "File access denied";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::NotRegularFile: return "Not a regular file";
        case ErrorCode::ChecksumFailed: return "Checksum computation failed";
        case ErrorCode::MalformedMessage: return "Malformed message";
        case ErrorCode::UnrecognizedResponse: return "Unrecognized response";
        case ErrorCode::FrameTooLarge: return "Frame too large";
        case ErrorCode::InvalidResumeOffset: return "Invalid resume offset";
        case ErrorCode::ServerRejected: return "Server rejected transfer";
        case ErrorCode::TlsInitFailed: return "TLS initialization failed";
        case ErrorCode::CertificateLoadFailed: return "Certificate load failed";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::MissingConfig: return "Missing configuration";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Error type with code, message and the originating errno (if any)
 */
struct Error {
    ErrorCode code;
    std::string message;
    int sysError{0};

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg, int err = 0)
        : code(c), message(std::move(msg)), sysError(err) {}

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<uint64_t> sizeOf(const std::string& path) {
 *     struct stat st;
 *     if (::stat(path.c_str(), &st) != 0) return Error{ErrorCode::FileNotFound, path, errno};
 *     return static_cast<uint64_t>(st.st_size);
 * }
 *
 * auto size = sizeOf("data.bin");
 * if (size) {
 *     std::cout << "Size: " << *size << std::endl;
 * } else {
 *     std::cout << "Error: " << size.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws std::bad_variant_access if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    /// Get error (throws std::bad_variant_access if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    /// Arrow operator (access value members)
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message and optional errno
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message, int sysError = 0) {
    return Result<T>(Error{code, std::move(message), sysError});
}

} // namespace FileCourier
