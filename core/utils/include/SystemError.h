#pragma once

#include "Result.h"
#include <cerrno>
#include <cstring>
#include <string>

namespace FileCourier {

inline std::string errnoMessage(int err) {
    return std::string(std::strerror(err));
}

/**
 * @brief Classify an errno raised while opening or reading a local file
 */
inline Error fileError(int err, const std::string& action, const std::string& path) {
    std::string message = action + " '" + path + "': " + errnoMessage(err);
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return Error{ErrorCode::FileNotFound, message, err};
        case EACCES:
        case EPERM:
            return Error{ErrorCode::FileAccessDenied, message, err};
        case EISDIR:
            return Error{ErrorCode::NotRegularFile, message, err};
        default:
            return Error{ErrorCode::FileReadError, message, err};
    }
}

} // namespace FileCourier
