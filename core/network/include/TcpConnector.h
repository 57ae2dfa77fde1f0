#pragma once

#include "FdGuard.h"
#include "Result.h"
#include <string>

namespace FileCourier {

/**
 * @brief Blocking TCP connect over every address a host resolves to
 */
class TcpConnector {
public:
    /**
     * @brief Resolve host and connect to the first address that accepts
     * @return Connected socket, or HostNotFound / ConnectionRefused /
     *         ConnectionFailed (errno kept in sysError)
     */
    static Result<FdGuard> connect(const std::string& host, int port);
};

} // namespace FileCourier
