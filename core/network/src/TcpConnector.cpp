#include "TcpConnector.h"
#include "LoggerMacros.h"
#include "SystemError.h"
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <cerrno>
#include <memory>

namespace FileCourier {

namespace {
    using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;
}

Result<FdGuard> TcpConnector::connect(const std::string& host, int port) {
    if (port <= 0 || port > 65535) {
        return Error{ErrorCode::InvalidArgument, "Invalid port " + std::to_string(port)};
    }

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    std::string portStr = std::to_string(port);
    int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &raw);
    if (status != 0) {
        int sysErr = (status == EAI_SYSTEM) ? errno : 0;
        std::string message = "Failed to resolve " + host + ": " + gai_strerror(status);
        // Lookups that never produced an address are all reported as an unknown host
        if (status == EAI_NONAME || status == EAI_AGAIN || status == EAI_FAIL
#ifdef EAI_NODATA
            || status == EAI_NODATA
#endif
            ) {
            return Error{ErrorCode::HostNotFound, message, sysErr};
        }
        return Error{ErrorCode::ConnectionFailed, message, sysErr};
    }
    AddrInfoPtr addresses(raw, &freeaddrinfo);

    int lastErr = 0;
    bool allRefused = true;
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        FdGuard sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock) {
            lastErr = errno;
            allRefused = false;
            continue;
        }

        int rc;
        do {
            rc = ::connect(sock.get(), ai->ai_addr, ai->ai_addrlen);
        } while (rc < 0 && errno == EINTR);

        if (rc == 0) {
            int one = 1;
            setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            LOG_DEBUG_COMP_IF("Connected to " + host + ":" + portStr, "TcpConnector");
            return std::move(sock);
        }

        lastErr = errno;
        if (lastErr != ECONNREFUSED) {
            allRefused = false;
        }
        LOG_DEBUG_COMP_IF("Connect attempt to " + host + ":" + portStr +
                          " failed: " + errnoMessage(lastErr), "TcpConnector");
    }

    std::string message = "Failed to connect to " + host + ":" + portStr + ": " + errnoMessage(lastErr);
    if (allRefused && lastErr == ECONNREFUSED) {
        return Error{ErrorCode::ConnectionRefused, message, lastErr};
    }
    return Error{ErrorCode::ConnectionFailed, message, lastErr};
}

} // namespace FileCourier
