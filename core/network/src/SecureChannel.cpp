#include "SecureChannel.h"
#include "FrameCodec.h"
#include "LoggerMacros.h"
#include "TcpConnector.h"

namespace FileCourier {

SecureChannel::SecureChannel(FdGuard socket, TLSConnection connection, size_t maxFrameSize)
    : socket_(std::move(socket))
    , tls_(std::move(connection))
    , maxFrameSize_(maxFrameSize) {}

SecureChannel::~SecureChannel() {
    close();
}

Result<void> SecureChannel::sendFrame(const std::vector<uint8_t>& payload) {
    auto framed = FrameCodec::frame(payload);
    if (!framed) {
        return framed.error();
    }
    const auto& bytes = framed.value();
    return writeAll(bytes.data(), bytes.size());
}

Result<std::vector<uint8_t>> SecureChannel::receiveFrame() {
    std::array<uint8_t, FrameCodec::HEADER_SIZE> header{};
    auto headerRead = readExact(header.data(), header.size());
    if (!headerRead) {
        return headerRead.error();
    }

    uint32_t length = FrameCodec::decodeHeader(header);
    if (length > maxFrameSize_) {
        return Error{ErrorCode::FrameTooLarge,
                     "Incoming frame of " + std::to_string(length) +
                     " bytes exceeds limit of " + std::to_string(maxFrameSize_)};
    }

    std::vector<uint8_t> payload(length);
    if (length > 0) {
        auto bodyRead = readExact(payload.data(), payload.size());
        if (!bodyRead) {
            return bodyRead.error();
        }
    }
    LOG_DEBUG_COMP_IF("Received frame of " + std::to_string(length) + " bytes", "SecureChannel");
    return payload;
}

Result<void> SecureChannel::writeAll(const uint8_t* data, size_t length) {
    if (!tls_.isValid()) {
        return Error{ErrorCode::SendFailed, "Channel is closed"};
    }

    size_t written = 0;
    while (written < length) {
        ssize_t n = tls_.write(data + written, length - written);
        if (n <= 0) {
            return Error{ErrorCode::SendFailed, tls_.getLastError()};
        }
        written += static_cast<size_t>(n);
    }
    return Ok();
}

Result<void> SecureChannel::readExact(uint8_t* buffer, size_t length) {
    if (!tls_.isValid()) {
        return Error{ErrorCode::ReceiveFailed, "Channel is closed"};
    }

    size_t received = 0;
    while (received < length) {
        ssize_t n = tls_.read(buffer + received, length - received);
        if (n == 0) {
            return Error{ErrorCode::ConnectionClosed,
                         "Peer closed after " + std::to_string(received) + " of " +
                         std::to_string(length) + " bytes"};
        }
        if (n < 0) {
            return Error{ErrorCode::ReceiveFailed, tls_.getLastError()};
        }
        received += static_cast<size_t>(n);
    }
    return Ok();
}

void SecureChannel::close() {
    if (tls_.isValid()) {
        tls_.close();
        LOG_DEBUG_COMP_IF("Channel closed", "SecureChannel");
    }
    socket_.reset();
}

Result<std::unique_ptr<SecureChannel>> SecureChannel::connect(TLSContext& context,
                                                              const std::string& host, int port,
                                                              size_t maxFrameSize,
                                                              const std::string& serverName) {
    auto socket = TcpConnector::connect(host, port);
    if (!socket) {
        return socket.error();
    }

    const std::string& peerName = serverName.empty() ? host : serverName;
    TLSConnection tls(context.wrapSocket(socket->get(), peerName));
    if (!tls.isValid()) {
        return Error{ErrorCode::TlsInitFailed, context.getLastError()};
    }

    if (!context.performHandshake(tls.get())) {
        return Error{ErrorCode::HandshakeFailed,
                     "TLS handshake with " + host + ":" + std::to_string(port) +
                     " failed: " + context.getLastError()};
    }

    LOG_INFO_COMP_IF("Secure channel to " + host + ":" + std::to_string(port) + " established (" +
                     tls.getProtocolVersion() + ", " + tls.getCipherSuite() + ")", "SecureChannel");

    return std::make_unique<SecureChannel>(std::move(*socket), std::move(tls), maxFrameSize);
}

SecureChannelFactory::SecureChannelFactory(std::shared_ptr<TLSContext> context,
                                           size_t maxFrameSize,
                                           std::string serverName)
    : context_(std::move(context))
    , maxFrameSize_(maxFrameSize)
    , serverName_(std::move(serverName)) {}

Result<std::unique_ptr<IChannel>> SecureChannelFactory::open(const std::string& host, int port) {
    if (!context_) {
        return Error{ErrorCode::TlsInitFailed, "No TLS context configured"};
    }
    auto channel = SecureChannel::connect(*context_, host, port, maxFrameSize_, serverName_);
    if (!channel) {
        return channel.error();
    }
    return std::unique_ptr<IChannel>(std::move(channel.value()));
}

} // namespace FileCourier
