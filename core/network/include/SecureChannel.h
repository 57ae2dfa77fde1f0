#pragma once

#include "FdGuard.h"
#include "IChannel.h"
#include "TLSContext.h"
#include <memory>

namespace FileCourier {

/**
 * @brief IChannel over a TLS client connection
 *
 * Frames are a 4-byte big-endian length followed by the payload.
 */
class SecureChannel : public IChannel {
public:
    static constexpr size_t DEFAULT_MAX_FRAME_SIZE = 1024 * 1024;

    SecureChannel(FdGuard socket, TLSConnection connection,
                  size_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE);
    ~SecureChannel() override;

    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;

    Result<void> sendFrame(const std::vector<uint8_t>& payload) override;
    Result<std::vector<uint8_t>> receiveFrame() override;
    Result<void> writeAll(const uint8_t* data, size_t length) override;
    void close() override;

    /**
     * @brief Connect, then run the TLS client handshake
     * @param context Initialized client context
     * @param serverName Name for SNI and certificate checks; defaults to host
     */
    static Result<std::unique_ptr<SecureChannel>> connect(TLSContext& context,
                                                          const std::string& host, int port,
                                                          size_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE,
                                                          const std::string& serverName = "");

private:
    Result<void> readExact(uint8_t* buffer, size_t length);

    // Declared before tls_ so the SSL session is torn down first
    FdGuard socket_;
    TLSConnection tls_;
    size_t maxFrameSize_;
};

/**
 * @brief Produces SecureChannels sharing one TLS client context
 */
class SecureChannelFactory : public IChannelFactory {
public:
    SecureChannelFactory(std::shared_ptr<TLSContext> context,
                         size_t maxFrameSize = SecureChannel::DEFAULT_MAX_FRAME_SIZE,
                         std::string serverName = "");

    Result<std::unique_ptr<IChannel>> open(const std::string& host, int port) override;

private:
    std::shared_ptr<TLSContext> context_;
    size_t maxFrameSize_;
    std::string serverName_;
};

} // namespace FileCourier
