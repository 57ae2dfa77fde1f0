#pragma once

#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace FileCourier {

/**
 * @brief Bidirectional message channel to the receiving service
 *
 * Carries length-prefixed frames for negotiation and unframed bytes for
 * the file tail. Implementations release their connection on close()
 * and on destruction.
 */
class IChannel {
public:
    virtual ~IChannel() = default;

    /**
     * @brief Send one framed message
     */
    virtual Result<void> sendFrame(const std::vector<uint8_t>& payload) = 0;

    /**
     * @brief Block until exactly one framed message has arrived
     * @return Payload, or ConnectionClosed / FrameTooLarge / ReceiveFailed
     */
    virtual Result<std::vector<uint8_t>> receiveFrame() = 0;

    /**
     * @brief Write raw bytes with no framing
     */
    virtual Result<void> writeAll(const uint8_t* data, size_t length) = 0;

    /**
     * @brief Close the connection; safe to call more than once
     */
    virtual void close() = 0;
};

/**
 * @brief Opens channels; lets the transfer engine run over test doubles
 */
class IChannelFactory {
public:
    virtual ~IChannelFactory() = default;

    virtual Result<std::unique_ptr<IChannel>> open(const std::string& host, int port) = 0;
};

} // namespace FileCourier
