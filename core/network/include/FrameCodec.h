#pragma once

#include "Result.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace FileCourier {

/**
 * @brief 4-byte big-endian length prefix framing
 */
class FrameCodec {
public:
    static constexpr size_t HEADER_SIZE = 4;
    static constexpr size_t MAX_PAYLOAD = 0xFFFFFFFFu;

    static std::array<uint8_t, HEADER_SIZE> encodeHeader(uint32_t payloadLength);

    static uint32_t decodeHeader(const std::array<uint8_t, HEADER_SIZE>& header);

    /**
     * @brief Header followed by payload, ready for a single write
     * @return FrameTooLarge if the payload does not fit the 32-bit length field
     */
    static Result<std::vector<uint8_t>> frame(const std::vector<uint8_t>& payload);
};

} // namespace FileCourier
