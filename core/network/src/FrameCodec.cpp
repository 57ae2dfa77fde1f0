#include "FrameCodec.h"
#include <arpa/inet.h>
#include <cstring>
#include <string>

namespace FileCourier {

std::array<uint8_t, FrameCodec::HEADER_SIZE> FrameCodec::encodeHeader(uint32_t payloadLength) {
    std::array<uint8_t, HEADER_SIZE> header{};
    uint32_t net = htonl(payloadLength);
    memcpy(header.data(), &net, sizeof(net));
    return header;
}

uint32_t FrameCodec::decodeHeader(const std::array<uint8_t, HEADER_SIZE>& header) {
    uint32_t net;
    memcpy(&net, header.data(), sizeof(net));
    return ntohl(net);
}

Result<std::vector<uint8_t>> FrameCodec::frame(const std::vector<uint8_t>& payload) {
    if (payload.size() > MAX_PAYLOAD) {
        return Error{ErrorCode::FrameTooLarge,
                     "Payload of " + std::to_string(payload.size()) + " bytes exceeds frame limit"};
    }
    auto header = encodeHeader(static_cast<uint32_t>(payload.size()));
    std::vector<uint8_t> framed;
    framed.reserve(HEADER_SIZE + payload.size());
    framed.insert(framed.end(), header.begin(), header.end());
    framed.insert(framed.end(), payload.begin(), payload.end());
    return framed;
}

} // namespace FileCourier
