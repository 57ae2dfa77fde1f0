#pragma once

#include "Result.h"
#include "TermCodec.h"
#include "TransferTypes.h"
#include <cstdint>
#include <vector>

namespace FileCourier {

/**
 * @brief Maps transfer messages onto external-format terms
 *
 * Request (field order fixed):
 *   [{filename, "name"}, {destination|uuid|directory, "value"}, {size, N}, {checksum, "hex"}]
 *
 * Response:
 *   already_downloaded | {ok, ExistingSize} | {error, Reason}
 */
class ProtocolCodec {
public:
    static std::vector<uint8_t> encodeRequest(const OutboundMessage& message);

    /**
     * @brief Decode the server's single reply
     * @return MalformedMessage if the bytes are not a term,
     *         UnrecognizedResponse if the term has an unexpected shape
     */
    static Result<ServerResponse> decodeResponse(const std::vector<uint8_t>& payload);

    // Receiving-side halves of the exchange, used by loopback test servers

    static std::vector<uint8_t> encodeResponse(const ServerResponse& response);

    /// @return MalformedMessage unless exactly one destination selector is present
    static Result<OutboundMessage> decodeRequest(const std::vector<uint8_t>& payload);
};

} // namespace FileCourier
