#pragma once

#include "ErrorMapper.h"
#include "FileAttributeReader.h"
#include "IChannel.h"
#include "Result.h"
#include "TransferTypes.h"
#include <cstddef>
#include <functional>

namespace FileCourier {

/**
 * @brief Runs one negotiated, resumable upload over an IChannel
 *
 * Sequence:
 *   1. Snapshot size and checksum of the local file
 *   2. Send {filename, selector, size, checksum} as one frame
 *   3. Read one response frame:
 *      - already_downloaded: done, nothing streamed
 *      - {ok, N}:            stream bytes [N, size) unframed
 *      - {error, Reason}:    fail, no retry
 *
 * The channel and file are released before sendFile() returns on every
 * path. Calls share no state; an engine may be reused sequentially.
 */
class TransferEngine {
public:
    struct Options {
        /// Larger chunk sizes are clamped to this
        static constexpr size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

        size_t chunkSize{64 * 1024};
        /// Polled before each streamed chunk; true aborts with `cancelled`
        std::function<bool()> isCancelled;
    };

    TransferEngine(IChannelFactory& channels, FileAttributeReader attributes);
    TransferEngine(IChannelFactory& channels, FileAttributeReader attributes, Options options);

    Result<TransferResult, TransferError> sendFile(const TransferRequest& request);

private:
    enum class State {
        IDLE,
        ATTRIBUTES_READ,
        MESSAGE_SENT,
        RESPONSE_RECEIVED,
        STREAMING_TAIL,
        DONE,
        FAILED
    };

    static const char* stateName(State state);

    Result<TransferResult> run(const TransferRequest& request, State& state);

    Result<uint64_t> streamTail(IChannel& channel, const std::string& filePath,
                                uint64_t offset, uint64_t fileSize);

    IChannelFactory& channels_;
    FileAttributeReader attributes_;
    Options options_;
};

} // namespace FileCourier
