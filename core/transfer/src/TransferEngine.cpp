#include "TransferEngine.h"
#include "FdGuard.h"
#include "LoggerMacros.h"
#include "ProtocolCodec.h"
#include "SystemError.h"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <memory>
#include <vector>

namespace FileCourier {

namespace {
    const char* COMPONENT = "TransferEngine";

    // Closes the channel on scope exit; IChannel::close() is idempotent
    class ChannelCloser {
    public:
        explicit ChannelCloser(std::unique_ptr<IChannel> channel) : channel_(std::move(channel)) {}
        ~ChannelCloser() {
            if (channel_) channel_->close();
        }

        ChannelCloser(const ChannelCloser&) = delete;
        ChannelCloser& operator=(const ChannelCloser&) = delete;

        IChannel& operator*() const { return *channel_; }
        IChannel* operator->() const { return channel_.get(); }

    private:
        std::unique_ptr<IChannel> channel_;
    };
}

TransferEngine::TransferEngine(IChannelFactory& channels, FileAttributeReader attributes)
    : TransferEngine(channels, attributes, Options{}) {}

TransferEngine::TransferEngine(IChannelFactory& channels, FileAttributeReader attributes, Options options)
    : channels_(channels)
    , attributes_(attributes)
    , options_(std::move(options)) {
    if (options_.chunkSize == 0) {
        options_.chunkSize = 64 * 1024;
    } else if (options_.chunkSize > Options::MAX_CHUNK_SIZE) {
        options_.chunkSize = Options::MAX_CHUNK_SIZE;
    }
}

const char* TransferEngine::stateName(State state) {
    switch (state) {
        case State::IDLE: return "Idle";
        case State::ATTRIBUTES_READ: return "AttributesRead";
        case State::MESSAGE_SENT: return "MessageSent";
        case State::RESPONSE_RECEIVED: return "ResponseReceived";
        case State::STREAMING_TAIL: return "StreamingTail";
        case State::DONE: return "Done";
        case State::FAILED: return "Error";
    }
    return "Unknown";
}

Result<TransferResult, TransferError> TransferEngine::sendFile(const TransferRequest& request) {
    State state = State::IDLE;
    auto outcome = run(request, state);
    if (outcome) {
        return outcome.value();
    }

    const Error& error = outcome.error();
    TransferError mapped = ErrorMapper::map(error);
    LOG_WARN_COMP("Transfer of " + request.filepath + " to " + request.host + ":" +
                  std::to_string(request.port) + " failed in state " + stateName(state) +
                  ": " + mapped.describe() + " (" + error.message + ")", COMPONENT);
    return mapped;
}

Result<TransferResult> TransferEngine::run(const TransferRequest& request, State& state) {
    auto attrs = attributes_.read(request.filepath);
    if (!attrs) {
        return attrs.error();
    }
    state = State::ATTRIBUTES_READ;

    OutboundMessage message;
    message.filename = attrs->basename;
    message.destination = request.destination;
    message.size = attrs->size;
    message.checksum = attrs->checksum;

    auto opened = channels_.open(request.host, request.port);
    if (!opened) {
        return opened.error();
    }
    ChannelCloser channel(std::move(opened.value()));

    auto sent = channel->sendFrame(ProtocolCodec::encodeRequest(message));
    if (!sent) {
        return sent.error();
    }
    state = State::MESSAGE_SENT;
    LOG_DEBUG_COMP_IF("Sent request for " + message.filename + " (" + selectorTag(message.destination) +
                      "=" + selectorValue(message.destination) + ", size=" +
                      std::to_string(message.size) + ")", COMPONENT);

    auto frame = channel->receiveFrame();
    if (!frame) {
        return frame.error();
    }
    auto response = ProtocolCodec::decodeResponse(frame.value());
    if (!response) {
        return response.error();
    }
    state = State::RESPONSE_RECEIVED;

    TransferResult result;
    result.fileSize = attrs->size;

    switch (response->type) {
        case ServerResponse::Type::ALREADY_DOWNLOADED:
            LOG_INFO_COMP_IF(message.filename + " already present on " + request.host, COMPONENT);
            state = State::DONE;
            return result;

        case ServerResponse::Type::ERROR:
            return Error{ErrorCode::ServerRejected, response->errorReason};

        case ServerResponse::Type::RESUME_AT:
            break;
    }

    uint64_t offset = response->existingSize;
    if (offset > attrs->size) {
        return Error{ErrorCode::InvalidResumeOffset,
                     "Server holds " + std::to_string(offset) + " bytes of a " +
                     std::to_string(attrs->size) + " byte file"};
    }

    LOG_INFO_COMP_IF("Resuming " + message.filename + " at offset " + std::to_string(offset) +
                     " of " + std::to_string(attrs->size), COMPONENT);
    state = State::STREAMING_TAIL;

    auto streamed = streamTail(*channel, request.filepath, offset, attrs->size);
    if (!streamed) {
        return streamed.error();
    }

    result.bytesSent = streamed.value();
    state = State::DONE;
    LOG_INFO_COMP_IF("Sent " + std::to_string(result.bytesSent) + " bytes of " +
                     message.filename + " to " + request.host, COMPONENT);
    return result;
}

Result<uint64_t> TransferEngine::streamTail(IChannel& channel, const std::string& filePath,
                                            uint64_t offset, uint64_t fileSize) {
    FdGuard file(::open(filePath.c_str(), O_RDONLY | O_CLOEXEC));
    if (!file) {
        return fileError(errno, "Cannot open", filePath);
    }
    if (::lseek(file.get(), static_cast<off_t>(offset), SEEK_SET) < 0) {
        return fileError(errno, "Cannot seek", filePath);
    }

    std::vector<uint8_t> buffer(options_.chunkSize);
    uint64_t sent = 0;
    while (true) {
        if (options_.isCancelled && options_.isCancelled()) {
            return Error{ErrorCode::Cancelled,
                         "Cancelled after " + std::to_string(sent) + " of " +
                         std::to_string(fileSize - offset) + " bytes"};
        }

        ssize_t n = ::read(file.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return fileError(errno, "Cannot read", filePath);
        }
        if (n == 0) {
            break;
        }

        auto written = channel.writeAll(buffer.data(), static_cast<size_t>(n));
        if (!written) {
            return written.error();
        }
        sent += static_cast<uint64_t>(n);
    }
    return sent;
}

} // namespace FileCourier
