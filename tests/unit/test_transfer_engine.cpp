#include <gtest/gtest.h>
#include "Logger.h"
#include "MockChannel.h"
#include "TestFiles.h"
#include "TransferEngine.h"
#include <unistd.h>
#include <limits>

using namespace FileCourier;
using FileCourier::testing_util::TempDir;
using FileCourier::testing_util::patternBytes;

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        content_ = patternBytes(10000);
        filePath_ = dir_.writeFile("payload.bin", content_);
    }

    void TearDown() override {
        Logger::instance().setConsoleOutput(true);
    }

    TransferRequest request(DestinationSelector destination = DestinationUuid{"obj-1"}) const {
        return TransferRequest{"files.example", 1055, filePath_, std::move(destination)};
    }

    TransferEngine engine(size_t chunkSize = 1024, std::function<bool()> cancel = nullptr) {
        TransferEngine::Options options;
        options.chunkSize = chunkSize;
        options.isCancelled = std::move(cancel);
        return TransferEngine(factory_, FileAttributeReader(), std::move(options));
    }

    OutboundMessage sentMessage() const {
        auto decoded = ProtocolCodec::decodeRequest(factory_.last->framesSent.at(0));
        EXPECT_TRUE(decoded.ok());
        return decoded.ok() ? *decoded : OutboundMessage{};
    }

    TempDir dir_;
    std::string content_;
    std::string filePath_;
    MockChannelFactory factory_;
};

TEST_F(TransferEngineTest, ResumeAtZeroStreamsWholeFile) {
    factory_.replyWith(ServerResponse::resumeAt(0));

    auto result = engine().sendFile(request());
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result->bytesSent, 10000u);
    EXPECT_EQ(result->fileSize, 10000u);
    EXPECT_EQ(factory_.last->rawBytes, content_);
}

TEST_F(TransferEngineTest, RequestCarriesAttributesAndSelector) {
    factory_.replyWith(ServerResponse::alreadyDownloaded());

    auto result = engine().sendFile(request(DestinationDirectory{"/srv/incoming"}));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(factory_.lastHost, "files.example");
    EXPECT_EQ(factory_.lastPort, 1055);

    ASSERT_EQ(factory_.last->framesSent.size(), 1u);
    OutboundMessage message = sentMessage();
    EXPECT_EQ(message.filename, "payload.bin");
    EXPECT_EQ(message.size, 10000u);
    auto expectedChecksum = FileChecksum::compute(filePath_);
    ASSERT_TRUE(expectedChecksum.ok());
    EXPECT_EQ(message.checksum, *expectedChecksum);
    ASSERT_TRUE(std::holds_alternative<DestinationDirectory>(message.destination));
    EXPECT_EQ(std::get<DestinationDirectory>(message.destination).path, "/srv/incoming");
}

TEST_F(TransferEngineTest, AlreadyDownloadedWritesNothing) {
    factory_.replyWith(ServerResponse::alreadyDownloaded());

    auto result = engine().sendFile(request());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->bytesSent, 0u);
    EXPECT_EQ(result->fileSize, 10000u);
    EXPECT_EQ(factory_.last->writeCalls, 0u);
    EXPECT_EQ(factory_.last->framesSent.size(), 1u);
}

TEST_F(TransferEngineTest, EveryOffsetStreamsExactTail) {
    for (uint64_t offset : {1ull, 1023ull, 1024ull, 1025ull, 4096ull, 9999ull}) {
        factory_.replyWith(ServerResponse::resumeAt(offset));
        auto result = engine().sendFile(request());
        ASSERT_TRUE(result.ok()) << "offset " << offset;
        EXPECT_EQ(result->bytesSent, 10000u - offset);
        EXPECT_EQ(factory_.last->rawBytes, content_.substr(offset)) << "offset " << offset;
    }
}

TEST_F(TransferEngineTest, ResumeAtFileSizeStreamsNothing) {
    factory_.replyWith(ServerResponse::resumeAt(10000));

    auto result = engine().sendFile(request());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->bytesSent, 0u);
    EXPECT_EQ(result->fileSize, 10000u);
    EXPECT_TRUE(factory_.last->rawBytes.empty());
}

TEST_F(TransferEngineTest, ResumeBeyondFileSizeIsProtocolError) {
    factory_.replyWith(ServerResponse::resumeAt(10001));

    auto result = engine().sendFile(request());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, TransferErrorKind::PROTOCOL_ERROR);
    EXPECT_EQ(factory_.last->writeCalls, 0u);
    EXPECT_EQ(factory_.last->closeCount, 1);
}

TEST_F(TransferEngineTest, ServerErrorIsReturnedWithoutStreaming) {
    factory_.replyWith(ServerResponse::error("enospc"));

    auto result = engine().sendFile(request());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, TransferErrorKind::PROTOCOL_ERROR);
    EXPECT_EQ(result.error().reason, "enospc");
    EXPECT_EQ(factory_.last->writeCalls, 0u);
    EXPECT_EQ(factory_.openCount, 1);
}

TEST_F(TransferEngineTest, ServerPermissionErrorMapsToPermissionDenied) {
    factory_.replyWith(ServerResponse::error("eacces"));

    auto result = engine().sendFile(request());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, TransferErrorKind::PERMISSION_DENIED);
}

TEST_F(TransferEngineTest, UnrecognizedAndMalformedRepliesAreDistinct) {
    factory_.replyWithBytes(TermCodec::encode(Term::tuple({Term::atom("later"), Term::integer(5)})));
    auto unrecognized = engine().sendFile(request());
    ASSERT_FALSE(unrecognized.ok());
    EXPECT_EQ(unrecognized.error().kind, TransferErrorKind::PROTOCOL_ERROR);
    EXPECT_EQ(unrecognized.error().reason, errorCodeToString(ErrorCode::UnrecognizedResponse));

    factory_.replyWithBytes({0xde, 0xad});
    auto malformed = engine().sendFile(request());
    ASSERT_FALSE(malformed.ok());
    EXPECT_EQ(malformed.error().kind, TransferErrorKind::PROTOCOL_ERROR);
    EXPECT_EQ(malformed.error().reason, errorCodeToString(ErrorCode::MalformedMessage));
}

TEST_F(TransferEngineTest, MissingFileFailsBeforeConnecting) {
    auto result = engine().sendFile(
        TransferRequest{"files.example", 1055, (dir_.path() / "gone.bin").string(), DestinationUuid{"x"}});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, TransferErrorKind::FILE_NOT_FOUND);
    EXPECT_EQ(factory_.openCount, 0);
}

TEST_F(TransferEngineTest, ConnectFailuresAreMapped) {
    factory_.failOpenWith(Error{ErrorCode::ConnectionRefused, "refused", ECONNREFUSED});
    auto refused = engine().sendFile(request());
    ASSERT_FALSE(refused.ok());
    EXPECT_EQ(refused.error().kind, TransferErrorKind::CONNECTION_REFUSED);

    factory_.failOpenWith(Error{ErrorCode::HostNotFound, "no such host"});
    auto unknownHost = engine().sendFile(request());
    ASSERT_FALSE(unknownHost.ok());
    EXPECT_EQ(unknownHost.error().kind, TransferErrorKind::UNKNOWN_HOST);

    factory_.failOpenWith(Error{ErrorCode::HandshakeFailed, "bad certificate"});
    auto handshake = engine().sendFile(request());
    ASSERT_FALSE(handshake.ok());
    EXPECT_EQ(handshake.error().kind, TransferErrorKind::HANDSHAKE_FAILURE);
}

TEST_F(TransferEngineTest, PeerClosingBeforeReplyIsUnknown) {
    factory_.replyWithError(Error{ErrorCode::ConnectionClosed, "peer closed"});

    auto result = engine().sendFile(request());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, TransferErrorKind::UNKNOWN);
    EXPECT_EQ(factory_.last->closeCount, 1);
}

TEST_F(TransferEngineTest, WriteFailureStopsStreaming) {
    factory_.replyWith(ServerResponse::resumeAt(0));
    factory_.failWritesWith(Error{ErrorCode::SendFailed, "reset", ECONNRESET});

    auto result = engine().sendFile(request());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(factory_.last->writeCalls, 1u);
    EXPECT_EQ(factory_.last->closeCount, 1);
}

TEST_F(TransferEngineTest, CancellationStopsBetweenChunks) {
    factory_.replyWith(ServerResponse::resumeAt(0));
    int polls = 0;
    auto cancelAfterThree = [&polls]() { return ++polls > 3; };

    auto result = engine(1024, cancelAfterThree).sendFile(request());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, TransferErrorKind::CANCELLED);
    EXPECT_EQ(factory_.last->rawBytes, content_.substr(0, 3 * 1024));
    EXPECT_EQ(factory_.last->closeCount, 1);
    EXPECT_TRUE(factory_.last->destroyed);
}

TEST_F(TransferEngineTest, ChannelClosedExactlyOnceOnEveryPath) {
    const std::vector<ServerResponse> responses = {
        ServerResponse::alreadyDownloaded(),
        ServerResponse::resumeAt(0),
        ServerResponse::resumeAt(5000),
        ServerResponse::resumeAt(20000),
        ServerResponse::error("einval"),
    };
    for (const auto& response : responses) {
        factory_.replyWith(response);
        auto result = engine().sendFile(request());
        (void)result;
        EXPECT_EQ(factory_.last->closeCount, 1);
        EXPECT_TRUE(factory_.last->destroyed);
        EXPECT_FALSE(factory_.last->writesAfterClose);
    }
}

TEST_F(TransferEngineTest, RepeatedCallsAreIndependent) {
    factory_.replyWith(ServerResponse::resumeAt(2500));
    auto transfer = engine();

    auto first = transfer.sendFile(request());
    auto firstBytes = factory_.last->rawBytes;
    auto second = transfer.sendFile(request());

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first->bytesSent, second->bytesSent);
    EXPECT_EQ(firstBytes, factory_.last->rawBytes);
    EXPECT_EQ(factory_.openCount, 2);
}

TEST_F(TransferEngineTest, SecondCallAfterCompletionStreamsNothing) {
    factory_.replyWith(ServerResponse::resumeAt(0));
    auto transfer = engine();

    auto first = transfer.sendFile(request());
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first->bytesSent, 10000u);
    auto firstChannel = factory_.last;

    factory_.replyWith(ServerResponse::alreadyDownloaded());
    auto second = transfer.sendFile(request());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second->bytesSent, 0u);
    EXPECT_EQ(second->fileSize, 10000u);

    ASSERT_NE(factory_.last, firstChannel);
    EXPECT_EQ(factory_.last->writeCalls, 0u);
    EXPECT_TRUE(factory_.last->rawBytes.empty());
    EXPECT_EQ(factory_.last->closeCount, 1);
    EXPECT_EQ(factory_.openCount, 2);
}

TEST_F(TransferEngineTest, OversizedChunkSizeIsClamped) {
    factory_.replyWith(ServerResponse::resumeAt(0));

    auto result = engine(std::numeric_limits<size_t>::max()).sendFile(request());
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result->bytesSent, 10000u);
    EXPECT_EQ(factory_.last->writeCalls, 1u);
    EXPECT_EQ(factory_.last->rawBytes, content_);
}

TEST_F(TransferEngineTest, EmptyFile) {
    auto emptyPath = dir_.writeFile("empty.bin", "");
    factory_.replyWith(ServerResponse::resumeAt(0));

    auto result = engine().sendFile(TransferRequest{"h", 1055, emptyPath, DestinationPath{"/x/empty.bin"}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->bytesSent, 0u);
    EXPECT_EQ(result->fileSize, 0u);
    EXPECT_EQ(sentMessage().checksum, "d41d8cd98f00b204e9800998ecf8427e");
}
