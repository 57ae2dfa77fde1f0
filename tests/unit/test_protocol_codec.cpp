#include <gtest/gtest.h>
#include "ProtocolCodec.h"

using namespace FileCourier;

namespace {
    std::vector<uint8_t> bytes(std::initializer_list<int> values) {
        std::vector<uint8_t> out;
        for (int v : values) out.push_back(static_cast<uint8_t>(v));
        return out;
    }

    OutboundMessage sampleMessage(DestinationSelector destination) {
        OutboundMessage message;
        message.filename = "report.pdf";
        message.destination = std::move(destination);
        message.size = 1048576;
        message.checksum = "b10a8db164e0754105b7a99be72e3fe5";
        return message;
    }
}

TEST(ProtocolCodecTest, RequestIsOrderedProplist) {
    auto encoded = ProtocolCodec::encodeRequest(sampleMessage(DestinationUuid{"c0ffee"}));
    auto decoded = TermCodec::decode(encoded);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->describe(),
              "[{filename,\"report.pdf\"},{uuid,\"c0ffee\"},{size,1048576},"
              "{checksum,\"b10a8db164e0754105b7a99be72e3fe5\"}]");
}

TEST(ProtocolCodecTest, RequestUsesSelectorTag) {
    auto path = TermCodec::decode(ProtocolCodec::encodeRequest(sampleMessage(DestinationPath{"/srv/in/r.pdf"})));
    auto dir = TermCodec::decode(ProtocolCodec::encodeRequest(sampleMessage(DestinationDirectory{"/srv/in"})));
    ASSERT_TRUE(path.ok());
    ASSERT_TRUE(dir.ok());
    EXPECT_TRUE(path->elements[1].elements[0].isAtom("destination"));
    EXPECT_EQ(path->elements[1].elements[1].text, "/srv/in/r.pdf");
    EXPECT_TRUE(dir->elements[1].elements[0].isAtom("directory"));
}

TEST(ProtocolCodecTest, RequestDecodesOnReceivingSide) {
    auto decoded = ProtocolCodec::decodeRequest(
        ProtocolCodec::encodeRequest(sampleMessage(DestinationDirectory{"/srv/in"})));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->filename, "report.pdf");
    EXPECT_EQ(decoded->size, 1048576u);
    ASSERT_TRUE(std::holds_alternative<DestinationDirectory>(decoded->destination));
    EXPECT_EQ(std::get<DestinationDirectory>(decoded->destination).path, "/srv/in");
}

TEST(ProtocolCodecTest, RequestWithTwoSelectorsIsRejected) {
    Term term = Term::list({
        Term::tuple({Term::atom("filename"), Term::string("a")}),
        Term::tuple({Term::atom("uuid"), Term::string("1")}),
        Term::tuple({Term::atom("directory"), Term::string("/d")}),
        Term::tuple({Term::atom("size"), Term::integer(1)}),
        Term::tuple({Term::atom("checksum"), Term::string("x")}),
    });
    auto decoded = ProtocolCodec::decodeRequest(TermCodec::encode(term));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, ErrorCode::MalformedMessage);
}

TEST(ProtocolCodecTest, AlreadyDownloaded) {
    auto response = ProtocolCodec::decodeResponse(
        bytes({131, 100, 0, 18, 'a', 'l', 'r', 'e', 'a', 'd', 'y', '_',
               'd', 'o', 'w', 'n', 'l', 'o', 'a', 'd', 'e', 'd'}));
    ASSERT_TRUE(response.ok());
    EXPECT_EQ(response->type, ServerResponse::Type::ALREADY_DOWNLOADED);
}

TEST(ProtocolCodecTest, ResumeAtOffset) {
    auto response = ProtocolCodec::decodeResponse(bytes({131, 104, 2, 100, 0, 2, 'o', 'k', 98, 0, 0, 1, 144}));
    ASSERT_TRUE(response.ok());
    EXPECT_EQ(response->type, ServerResponse::Type::RESUME_AT);
    EXPECT_EQ(response->existingSize, 400u);
}

TEST(ProtocolCodecTest, ResumeAtZeroAndLargeOffsets) {
    auto zero = ProtocolCodec::decodeResponse(
        ProtocolCodec::encodeResponse(ServerResponse::resumeAt(0)));
    ASSERT_TRUE(zero.ok());
    EXPECT_EQ(zero->existingSize, 0u);

    auto large = ProtocolCodec::decodeResponse(
        ProtocolCodec::encodeResponse(ServerResponse::resumeAt(5000000000ull)));
    ASSERT_TRUE(large.ok());
    EXPECT_EQ(large->existingSize, 5000000000ull);
}

TEST(ProtocolCodecTest, ErrorReasonFromAtomStringOrBinary) {
    auto atomReason = ProtocolCodec::decodeResponse(
        TermCodec::encode(Term::tuple({Term::atom("error"), Term::atom("enospc")})));
    auto stringReason = ProtocolCodec::decodeResponse(
        TermCodec::encode(Term::tuple({Term::atom("error"), Term::string("disk full")})));
    auto binaryReason = ProtocolCodec::decodeResponse(
        TermCodec::encode(Term::tuple({Term::atom("error"), Term::binary("eacces")})));

    ASSERT_TRUE(atomReason.ok());
    ASSERT_TRUE(stringReason.ok());
    ASSERT_TRUE(binaryReason.ok());
    EXPECT_EQ(atomReason->type, ServerResponse::Type::ERROR);
    EXPECT_EQ(atomReason->errorReason, "enospc");
    EXPECT_EQ(stringReason->errorReason, "disk full");
    EXPECT_EQ(binaryReason->errorReason, "eacces");
}

TEST(ProtocolCodecTest, StructuredErrorReasonIsRendered) {
    auto response = ProtocolCodec::decodeResponse(TermCodec::encode(
        Term::tuple({Term::atom("error"), Term::tuple({Term::atom("badarg"), Term::integer(3)})})));
    ASSERT_TRUE(response.ok());
    EXPECT_EQ(response->errorReason, "{badarg,3}");
}

TEST(ProtocolCodecTest, UnexpectedShapesAreUnrecognized) {
    const std::vector<Term> shapes = {
        Term::atom("maybe"),
        Term::tuple({Term::atom("ok"), Term::negativeInteger(5)}),
        Term::tuple({Term::atom("ok"), Term::string("12")}),
        Term::tuple({Term::atom("ok"), Term::integer(1), Term::integer(2)}),
        Term::tuple({Term::atom("retry"), Term::integer(1)}),
        Term::list({Term::atom("ok")}),
    };
    for (const auto& shape : shapes) {
        auto response = ProtocolCodec::decodeResponse(TermCodec::encode(shape));
        ASSERT_FALSE(response.ok()) << shape.describe();
        EXPECT_EQ(response.error().code, ErrorCode::UnrecognizedResponse) << shape.describe();
    }
}

TEST(ProtocolCodecTest, GarbageIsMalformedNotUnrecognized) {
    auto response = ProtocolCodec::decodeResponse(bytes({'o', 'k'}));
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.error().code, ErrorCode::MalformedMessage);
}
