#include <gtest/gtest.h>
#include "FrameCodec.h"

using namespace FileCourier;

TEST(FrameCodecTest, HeaderIsBigEndian) {
    auto header = FrameCodec::encodeHeader(0x01020304u);
    EXPECT_EQ(header[0], 0x01);
    EXPECT_EQ(header[1], 0x02);
    EXPECT_EQ(header[2], 0x03);
    EXPECT_EQ(header[3], 0x04);
    EXPECT_EQ(FrameCodec::decodeHeader(header), 0x01020304u);
}

TEST(FrameCodecTest, FramePrefixesPayload) {
    std::vector<uint8_t> payload = {131, 100, 0, 2, 'o', 'k'};
    auto framed = FrameCodec::frame(payload);
    ASSERT_TRUE(framed.ok());

    std::vector<uint8_t> expected = {0, 0, 0, 6, 131, 100, 0, 2, 'o', 'k'};
    EXPECT_EQ(*framed, expected);
}

TEST(FrameCodecTest, EmptyPayload) {
    auto framed = FrameCodec::frame({});
    ASSERT_TRUE(framed.ok());
    EXPECT_EQ(*framed, std::vector<uint8_t>(4, 0));
}
