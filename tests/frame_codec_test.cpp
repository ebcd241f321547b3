/**
 * @file frame_codec_test.cpp
 * @brief Length-prefixed framing over a local socket pair
 */

#include "peerrelay/FrameCodec.h"
#include "peerrelay/MessageChannel.h"
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <sys/socket.h>

using namespace PeerRelay;

class FrameCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2] = {-1, -1};
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        left = std::make_shared<PlainSocketStream>(fds[0]);
        right = std::make_shared<PlainSocketStream>(fds[1]);
    }

    std::shared_ptr<PlainSocketStream> left;
    std::shared_ptr<PlainSocketStream> right;
};

TEST_F(FrameCodecTest, FramesArriveInOrder) {
    std::string err;
    ASSERT_TRUE(writeFrame(*left, R"({"type":"ping"})", err)) << err;
    ASSERT_TRUE(writeFrame(*left, "", err)) << err;
    ASSERT_TRUE(writeFrame(*left, std::string(10000, 'x'), err)) << err;

    std::string payload;
    ASSERT_TRUE(readFrame(*right, payload, MAX_FRAME_BYTES_DEFAULT, err)) << err;
    EXPECT_EQ(payload, R"({"type":"ping"})");
    ASSERT_TRUE(readFrame(*right, payload, MAX_FRAME_BYTES_DEFAULT, err)) << err;
    EXPECT_TRUE(payload.empty());
    ASSERT_TRUE(readFrame(*right, payload, MAX_FRAME_BYTES_DEFAULT, err)) << err;
    EXPECT_EQ(payload.size(), 10000u);
}

TEST_F(FrameCodecTest, LengthPrefixIsBigEndian) {
    std::string err;
    ASSERT_TRUE(writeFrame(*left, "abc", err));

    uint8_t raw[7] = {};
    ASSERT_TRUE(right->recvExact(raw, sizeof(raw), err)) << err;
    EXPECT_EQ(raw[0], 0);
    EXPECT_EQ(raw[1], 0);
    EXPECT_EQ(raw[2], 0);
    EXPECT_EQ(raw[3], 3);
    EXPECT_EQ(raw[4], 'a');
}

TEST_F(FrameCodecTest, OversizedFrameIsRejectedBeforeBody) {
    std::string err;
    ASSERT_TRUE(writeFrame(*left, std::string(2048, 'y'), err));

    std::string payload;
    EXPECT_FALSE(readFrame(*right, payload, 1024, err));
    EXPECT_NE(err.find("exceeds"), std::string::npos);
}

TEST_F(FrameCodecTest, PeerCloseEndsRead) {
    left.reset();

    std::string payload;
    std::string err;
    EXPECT_FALSE(readFrame(*right, payload, MAX_FRAME_BYTES_DEFAULT, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(FrameCodecTest, TruncatedFrameFails) {
    const uint8_t partial[] = {0, 0, 0, 10, 'a', 'b'};
    std::string err;
    ASSERT_TRUE(left->sendExact(partial, sizeof(partial), err));
    left.reset();

    std::string payload;
    EXPECT_FALSE(readFrame(*right, payload, MAX_FRAME_BYTES_DEFAULT, err));
}

TEST_F(FrameCodecTest, ChannelWritesFramesAndFailsAfterClose) {
    StreamMessageChannel channel(left);
    EXPECT_TRUE(channel.send(R"({"type":"pong"})"));

    std::string payload;
    std::string err;
    ASSERT_TRUE(readFrame(*right, payload, MAX_FRAME_BYTES_DEFAULT, err)) << err;
    EXPECT_EQ(payload, R"({"type":"pong"})");

    channel.close();
    EXPECT_FALSE(channel.send(R"({"type":"pong"})"));
}
