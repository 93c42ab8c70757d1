/**
 * frame_channel_test.cpp - FrameChannel over real pipes
 *
 * Tests:
 * - Round trip of small, empty and multi-megabyte frames
 * - Header and payload delivered in dribbles (short reads)
 * - EOF before and inside a frame
 * - Read deadline, oversize frames, writes to a closed peer
 */

#include "ipc/frame_channel.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

using namespace statforge::ipc;

namespace {

// Two channels joined back to back: a <-> b
struct ChannelPair {
    FrameChannel a;
    FrameChannel b;
};

ChannelPair make_channel_pair() {
    int a_to_b[2];
    int b_to_a[2];
    EXPECT_EQ(pipe(a_to_b), 0);
    EXPECT_EQ(pipe(b_to_a), 0);
    ChannelPair pair;
    pair.a = FrameChannel(b_to_a[0], a_to_b[1]);
    pair.b = FrameChannel(a_to_b[0], b_to_a[1]);
    return pair;
}

std::vector<uint8_t> header(uint64_t len) {
    std::vector<uint8_t> bytes(kFrameHeaderSize);
    for (size_t i = 0; i < kFrameHeaderSize; ++i) {
        bytes[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
    }
    return bytes;
}

void write_all(int fd, const std::vector<uint8_t> &bytes) {
    size_t total = 0;
    while (total < bytes.size()) {
        ssize_t w = ::write(fd, bytes.data() + total, bytes.size() - total);
        ASSERT_GT(w, 0);
        total += static_cast<size_t>(w);
    }
}

}  // namespace

TEST(FrameChannelTest, RoundTripBothDirections) {
    auto pair = make_channel_pair();

    ASSERT_TRUE(pair.a.write_frame(Frame::from_text("\"Status\""))) << pair.a.last_error();
    Frame received;
    ASSERT_TRUE(pair.b.read_frame(received)) << pair.b.last_error();
    EXPECT_EQ(received.text(), "\"Status\"");

    ASSERT_TRUE(pair.b.write_frame(Frame::from_text("{\"Success\":true}")));
    ASSERT_TRUE(pair.a.read_frame(received));
    EXPECT_EQ(received.text(), "{\"Success\":true}");
}

TEST(FrameChannelTest, HeaderIsLittleEndianU64) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    FrameChannel writer(-1, fds[1]);

    ASSERT_TRUE(writer.write_frame(Frame::from_text("abc")));

    uint8_t raw[kFrameHeaderSize + 3];
    ASSERT_EQ(::read(fds[0], raw, sizeof(raw)), static_cast<ssize_t>(sizeof(raw)));
    EXPECT_EQ(raw[0], 3);
    for (size_t i = 1; i < kFrameHeaderSize; ++i) {
        EXPECT_EQ(raw[i], 0) << "byte " << i;
    }
    EXPECT_EQ(raw[8], 'a');
    ::close(fds[0]);
}

TEST(FrameChannelTest, EmptyFrame) {
    auto pair = make_channel_pair();
    ASSERT_TRUE(pair.a.write_frame(Frame()));
    Frame received = Frame::from_text("stale");
    ASSERT_TRUE(pair.b.read_frame(received));
    EXPECT_EQ(received.size(), 0u);
}

TEST(FrameChannelTest, LargeFrameWithConcurrentReader) {
    auto pair = make_channel_pair();
    Frame big;
    big.payload.resize(3 * 1024 * 1024);
    for (size_t i = 0; i < big.payload.size(); ++i) {
        big.payload[i] = static_cast<uint8_t>(i * 31);
    }

    std::thread writer([&]() { EXPECT_TRUE(pair.a.write_frame(big)) << pair.a.last_error(); });
    Frame received;
    ASSERT_TRUE(pair.b.read_frame(received, 5000)) << pair.b.last_error();
    writer.join();
    EXPECT_EQ(received.payload, big.payload);
}

TEST(FrameChannelTest, ShortReadsAreReassembled) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    FrameChannel reader(fds[0], -1);

    std::vector<uint8_t> bytes = header(5);
    for (char c : std::string("hello")) {
        bytes.push_back(static_cast<uint8_t>(c));
    }

    std::thread dribble([&]() {
        for (uint8_t byte : bytes) {
            write_all(fds[1], {byte});
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });

    Frame received;
    ASSERT_TRUE(reader.read_frame(received, 5000)) << reader.last_error();
    dribble.join();
    EXPECT_EQ(received.text(), "hello");
    ::close(fds[1]);
}

TEST(FrameChannelTest, EofBeforeLength) {
    auto pair = make_channel_pair();
    pair.a.close_write();

    Frame received;
    EXPECT_FALSE(pair.b.read_frame(received));
    EXPECT_FALSE(pair.b.timed_out());
    EXPECT_NE(pair.b.last_error().find("EOF reading frame length"), std::string::npos) << pair.b.last_error();
}

TEST(FrameChannelTest, EofInsidePayload) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    FrameChannel reader(fds[0], -1);

    std::vector<uint8_t> bytes = header(10);
    bytes.push_back('x');
    write_all(fds[1], bytes);
    ::close(fds[1]);

    Frame received;
    EXPECT_FALSE(reader.read_frame(received));
    EXPECT_NE(reader.last_error().find("EOF reading frame payload"), std::string::npos) << reader.last_error();
}

TEST(FrameChannelTest, ReadTimeout) {
    auto pair = make_channel_pair();

    auto start = std::chrono::steady_clock::now();
    Frame received;
    EXPECT_FALSE(pair.b.read_frame(received, 100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(pair.b.timed_out());
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 90);
}

TEST(FrameChannelTest, TimeoutCoversTheWholeFrame) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    FrameChannel reader(fds[0], -1);

    // Header arrives, payload never does
    write_all(fds[1], header(4));

    Frame received;
    EXPECT_FALSE(reader.read_frame(received, 100));
    EXPECT_TRUE(reader.timed_out());
    ::close(fds[1]);
}

TEST(FrameChannelTest, RejectsOversizedFrameOnRead) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    FrameChannel reader(fds[0], -1);
    reader.set_max_frame_size(1024);

    write_all(fds[1], header(1025));

    Frame received;
    EXPECT_FALSE(reader.read_frame(received));
    EXPECT_NE(reader.last_error().find("too large"), std::string::npos);
    ::close(fds[1]);
}

TEST(FrameChannelTest, RejectsOversizedFrameOnWrite) {
    auto pair = make_channel_pair();
    pair.a.set_max_frame_size(4);
    EXPECT_FALSE(pair.a.write_frame(Frame::from_text("12345")));
    EXPECT_NE(pair.a.last_error().find("too large"), std::string::npos);
}

TEST(FrameChannelTest, WriteToClosedPeerFails) {
    std::signal(SIGPIPE, SIG_IGN);

    auto pair = make_channel_pair();
    pair.b.close_read();

    EXPECT_FALSE(pair.a.write_frame(Frame::from_text("\"Status\"")));
    EXPECT_FALSE(pair.a.last_error().empty());
}

TEST(FrameChannelTest, ClosedChannelReportsMissingEnds) {
    auto pair = make_channel_pair();
    pair.a.close();
    EXPECT_FALSE(pair.a.can_read());
    EXPECT_FALSE(pair.a.can_write());

    Frame frame;
    EXPECT_FALSE(pair.a.read_frame(frame));
    EXPECT_FALSE(pair.a.write_frame(frame));
}

TEST(FrameChannelTest, MoveTransfersOwnership) {
    auto pair = make_channel_pair();
    FrameChannel moved(std::move(pair.a));
    EXPECT_FALSE(pair.a.can_write());
    ASSERT_TRUE(moved.write_frame(Frame::from_text("x")));

    Frame received;
    ASSERT_TRUE(pair.b.read_frame(received, 1000));
    EXPECT_EQ(received.text(), "x");
}
