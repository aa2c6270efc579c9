#include "runtime_protocol.hh"

#include <cstring>
#include <evalbox/file_contents.hh>
#include <evalbox/pipe.hh>
#include <future>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace sr = evalbox::communication::session_runtime;

// NOLINTNEXTLINE
TEST(runtime_protocol, frames_keep_type_and_body) {
    auto sp = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    ASSERT_TRUE(sp.has_value());
    ASSERT_TRUE(sr::write_frame(sp->our_end, sr::FrameType::STDOUT, "hello"));
    ASSERT_TRUE(sr::write_frame(sp->our_end, sr::FrameType::OK, ""));

    auto frame = sr::read_frame(sp->other_end);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->type, sr::FrameType::STDOUT);
    EXPECT_EQ(frame->body, "hello");
    frame = sr::read_frame(sp->other_end);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->type, sr::FrameType::OK);
    EXPECT_EQ(frame->body, "");
}

// NOLINTNEXTLINE
TEST(runtime_protocol, big_frame) {
    auto sp = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    ASSERT_TRUE(sp.has_value());
    std::string body(3 << 20, 'x');
    // The socket buffer is smaller than the frame, so reading has to happen concurrently
    auto writer = std::async(std::launch::async, [&] {
        return sr::write_frame(sp->our_end, sr::FrameType::EVALUATE, body);
    });
    auto frame = sr::read_frame(sp->other_end);
    ASSERT_TRUE(writer.get());
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->type, sr::FrameType::EVALUATE);
    EXPECT_EQ(frame->body, body);
}

// NOLINTNEXTLINE
TEST(runtime_protocol, eof) {
    auto sp = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    ASSERT_TRUE(sp.has_value());
    ASSERT_EQ(sp->our_end.close(), 0);
    EXPECT_FALSE(sr::read_frame(sp->other_end).has_value());
}

// NOLINTNEXTLINE
TEST(runtime_protocol, truncated_frame_is_eof) {
    auto sp = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    ASSERT_TRUE(sp.has_value());
    char header[9] = {static_cast<char>(sr::FrameType::OK)};
    uint64_t len = 10;
    std::memcpy(header + 1, &len, sizeof(len));
    ASSERT_EQ(write_all(sp->our_end, header, sizeof(header)), sizeof(header));
    ASSERT_EQ(write_all(sp->our_end, "abc"), 3U);
    ASSERT_EQ(sp->our_end.close(), 0);
    EXPECT_FALSE(sr::read_frame(sp->other_end).has_value());
}

// NOLINTNEXTLINE
TEST(runtime_protocol, oversized_frame) {
    auto sp = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    ASSERT_TRUE(sp.has_value());
    char header[9] = {static_cast<char>(sr::FrameType::OK)};
    uint64_t len = uint64_t{1} << 40;
    std::memcpy(header + 1, &len, sizeof(len));
    ASSERT_EQ(write_all(sp->our_end, header, sizeof(header)), sizeof(header));
    EXPECT_THAT(
        [&] { (void)sr::read_frame(sp->other_end); },
        testing::ThrowsMessage<std::runtime_error>(testing::StartsWith("frame body is too big"))
    );
}

// NOLINTNEXTLINE
TEST(runtime_protocol, writing_to_closed_peer_fails_without_sigpipe) {
    auto sp = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    ASSERT_TRUE(sp.has_value());
    ASSERT_EQ(sp->other_end.close(), 0);
    EXPECT_FALSE(sr::write_frame(sp->our_end, sr::FrameType::STDERR, "lost"));
    EXPECT_EQ(errno, EPIPE);
}
