#include <chrono>
#include <evalbox/output_capture.hh>
#include <future>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using evalbox::OutputCapture;

// NOLINTNEXTLINE
TEST(output_capture, default_capacity) { ASSERT_EQ(OutputCapture{}.capacity(), size_t{64} << 10); }

// NOLINTNEXTLINE
TEST(output_capture, zero_capacity) {
    ASSERT_THAT(
        [] { OutputCapture oc{0}; },
        testing::ThrowsMessage<std::runtime_error>(
            testing::StartsWith("output capture capacity has to be positive")
        )
    );
}

// NOLINTNEXTLINE
TEST(output_capture, drain_returns_and_clears) {
    OutputCapture oc{16};
    ASSERT_EQ(oc.drain(), "");
    ASSERT_TRUE(oc.write("abc"));
    ASSERT_TRUE(oc.write("def"));
    ASSERT_EQ(oc.size(), 6U);
    ASSERT_EQ(oc.drain(), "abcdef");
    ASSERT_EQ(oc.size(), 0U);
    ASSERT_EQ(oc.drain(), "");
}

// NOLINTNEXTLINE
TEST(output_capture, write_exactly_filling_does_not_block) {
    OutputCapture oc{4};
    ASSERT_TRUE(oc.write("abcd"));
    ASSERT_EQ(oc.drain(), "abcd");
}

// NOLINTNEXTLINE
TEST(output_capture, write_blocks_until_drained) {
    OutputCapture oc{4};
    auto writer = std::async(std::launch::async, [&] { return oc.write("0123456789"); });
    std::string res;
    while (res.size() < 10) {
        res += oc.drain();
        std::this_thread::yield();
    }
    ASSERT_TRUE(writer.get());
    ASSERT_EQ(res, "0123456789");
}

// NOLINTNEXTLINE
TEST(output_capture, buffered_size_never_exceeds_capacity) {
    OutputCapture oc{3};
    auto writer = std::async(std::launch::async, [&] { return oc.write("abcdefgh"); });
    std::string res;
    while (res.size() < 8) {
        ASSERT_LE(oc.size(), 3U);
        res += oc.drain();
    }
    ASSERT_TRUE(writer.get());
    ASSERT_EQ(res, "abcdefgh");
}

// NOLINTNEXTLINE
TEST(output_capture, close_wakes_blocked_writer) {
    OutputCapture oc{2};
    auto writer = std::async(std::launch::async, [&] { return oc.write("abcdef"); });
    ASSERT_EQ(writer.wait_for(std::chrono::milliseconds{50}), std::future_status::timeout);
    oc.close();
    ASSERT_FALSE(writer.get());
    ASSERT_TRUE(oc.is_closed());
    // Bytes stored before closing are still drainable
    ASSERT_EQ(oc.drain(), "ab");
}

// NOLINTNEXTLINE
TEST(output_capture, writes_after_close_are_discarded) {
    OutputCapture oc{8};
    ASSERT_TRUE(oc.write("ab"));
    oc.close();
    ASSERT_FALSE(oc.write("cd"));
    ASSERT_EQ(oc.drain(), "ab");
    ASSERT_EQ(oc.drain(), "");
}
