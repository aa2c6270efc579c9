#include "../temporary_directory.hh"

#include <evalbox/errors.hh>
#include <evalbox/session.hh>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>

using evalbox::CapabilityPolicy;
using evalbox::ResourceExhausted;
using evalbox::RuntimeError;
using evalbox::Session;
using evalbox::SessionId;
using evalbox::SyntaxError;
using evalbox::TerminatedEvaluator;
using evalbox::Value;

namespace {

struct SessionTest : testing::Test {
    TemporaryDirectory tmp_dir;
    Session session = Session::create(
        Session::default_memory_limit,
        CapabilityPolicy{.filesystem = {.read_allowed = {tmp_dir.path()}, .write_allowed = {}}}
    );
};

} // namespace

// NOLINTNEXTLINE
TEST_F(SessionTest, fresh_session) {
    EXPECT_TRUE(session.is_alive());
    EXPECT_EQ(session.drain_stdout(), "");
    EXPECT_EQ(session.drain_stderr(), "");
}

// NOLINTNEXTLINE
TEST_F(SessionTest, fact_and_query) {
    EXPECT_EQ(
        session.evaluate("parent(john, douglas). parent(john, X)?"),
        (Value{{{}, {"parent(john, douglas)"}}})
    );
    EXPECT_EQ(session.evaluate("parent(X, douglas)?"), (Value{{{"parent(john, douglas)"}}}));
}

// NOLINTNEXTLINE
TEST_F(SessionTest, empty_program) {
    EXPECT_EQ(session.evaluate(""), Value{});
    EXPECT_EQ(session.evaluate("  % only a comment\n"), Value{});
}

// NOLINTNEXTLINE
TEST_F(SessionTest, output_is_captured) {
    EXPECT_EQ(session.evaluate(R"(write("hello")?)"), (Value{{{R"(write("hello"))"}}}));
    EXPECT_EQ(session.evaluate(R"(write_err("warn")? write(" world")?)").results.size(), 2U);
    EXPECT_EQ(session.drain_stdout(), "hello world");
    EXPECT_EQ(session.drain_stdout(), "");
    EXPECT_EQ(session.drain_stderr(), "warn");
    EXPECT_EQ(session.drain_stderr(), "");
}

// NOLINTNEXTLINE
TEST_F(SessionTest, output_bigger_than_one_frame) {
    std::string text(200'000, 'y');
    EXPECT_EQ(session.evaluate(R"(write(")" + text + R"(")?)").results.size(), 1U);
    EXPECT_EQ(session.drain_stdout(), text);
}

// NOLINTNEXTLINE
TEST_F(SessionTest, flush) {
    (void)session.evaluate(R"(write("a")? write_err("b")?)");
    session.flush();
    EXPECT_EQ(session.drain_stdout(), "");
    EXPECT_EQ(session.drain_stderr(), "");
}

// NOLINTNEXTLINE
TEST_F(SessionTest, syntax_error_keeps_session_alive) {
    EXPECT_THAT(
        [&] { (void)session.evaluate("p(a). p(b"); },
        testing::ThrowsMessage<SyntaxError>(testing::HasSubstr("end of input"))
    );
    EXPECT_TRUE(session.is_alive());
    EXPECT_EQ(session.evaluate("p(X)?"), (Value{{{}}}));
}

// NOLINTNEXTLINE
TEST_F(SessionTest, runtime_error_keeps_session_alive) {
    EXPECT_THAT(
        [&] { (void)session.evaluate(R"(p(a). raise("boom")?)"); },
        testing::ThrowsMessage<RuntimeError>(testing::StrEq("boom"))
    );
    EXPECT_TRUE(session.is_alive());
    EXPECT_EQ(session.evaluate("p(X)?"), (Value{{{"p(a)"}}}));
}

// NOLINTNEXTLINE
TEST_F(SessionTest, exceeding_memory_limit_kills_session) {
    EXPECT_THAT(
        [&] { (void)session.evaluate(R"(repeat("x", 1000000000, R)?)"); },
        testing::ThrowsMessage<ResourceExhausted>(testing::HasSubstr("out of memory"))
    );
    EXPECT_FALSE(session.is_alive());
    EXPECT_THROW((void)session.evaluate("p(X)?"), TerminatedEvaluator);
    EXPECT_THROW((void)session.evaluate("p(X)?"), TerminatedEvaluator);
}

// NOLINTNEXTLINE
TEST_F(SessionTest, output_before_exceeding_memory_limit_is_kept) {
    EXPECT_THROW(
        (void)session.evaluate(R"(write("before")? repeat("x", 1000000000, R)?)"),
        ResourceExhausted
    );
    EXPECT_EQ(session.drain_stdout(), "before");
}

// NOLINTNEXTLINE
TEST(session, bigger_memory_limit) {
    TemporaryDirectory tmp_dir;
    auto session = Session::create(
        64 << 20,
        CapabilityPolicy{.filesystem = {.read_allowed = {tmp_dir.path()}, .write_allowed = {}}}
    );
    // Would not fit within the default limit together with its copies
    EXPECT_EQ(session.evaluate(R"(repeat("x", 8388608, R)? p(a).)").results.size(), 2U);
    EXPECT_TRUE(session.is_alive());
}

// NOLINTNEXTLINE
TEST(session, ids_are_unique) {
    auto a = Session::create();
    auto b = Session::create();
    EXPECT_NE(a.id(), b.id());
    EXPECT_THAT(a.id().to_string(), testing::StartsWith("session#"));
    EXPECT_EQ(SessionId{7}.to_string(), "session#7");
}
