#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace evalbox::communication::session_runtime {

using frame_type_t = uint8_t;
using body_len_t = uint64_t;

enum class FrameType : frame_type_t {
    // Session -> runtime
    EVALUATE = 1,
    // Runtime -> session, any number of them before the final response
    STDOUT = 2,
    STDERR = 3,
    // Runtime -> session, exactly one per EVALUATE
    OK = 4,
    SYNTAX_ERROR = 5,
    RUNTIME_ERROR = 6,
    ACCESS_DENIED = 7, // body: kind byte followed by the message
    RESOURCE_EXHAUSTED = 8, // the runtime exits right after sending it
};

// Output is split into frames not bigger than this
constexpr inline size_t max_output_frame_body_len = 64 << 10;
// Protects the session from allocating an arbitrarily big buffer on a corrupted length
constexpr inline body_len_t max_frame_body_len = body_len_t{1} << 30;

struct Frame {
    FrameType type;
    std::string body;
};

// Writes the whole frame. Returns false and sets errno on error. Never raises SIGPIPE. Does not
// allocate.
[[nodiscard]] bool write_frame(int sock_fd, FrameType type, std::string_view body) noexcept;

// Returns std::nullopt if the other end closed the connection, possibly in the middle of a frame.
// Throws std::runtime_error on other errors.
std::optional<Frame> read_frame(int sock_fd);

} // namespace evalbox::communication::session_runtime
