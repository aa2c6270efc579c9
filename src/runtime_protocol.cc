#include "runtime_protocol.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/macros/throw.hh"

#include <array>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/uio.h>

namespace evalbox::communication::session_runtime {

namespace {

constexpr size_t header_len = sizeof(frame_type_t) + sizeof(body_len_t);

// Returns number of bytes read before EOF, or -1 on error (errno is set). ECONNRESET is
// treated as EOF.
ssize_t recv_all(int fd, void* buff, size_t len) noexcept {
    size_t pos = 0;
    while (pos < len) {
        auto rc = recv(fd, static_cast<char*>(buff) + pos, len - pos, 0);
        if (rc == 0) {
            break;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECONNRESET) {
                break;
            }
            return -1;
        }
        pos += static_cast<size_t>(rc);
    }
    return static_cast<ssize_t>(pos);
}

} // namespace

bool write_frame(int sock_fd, FrameType type, std::string_view body) noexcept {
    std::array<char, header_len> header{};
    auto type_byte = static_cast<frame_type_t>(type);
    body_len_t body_len = body.size();
    std::memcpy(header.data(), &type_byte, sizeof(type_byte));
    std::memcpy(header.data() + sizeof(type_byte), &body_len, sizeof(body_len));

    std::array<iovec, 2> iov = {{
        {.iov_base = header.data(), .iov_len = header.size()},
        {.iov_base = const_cast<char*>(body.data()), .iov_len = body.size()},
    }};
    size_t iov_idx = 0;
    while (iov_idx < iov.size()) {
        msghdr msg{};
        msg.msg_iov = iov.data() + iov_idx;
        msg.msg_iovlen = iov.size() - iov_idx;
        auto rc = sendmsg(sock_fd, &msg, MSG_NOSIGNAL);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        // Skip what was sent
        auto sent = static_cast<size_t>(rc);
        while (iov_idx < iov.size() and sent >= iov[iov_idx].iov_len) {
            sent -= iov[iov_idx].iov_len;
            ++iov_idx;
        }
        if (iov_idx < iov.size()) {
            iov[iov_idx].iov_base = static_cast<char*>(iov[iov_idx].iov_base) + sent;
            iov[iov_idx].iov_len -= sent;
        }
    }
    return true;
}

std::optional<Frame> read_frame(int sock_fd) {
    std::array<char, header_len> header{};
    auto rc = recv_all(sock_fd, header.data(), header.size());
    if (rc < 0) {
        THROW("recv()", errmsg());
    }
    if (static_cast<size_t>(rc) != header.size()) {
        return std::nullopt;
    }

    frame_type_t type_byte{};
    body_len_t body_len{};
    std::memcpy(&type_byte, header.data(), sizeof(type_byte));
    std::memcpy(&body_len, header.data() + sizeof(type_byte), sizeof(body_len));
    if (body_len > max_frame_body_len) {
        THROW("frame body is too big: ", body_len, " bytes");
    }

    Frame frame{.type = static_cast<FrameType>(type_byte), .body = std::string(body_len, '\0')};
    rc = recv_all(sock_fd, frame.body.data(), frame.body.size());
    if (rc < 0) {
        THROW("recv()", errmsg());
    }
    if (static_cast<size_t>(rc) != frame.body.size()) {
        return std::nullopt;
    }
    return frame;
}

} // namespace evalbox::communication::session_runtime
