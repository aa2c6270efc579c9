#include "evalbox/file_contents.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/macros/throw.hh"

#include <array>
#include <cerrno>
#include <unistd.h>

size_t read_all(int fd, void* buff, size_t count) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        auto rc = read(fd, static_cast<char*>(buff) + pos, count - pos);
        if (rc > 0) {
            pos += static_cast<size_t>(rc);
        } else if (rc == 0) {
            errno = 0;
            break; // EOF
        } else if (errno != EINTR) {
            break;
        }
    }
    return pos;
}

size_t write_all(int fd, const void* buff, size_t count) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        auto rc = write(fd, static_cast<const char*>(buff) + pos, count - pos);
        if (rc > 0) {
            pos += static_cast<size_t>(rc);
        } else if (rc == 0) {
            errno = EIO; // write(2) does not report progress
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    return pos;
}

std::string get_file_contents(int fd) {
    std::string res;
    std::array<char, 1 << 16> buff;
    for (;;) {
        auto rc = read(fd, buff.data(), buff.size());
        if (rc == 0) {
            return res;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        res.append(buff.data(), static_cast<size_t>(rc));
    }
}
