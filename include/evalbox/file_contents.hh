#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * @brief Read @p count bytes to @p buff from @p fd
 * @details Uses read(2), but reads until it is unable to read
 *
 * @return number of bytes read, if error occurs then errno is > 0
 *
 * @errors The same as for read(2) except EINTR
 */
[[nodiscard]] size_t read_all(int fd, void* buff, size_t count) noexcept;

/**
 * @brief Write @p count bytes to @p fd from @p buff
 * @details Uses write(2), but writes until it is unable to write
 *
 * @return number of bytes written, if error occurs then errno is > 0
 *
 * @errors The same as for write(2) except EINTR
 */
[[nodiscard]] size_t write_all(int fd, const void* buff, size_t count) noexcept;

[[nodiscard]] inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads @p fd until EOF. Throws std::runtime_error on error.
std::string get_file_contents(int fd);
