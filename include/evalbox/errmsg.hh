#pragma once

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <string_view>

// Holds " - <error description> (os error <errnum>)"; usable where allocation is not possible
class Errmsg {
    std::array<char, 128> buff_{};
    size_t len_ = 0;

    void append(std::string_view str) noexcept {
        auto n = std::min(str.size(), buff_.size() - len_);
        std::memcpy(buff_.data() + len_, str.data(), n);
        len_ += n;
    }

public:
    explicit Errmsg(int errnum) noexcept {
        append(" - ");
        // At the time of writing, the longest error description is 50 bytes long
        std::array<char, 64> descr_buff{};
        const char* descr = strerror_r(errnum, descr_buff.data(), descr_buff.size());
        append(descr ? descr : "Unknown error");
        append(" (os error ");
        std::array<char, 16> num_buff{};
        auto [end, ec] = std::to_chars(num_buff.data(), num_buff.data() + num_buff.size(), errnum);
        append(std::string_view{num_buff.data(), static_cast<size_t>(end - num_buff.data())});
        append(")");
    }

    [[nodiscard]] std::string_view view() const noexcept { return {buff_.data(), len_}; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator std::string_view() const noexcept { return view(); }
};

inline Errmsg errmsg(int errnum) noexcept { return Errmsg{errnum}; }

inline Errmsg errmsg() noexcept { return Errmsg{errno}; }
