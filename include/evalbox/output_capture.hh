#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace evalbox {

// Bounded FIFO of bytes. Writers block while the buffer is full, drain() empties it.
class OutputCapture {
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable space_freed_;
    std::string buff_;
    bool closed_ = false;

public:
    static constexpr size_t default_capacity = 64 << 10;

    explicit OutputCapture(size_t capacity = default_capacity);

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture(OutputCapture&&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;
    OutputCapture& operator=(OutputCapture&&) = delete;

    ~OutputCapture() = default;

    // Appends @p data, blocking until there is enough free space for every byte. Returns false
    // iff the capture got closed before all of @p data was stored, the rest is discarded.
    bool write(std::string_view data);

    // Returns and removes everything buffered so far
    [[nodiscard]] std::string drain();

    // Discards every subsequent write and wakes up blocked writers. Already buffered bytes remain
    // drainable.
    void close() noexcept;

    [[nodiscard]] bool is_closed() const noexcept;

    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
};

} // namespace evalbox
