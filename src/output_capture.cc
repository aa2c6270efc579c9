#include "evalbox/output_capture.hh"
#include "evalbox/macros/throw.hh"

#include <algorithm>

namespace evalbox {

OutputCapture::OutputCapture(size_t capacity) : capacity_{capacity} {
    if (capacity_ == 0) {
        THROW("output capture capacity has to be positive");
    }
}

bool OutputCapture::write(std::string_view data) {
    std::unique_lock lock{mutex_};
    while (not data.empty()) {
        space_freed_.wait(lock, [&] { return closed_ or buff_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        auto len = std::min(data.size(), capacity_ - buff_.size());
        buff_.append(data.substr(0, len));
        data.remove_prefix(len);
    }
    return not closed_;
}

std::string OutputCapture::drain() {
    std::string res;
    {
        std::lock_guard lock{mutex_};
        res.swap(buff_);
    }
    space_freed_.notify_all();
    return res;
}

void OutputCapture::close() noexcept {
    {
        std::lock_guard lock{mutex_};
        closed_ = true;
    }
    space_freed_.notify_all();
}

bool OutputCapture::is_closed() const noexcept {
    std::lock_guard lock{mutex_};
    return closed_;
}

size_t OutputCapture::size() const noexcept {
    std::lock_guard lock{mutex_};
    return buff_.size();
}

} // namespace evalbox
