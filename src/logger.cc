#include "evalbox/logger.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/macros/throw.hh"

#include <array>
#include <ctime>

Logger::Logger(const char* filename) : f_(fopen(filename, "abe")), opened_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
}

void Logger::open(const char* filename) {
    FILE* f = fopen(filename, "abe");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }

    close();
    f_ = f;
    opened_.store(true);
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            std::array<char, 32> date{};
            timespec ts{};
            tm local{};
            if (clock_gettime(CLOCK_REALTIME, &ts) == 0 and localtime_r(&ts.tv_sec, &local) and
                strftime(date.data(), date.size(), "%Y-%m-%d %H:%M:%S", &local) > 0)
            {
                (void)fprintf(
                    logger_.f_,
                    "[ %s ] %.*s\n",
                    date.data(),
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            } else {
                (void)fprintf(
                    logger_.f_,
                    "[ unknown time ] %.*s\n",
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            }
        } else {
            (void)fprintf(logger_.f_, "%.*s\n", static_cast<int>(buff_.size()), buff_.data());
        }

        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
