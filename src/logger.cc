#include <exception>
#include <runjudge/logger.hh>
#include <runjudge/time.hh>

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            try {
                (void)fprintf(
                    logger_.f_,
                    "[ %s ] %.*s\n",
                    mysql_localdate().c_str(),
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            } catch (const std::exception&) {
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
