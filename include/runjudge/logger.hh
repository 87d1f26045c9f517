#pragma once

#include <atomic>
#include <cstdio>
#include <runjudge/concat_tostr.hh>
#include <string>
#include <utility>

class Logger {
private:
    FILE* f_;
    std::atomic<bool> label_{true};

    // Lock the file
    bool lock() noexcept {
        if (f_ == nullptr) {
            return false;
        }

        flockfile(f_);
        return true;
    }

    // Unlock the file
    void unlock() noexcept { funlockfile(f_); }

public:
    // Does not take ownership of @p stream, nullptr makes the logger a dummy
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    class Appender {
    private:
        friend class Logger;

        Logger& logger_;
        bool flushed_ = true;
        bool label_;
        std::string buff_;

        template <class... Args>
        explicit Appender(Logger& logger, Args&&... args)
        : logger_(logger)
        , label_(logger.label()) {
            operator()(std::forward<Args>(args)...);
        }

    public:
        Appender(const Appender&) = delete;

        Appender(Appender&& app) noexcept
        : logger_(app.logger_)
        , flushed_(app.flushed_)
        , label_(app.label_)
        , buff_(std::move(app.buff_)) {
            app.flushed_ = true;
        }

        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        template <class T>
        Appender& operator<<(T&& x) {
            return operator()(std::forward<T>(x));
        }

        template <class... Args>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            flushed_ = false;
            return *this;
        }

        void flush() noexcept;

        ~Appender() { flush(); }
    };

    template <class... Args>
    Appender operator()(Args&&... args) {
        return Appender(*this, std::forward<Args>(args)...);
    }

    ~Logger() = default;
};

// By default both write to stderr
inline Logger stdlog(stderr); // Standard (default) log
inline Logger errlog(stderr); // Error log
