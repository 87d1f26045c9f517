#pragma once

#include <fcntl.h>
#include <optional>
#include <sys/stat.h>
#include <unistd.h>

constexpr mode_t S_0644 = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;

// Encapsulates file descriptor
class FileDescriptor {
    int fd_;

public:
    explicit FileDescriptor(int fd = -1) noexcept : fd_(fd) {}

    FileDescriptor(const char* filename, int flags, mode_t mode = S_0644) noexcept
    : fd_(::open(filename, flags, mode)) {}

    FileDescriptor(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& fd) noexcept : fd_(fd.release()) {}

    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor& operator=(FileDescriptor&& fd) noexcept {
        reset(fd.release());
        return *this;
    }

    FileDescriptor& operator=(int fd) noexcept {
        reset(fd);
        return *this;
    }

    [[nodiscard]] bool is_open() const noexcept { return (fd_ >= 0); }

    // To check for validity is_open() should be used
    explicit operator bool() const noexcept = delete;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    [[nodiscard]] int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd) noexcept {
        if (fd_ >= 0) {
            (void)::close(fd_);
        }
        fd_ = fd;
    }

    [[nodiscard]] int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }

        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

    ~FileDescriptor() {
        if (fd_ >= 0) {
            (void)::close(fd_);
        }
    }
};

struct Pipe {
    FileDescriptor readable;
    FileDescriptor writable;
};

// Returns std::nullopt on error (errno is set)
inline std::optional<Pipe> pipe2(int flags) noexcept {
    int fds[2];
    if (::pipe2(fds, flags)) {
        return std::nullopt;
    }
    return Pipe{FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
}
