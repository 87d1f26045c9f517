#pragma once

#include <cstdio>
#include <cstdlib>
#include <string>

// In-memory FILE* for capturing what is written to it
class MemoryStream {
    char* buff_ = nullptr;
    size_t size_ = 0;
    FILE* stream_ = open_memstream(&buff_, &size_);

public:
    MemoryStream() = default;
    MemoryStream(const MemoryStream&) = delete;
    MemoryStream(MemoryStream&&) = delete;
    MemoryStream& operator=(const MemoryStream&) = delete;
    MemoryStream& operator=(MemoryStream&&) = delete;

    ~MemoryStream() {
        if (stream_) {
            (void)fclose(stream_);
        }
        free(buff_);
    }

    FILE* stream() noexcept { return stream_; }

    std::string contents() {
        (void)fflush(stream_);
        return std::string(buff_, size_);
    }
};
