#pragma once

#include <cerrno>
#include <runjudge/errmsg.hh>
#include <runjudge/file_descriptor.hh>
#include <runjudge/macros/throw.hh>
#include <string>
#include <string_view>

inline void write_file(const std::string& path, std::string_view data, mode_t mode = S_0644) {
    auto fd = FileDescriptor{path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (fd < 0) {
        THROW("open('", path, "')", errmsg());
    }
    size_t written = 0;
    while (written < data.size()) {
        auto res = write(fd, data.data() + written, data.size() - written);
        if (res < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("write()", errmsg());
        }
        written += static_cast<size_t>(res);
    }
}
