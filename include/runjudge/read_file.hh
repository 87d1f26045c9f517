#pragma once

#include <array>
#include <cerrno>
#include <runjudge/errmsg.hh>
#include <runjudge/file_descriptor.hh>
#include <runjudge/macros/throw.hh>
#include <string>

inline std::string read_file(int fd) {
    std::string res;
    std::array<char, 1 << 14> buff;
    for (;;) {
        auto len = read(fd, buff.data(), buff.size());
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        if (len == 0) {
            return res;
        }
        res.append(buff.data(), buff.data() + len);
    }
}

inline std::string read_file(const std::string& path) {
    auto fd = FileDescriptor{path.c_str(), O_RDONLY | O_CLOEXEC};
    if (fd < 0) {
        THROW("open('", path, "')", errmsg());
    }
    return read_file(fd);
}
