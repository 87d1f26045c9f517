#pragma once

#include <cerrno>
#include <cstring>
#include <runjudge/concat_tostr.hh>
#include <string>

// Returns " - <description> (os error <errnum>)", ready to be appended to a message
inline std::string errmsg(int errnum) {
    char buff[64];
    // GNU strerror_r() may return a static string instead of filling buff
    const char* descr = strerror_r(errnum, buff, sizeof(buff));
    if (descr == nullptr) {
        descr = "Unknown error";
    }
    return concat_tostr(" - ", descr, " (os error ", errnum, ')');
}

inline std::string errmsg() { return errmsg(errno); }
