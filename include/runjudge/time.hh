#pragma once

#include <ctime>
#include <string>

// Returns local time formatted with strftime(3) @p format; if @p curr_time is negative, the
// current time is used. Throws on error.
std::string localdate(const char* format, time_t curr_time = -1);

// Returns local time in format "YYYY-MM-DD HH:MM:SS"
inline std::string mysql_localdate(time_t curr_time = -1) {
    return localdate("%Y-%m-%d %H:%M:%S", curr_time);
}
