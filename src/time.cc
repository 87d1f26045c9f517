#include <array>
#include <runjudge/errmsg.hh>
#include <runjudge/macros/throw.hh>
#include <runjudge/time.hh>

std::string localdate(const char* format, time_t curr_time) {
    if (curr_time < 0) {
        time(&curr_time);
    }

    struct tm t {};
    if (localtime_r(&curr_time, &t) == nullptr) {
        THROW("localtime_r()", errmsg());
    }

    std::array<char, 64> buff{};
    auto len = strftime(buff.data(), buff.size(), format, &t);
    if (len == 0) {
        THROW("strftime() - result does not fit in the buffer");
    }
    return std::string(buff.data(), len);
}
