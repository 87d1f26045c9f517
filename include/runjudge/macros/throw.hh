#pragma once

#include <runjudge/concat_tostr.hh>
#include <stdexcept>

#define RUNJUDGE_STRINGIFY_IMPL(x) #x
#define RUNJUDGE_STRINGIFY(x) RUNJUDGE_STRINGIFY_IMPL(x)

// Very useful - includes exception origin
#define THROW(...)                                                                   \
    throw std::runtime_error(concat_tostr(                                           \
        __VA_ARGS__, " (thrown at " __FILE__ ":" RUNJUDGE_STRINGIFY(__LINE__) ")"    \
    ))
