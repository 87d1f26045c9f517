#pragma once

#include <type_traits>

// Standard functions reimplemented to be constexpr and locale-independent
template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_space(T c) noexcept {
    return (c == '\t') or ('\x0a' <= c and c <= '\x0d') or (c == ' ');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_upper(T c) noexcept {
    return ('A' <= c and c <= 'Z');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr T to_lower(T c) noexcept {
    return (is_upper(c) ? static_cast<T>(c + ('a' - 'A')) : c);
}
