#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

namespace detail {

template <class T>
constexpr inline bool is_char_v = std::is_same_v<std::remove_cvref_t<T>, char>;

template <class T>
constexpr inline bool is_bool_v = std::is_same_v<std::remove_cvref_t<T>, bool>;

template <class T>
constexpr inline bool is_integer_v =
    std::is_integral_v<std::remove_cvref_t<T>> and not is_char_v<T> and not is_bool_v<T>;

template <class T>
void append_stringified(std::string& str, T&& x) {
    if constexpr (is_char_v<T>) {
        str += x;
    } else if constexpr (is_bool_v<T>) {
        str += (x ? "true" : "false");
    } else if constexpr (is_integer_v<T>) {
        char buff[24];
        auto [end, ec] = std::to_chars(buff, buff + sizeof(buff), x);
        str.append(buff, end);
    } else if constexpr (std::is_array_v<std::remove_reference_t<T>>) {
        str += std::string_view{x};
    } else if constexpr (std::is_pointer_v<std::remove_cvref_t<T>>) {
        if (x != nullptr) {
            str += std::string_view{x};
        }
    } else {
        str += std::string_view{x};
    }
}

} // namespace detail

template <class... Args>
std::string& back_insert(std::string& str, Args&&... args) {
    (detail::append_stringified(str, std::forward<Args>(args)), ...);
    return str;
}

template <class... Args>
std::string concat_tostr(Args&&... args) {
    std::string res;
    back_insert(res, std::forward<Args>(args)...);
    return res;
}
