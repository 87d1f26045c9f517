#include <runjudge/concat_tostr.hh>
#include <runjudge/judge/verdict.hh>
#include <string_view>

namespace runjudge::judge {

std::string json_quoted(std::string_view str) {
    constexpr char hex_digits[] = "0123456789abcdef";
    std::string res;
    res.reserve(str.size() + 2);
    res += '"';
    for (char c : str) {
        switch (c) {
        case '"': res += "\\\""; break;
        case '\\': res += "\\\\"; break;
        case '\b': res += "\\b"; break;
        case '\f': res += "\\f"; break;
        case '\n': res += "\\n"; break;
        case '\r': res += "\\r"; break;
        case '\t': res += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                back_insert(res, "\\u00", hex_digits[(c >> 4) & 0xf], hex_digits[c & 0xf]);
            } else {
                res += c;
            }
        }
    }
    res += '"';
    return res;
}

std::string Verdict::to_json() const {
    return concat_tostr(
        "{\"result\": ", json_quoted(result), ", \"score\": ", static_cast<int>(score), '}'
    );
}

} // namespace runjudge::judge
