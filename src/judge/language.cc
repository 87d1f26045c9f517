#include <algorithm>
#include <runjudge/concat_tostr.hh>
#include <runjudge/ctype.hh>
#include <runjudge/judge/language.hh>

namespace runjudge::judge {

namespace {

bool equal_case_insensitive(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return to_lower(x) == to_lower(y);
    });
}

std::string_view last_path_component(std::string_view path) noexcept {
    auto pos = path.rfind('/');
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

} // namespace

std::string_view path_extension(std::string_view path) noexcept {
    auto filename = last_path_component(path);
    auto first_non_dot = filename.find_first_not_of('.');
    if (first_non_dot == std::string_view::npos) {
        return {};
    }
    auto pos = filename.rfind('.');
    if (pos == std::string_view::npos or pos < first_non_dot) {
        return {};
    }
    return filename.substr(pos);
}

std::string_view executable_name(std::string_view source_path) noexcept {
    auto filename = last_path_component(source_path);
    filename.remove_suffix(path_extension(filename).size());
    return filename;
}

const Language&
resolve_language(std::string_view source_path, std::optional<std::string_view> language_name) {
    auto extension = path_extension(source_path);
    for (const auto& language : languages) {
        bool matches_extension = not extension.empty() and
            std::find(language.extensions.begin(), language.extensions.end(), extension) !=
                language.extensions.end();
        bool matches_name = language_name and equal_case_insensitive(*language_name, language.name);
        if (matches_extension or matches_name) {
            return language;
        }
    }
    throw UnsupportedLanguage{concat_tostr("Unable to determine language for ", source_path)};
}

std::string format_command(
    std::string_view command_template, std::string_view source, std::string_view executable
) {
    constexpr std::string_view source_placeholder = "{source}";
    constexpr std::string_view executable_placeholder = "{executable}";
    std::string res;
    while (not command_template.empty()) {
        if (command_template.starts_with(source_placeholder)) {
            res += source;
            command_template.remove_prefix(source_placeholder.size());
        } else if (command_template.starts_with(executable_placeholder)) {
            res += executable;
            command_template.remove_prefix(executable_placeholder.size());
        } else {
            res += command_template.front();
            command_template.remove_prefix(1);
        }
    }
    return res;
}

} // namespace runjudge::judge
