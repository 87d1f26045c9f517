#pragma once

#include <array>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace runjudge::judge {

// Describes how to build and run programs written in one language. Templates may contain
// placeholders {source} and {executable}; an empty compile template means that the source is
// run directly.
struct Language {
    std::string_view name;
    std::string_view compile;
    std::string_view execute;
    std::initializer_list<std::string_view> extensions;

    [[nodiscard]] bool is_compiled() const noexcept { return not compile.empty(); }
};

// Sorted by priority: the first language that matches wins
inline const std::array languages = {
    Language{
        .name = "Bash",
        .compile = "",
        .execute = "bash {source}",
        .extensions = {".sh"},
    },
    Language{
        .name = "C",
        .compile = "gcc -std=gnu99 -o {executable} {source} -lm",
        .execute = "./{executable}",
        .extensions = {".c"},
    },
    Language{
        .name = "C++",
        .compile = "g++ -std=gnu++11 -o {executable} {source} -lm",
        .execute = "./{executable}",
        .extensions = {".cc", ".cpp"},
    },
    Language{
        .name = "Go",
        .compile = "go build {source}",
        .execute = "go run {source}",
        .extensions = {".go"},
    },
    Language{
        .name = "Java",
        .compile = "javac {source}",
        .execute = "java -cp . {executable}",
        .extensions = {".java"},
    },
    Language{
        .name = "JavaScript",
        .compile = "",
        .execute = "nodejs {source}",
        .extensions = {".js"},
    },
    Language{
        .name = "Perl",
        .compile = "",
        .execute = "perl {source}",
        .extensions = {".pl"},
    },
    Language{
        .name = "Python 2",
        .compile = "",
        .execute = "python2.7 {source}",
        .extensions = {".py"},
    },
    Language{
        .name = "Python 3",
        .compile = "",
        .execute = "python3 {source}",
        .extensions = {".py3"},
    },
    Language{
        .name = "Ruby",
        .compile = "",
        .execute = "ruby {source}",
        .extensions = {".rb"},
    },
    Language{
        .name = "Swift",
        .compile = "swiftc {source}",
        .execute = "./{executable}",
        .extensions = {".swift"},
    },
};

class UnsupportedLanguage : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Returns extension of the last path component, including the leading '.', or an empty string
// if there is none. Leading dots of hidden files do not start an extension.
std::string_view path_extension(std::string_view path) noexcept;

// Returns the last path component without its extension
std::string_view executable_name(std::string_view source_path) noexcept;

// Returns the first language that recognizes extension of @p source_path or whose name is
// case-insensitively equal to @p language_name. Throws UnsupportedLanguage if none does.
const Language&
resolve_language(std::string_view source_path, std::optional<std::string_view> language_name);

// Substitutes {source} and {executable} in @p command_template, other text is kept intact
std::string format_command(
    std::string_view command_template, std::string_view source, std::string_view executable
);

} // namespace runjudge::judge
