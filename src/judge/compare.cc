#include <cerrno>
#include <cstdlib>
#include <runjudge/ctype.hh>
#include <runjudge/errmsg.hh>
#include <runjudge/judge/compare.hh>
#include <runjudge/macros/throw.hh>

namespace runjudge::judge {

FileLines::FileLines(std::string path) : file_(fopen(path.c_str(), "re")), path_(std::move(path)) {
    if (file_ == nullptr) {
        THROW("fopen('", path_, "')", errmsg());
    }
    try {
        read_line();
    } catch (...) {
        (void)fclose(file_);
        free(buff_);
        throw;
    }
}

FileLines::~FileLines() {
    (void)fclose(file_);
    free(buff_);
}

void FileLines::read_line() {
    errno = 0;
    auto len = getline(&buff_, &buff_size_, file_);
    if (len < 0) {
        if (ferror(file_)) {
            THROW("getline('", path_, "')", errmsg());
        }
        has_line_ = false;
        line_.clear();
        return;
    }
    line_.assign(buff_, static_cast<size_t>(len));
    has_line_ = true;
}

void FileLines::advance() {
    if (not has_line_) {
        THROW("advancing past the end of '", path_, '\'');
    }
    read_line();
}

std::string normalize_line(std::string_view line) {
    std::string res;
    res.reserve(line.size());
    for (char c : line) {
        if (not is_space(c)) {
            res += to_lower(c);
        }
    }
    return res;
}

Comparison compare_outputs(
    Iterable<const std::string>& output, Iterable<const std::string>& expected_output
) {
    bool format_mismatch = false;
    for (;;) {
        const std::string* line = output.current();
        const std::string* expected_line = expected_output.current();
        if (line == nullptr and expected_line == nullptr) {
            break;
        }
        if (line == nullptr or expected_line == nullptr) {
            return Comparison::WrongAnswer;
        }

        if (*line != *expected_line) {
            if (normalize_line(*line) != normalize_line(*expected_line)) {
                return Comparison::WrongAnswer;
            }
            format_mismatch = true;
        }

        output.advance();
        expected_output.advance();
    }

    return format_mismatch ? Comparison::FormatMismatch : Comparison::ExactMatch;
}

Comparison compare_files(const std::string& output_path, const std::string& expected_output_path) {
    FileLines output{output_path};
    FileLines expected_output{expected_output_path};
    return compare_outputs(output, expected_output);
}

} // namespace runjudge::judge
