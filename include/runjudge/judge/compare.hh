#pragma once

#include <cstdint>
#include <cstdio>
#include <runjudge/iterable.hh>
#include <string>
#include <string_view>

namespace runjudge::judge {

enum class Comparison : uint8_t {
    ExactMatch,
    FormatMismatch, // equal after removing whitespace and lowercasing, line by line
    WrongAnswer,
};

// Lines of a file read lazily, each with its terminating '\n' (the last one may lack it). At
// most one line is kept in memory.
class FileLines : public Iterable<const std::string> {
    FILE* file_;
    char* buff_ = nullptr; // managed by getline(3)
    size_t buff_size_ = 0;
    std::string line_;
    bool has_line_ = false;
    std::string path_;

    void read_line();

public:
    // Throws if the file cannot be opened
    explicit FileLines(std::string path);

    ~FileLines() override;

    [[nodiscard]] const std::string* current() override { return has_line_ ? &line_ : nullptr; }

    void advance() override;
};

// Returns @p line without whitespace and with ASCII letters lowercased
std::string normalize_line(std::string_view line);

// Walks both sequences in lockstep. A line that differs from its counterpart only in
// whitespace or letter case is a format mismatch; any other difference, including one
// sequence being shorter, is a wrong answer and ends the walk.
Comparison compare_outputs(
    Iterable<const std::string>& output, Iterable<const std::string>& expected_output
);

Comparison compare_files(const std::string& output_path, const std::string& expected_output_path);

} // namespace runjudge::judge
