#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace runjudge::judge {

struct Verdict {
    enum class Score : uint8_t {
        CompilerError = 1,
        TimeLimitExceeded = 2,
        ExecutionError = 3,
        WrongAnswer = 4,
        WrongFormatting = 5,
        ProgramSuccess = 6,
    };

    std::string result;
    int exit_status = EXIT_FAILURE;
    Score score = Score::CompilerError;

    bool operator==(const Verdict&) const = default;

    // Returns JSON object {"result": ..., "score": ...}
    [[nodiscard]] std::string to_json() const;
};

// Returns @p str as a JSON string literal (with quotes)
std::string json_quoted(std::string_view str);

} // namespace runjudge::judge
