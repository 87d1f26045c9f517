#pragma once

#include <chrono>
#include <optional>
#include <runjudge/judge/verdict.hh>
#include <runjudge/logger.hh>
#include <string>

namespace runjudge::judge {

constexpr inline auto default_time_limit = std::chrono::seconds{30};
constexpr inline auto default_compile_time_limit = std::chrono::seconds{60};
// Longer limits could not be represented as a deadline
constexpr inline auto max_time_limit =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::nanoseconds::max() / 2);
// Name of the file capturing compiler diagnostics and program output, in the working directory
constexpr inline auto capture_file_name = "stdout";

struct JudgeRequest {
    std::string source;
    std::string input;
    std::string expected_output;
    // Explicitly chosen language, matched against language names
    std::optional<std::string> language_name = std::nullopt;
    // Directory in which the compiler and the program are run and the artifacts are placed
    std::string working_dir = ".";
    std::chrono::nanoseconds time_limit = default_time_limit;
    std::chrono::nanoseconds compile_time_limit = default_compile_time_limit;
    bool verbose = false;
};

// Compiles (if needed) and runs the source on the input, then compares the captured output
// with the expected output. Every verdict is returned, exceptions are thrown only on failures
// of the judge itself (e.g. the capture file cannot be created).
Verdict judge(const JudgeRequest& request, Logger& logger = stdlog);

} // namespace runjudge::judge
