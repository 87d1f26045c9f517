#include "../memory_stream.hh"

#include <chrono>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <optional>
#include <runjudge/concat_tostr.hh>
#include <runjudge/judge/judge.hh>
#include <runjudge/judge/verdict.hh>
#include <runjudge/logger.hh>
#include <runjudge/read_file.hh>
#include <runjudge/temporary_directory.hh>
#include <runjudge/write_file.hh>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using runjudge::judge::JudgeRequest;
using runjudge::judge::Verdict;
using std::string;
using std::chrono::operator""s;

namespace {

Logger quiet_logger{static_cast<FILE*>(nullptr)};

// Submission placed in its own temporary directory, which is also the working directory
struct Submission {
    TemporaryDirectory dir{"/tmp/runjudge-test.XXXXXX"};
    JudgeRequest request;

    Submission(
        const string& source_name,
        const string& source,
        const string& input,
        const string& expected_output
    )
    : request{
          .source = dir.path() + source_name,
          .input = dir.path() + "input",
          .expected_output = dir.path() + "expected_output",
          .working_dir = dir.path(),
      } {
        write_file(request.source, source);
        write_file(request.input, input);
        write_file(request.expected_output, expected_output);
    }

    Verdict judge(Logger& logger = quiet_logger) const {
        return runjudge::judge::judge(request, logger);
    }

    [[nodiscard]] string captured_output() const {
        return read_file(dir.path() + runjudge::judge::capture_file_name);
    }

    [[nodiscard]] bool exists(const string& name) const {
        return access((dir.path() + name).c_str(), F_OK) == 0;
    }
};

const Verdict success = {
    .result = "Success",
    .exit_status = EXIT_SUCCESS,
    .score = Verdict::Score::ProgramSuccess,
};
const Verdict compilation_error = {
    .result = "Compilation Error",
    .exit_status = EXIT_FAILURE,
    .score = Verdict::Score::CompilerError,
};
const Verdict wrong_answer = {
    .result = "Wrong Answer",
    .exit_status = EXIT_FAILURE,
    .score = Verdict::Score::WrongAnswer,
};
const Verdict output_format_error = {
    .result = "Output Format Error",
    .exit_status = EXIT_FAILURE,
    .score = Verdict::Score::WrongFormatting,
};
const Verdict time_limit_exceeded = {
    .result = "Time Limit Exceeded",
    .exit_status = EXIT_FAILURE,
    .score = Verdict::Score::TimeLimitExceeded,
};

Verdict execution_error(int exit_status) {
    return {
        .result = "Execution Error",
        .exit_status = exit_status,
        .score = Verdict::Score::ExecutionError,
    };
}

} // namespace

// NOLINTNEXTLINE
TEST(judge, bash_success) {
    Submission sub{"solution.sh", "echo hello\n", "", "hello\n"};
    auto verdict = sub.judge();
    EXPECT_EQ(verdict, success);
    EXPECT_EQ(verdict.to_json(), R"({"result": "Success", "score": 6})");
    EXPECT_EQ(sub.captured_output(), "hello\n");
}

// NOLINTNEXTLINE
TEST(judge, program_reads_input) {
    Submission sub{"solution.sh", "read a b\necho $((a + b))\n", "1 2\n", "3\n"};
    EXPECT_EQ(sub.judge(), success);
}

// NOLINTNEXTLINE
TEST(judge, stderr_of_program_is_discarded) {
    Submission sub{"solution.sh", "echo noise >&2\necho hello\n", "", "hello\n"};
    EXPECT_EQ(sub.judge(), success);
    EXPECT_EQ(sub.captured_output(), "hello\n");
}

// NOLINTNEXTLINE
TEST(judge, stale_capture_file_is_truncated) {
    Submission sub{"solution.sh", "echo hello\n", "", "hello\n"};
    write_file(sub.dir.path() + runjudge::judge::capture_file_name, "stale\n");
    EXPECT_EQ(sub.judge(), success);
    EXPECT_EQ(sub.captured_output(), "hello\n");
}

// NOLINTNEXTLINE
TEST(judge, c_success) {
    Submission sub{
        "solution.c",
        "#include <stdio.h>\n"
        "int main() { int a, b; scanf(\"%d %d\", &a, &b); printf(\"%d\\n\", a * b); }\n",
        "6 7\n",
        "42\n"
    };
    EXPECT_EQ(sub.judge(), success);
    EXPECT_TRUE(sub.exists("solution"));
    EXPECT_EQ(sub.captured_output(), "42\n");
}

// NOLINTNEXTLINE
TEST(judge, c_compilation_error) {
    Submission sub{"solution.c", "int main() { return 0 }\n", "", "hello\n"};
    sub.request.verbose = true;
    MemoryStream ms;
    Logger logger{ms.stream()};
    auto verdict = sub.judge(logger);
    EXPECT_EQ(verdict, compilation_error);
    EXPECT_EQ(verdict.to_json(), R"({"result": "Compilation Error", "score": 1})");
    // Nothing was executed: the capture holds only the compiler diagnostics
    EXPECT_FALSE(sub.exists("solution"));
    EXPECT_THAT(sub.captured_output(), testing::HasSubstr("error"));
    auto log = ms.contents();
    EXPECT_THAT(log, testing::HasSubstr("Compiling "));
    EXPECT_THAT(log, testing::Not(testing::HasSubstr("Executing")));
    EXPECT_THAT(log, testing::Not(testing::HasSubstr("Program ")));
}

// NOLINTNEXTLINE
TEST(judge, wrong_answer) {
    Submission sub{"solution.sh", "echo 4\n", "", "3\n"};
    EXPECT_EQ(sub.judge(), wrong_answer);

    write_file(sub.request.source, "echo 3\necho 7\n");
    EXPECT_EQ(sub.judge(), wrong_answer);

    write_file(sub.request.source, "");
    EXPECT_EQ(sub.judge(), wrong_answer);
}

// NOLINTNEXTLINE
TEST(judge, output_format_error) {
    Submission sub{"solution.sh", "echo '3  7'\n", "", "3 7\n"};
    EXPECT_EQ(sub.judge(), output_format_error);

    write_file(sub.request.source, "echo HELLO\n");
    write_file(sub.request.expected_output, "hello\n");
    EXPECT_EQ(sub.judge(), output_format_error);

    write_file(sub.request.source, "printf hello\n");
    EXPECT_EQ(sub.judge(), output_format_error);
}

// NOLINTNEXTLINE
TEST(judge, time_limit_exceeded) {
    Submission sub{"solution.sh", "while :; do :; done\n", "", "\n"};
    sub.request.time_limit = 1s;
    auto start = std::chrono::steady_clock::now();
    auto verdict = sub.judge();
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(verdict, time_limit_exceeded);
    EXPECT_EQ(verdict.to_json(), R"({"result": "Time Limit Exceeded", "score": 2})");
    EXPECT_LT(elapsed, 5s);
}

// NOLINTNEXTLINE
TEST(judge, longest_time_limit_does_not_expire) {
    Submission sub{"solution.sh", "sleep 0.5\necho hello\n", "", "hello\n"};
    sub.request.time_limit = runjudge::judge::max_time_limit;
    sub.request.compile_time_limit = runjudge::judge::max_time_limit;
    EXPECT_EQ(sub.judge(), success);
}

// NOLINTNEXTLINE
TEST(judge, execution_error_propagates_exit_code) {
    Submission sub{"solution.sh", "echo partial\nexit 3\n", "", "partial\n"};
    auto verdict = sub.judge();
    EXPECT_EQ(verdict, execution_error(3));
    EXPECT_EQ(verdict.to_json(), R"({"result": "Execution Error", "score": 3})");
}

// NOLINTNEXTLINE
TEST(judge, program_killed_by_signal) {
    Submission sub{"solution.sh", "kill -KILL $$\n", "", "\n"};
    EXPECT_EQ(sub.judge(), execution_error(EXIT_FAILURE));
}

// NOLINTNEXTLINE
TEST(judge, unsupported_language) {
    Submission sub{"solution.xyz", "echo hello\n", "", "hello\n"};
    auto verdict = sub.judge();
    EXPECT_EQ(
        verdict,
        (Verdict{
            .result = concat_tostr("Unable to determine language for ", sub.request.source),
            .exit_status = EXIT_FAILURE,
            .score = Verdict::Score::CompilerError,
        })
    );
    EXPECT_FALSE(sub.exists(runjudge::judge::capture_file_name));
}

// NOLINTNEXTLINE
TEST(judge, explicit_language_name) {
    Submission sub{"solution.xyz", "echo hello\n", "", "hello\n"};
    sub.request.language_name = "bash";
    EXPECT_EQ(sub.judge(), success);
}

// NOLINTNEXTLINE
TEST(judge, missing_input_is_a_judge_failure) {
    Submission sub{"solution.sh", "echo hello\n", "", "hello\n"};
    sub.request.input = sub.dir.path() + "nonexistent";
    EXPECT_THROW((void)sub.judge(), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(judge, verbose_logging) {
    Submission sub{"solution.sh", "echo hello\n", "", "hello\n"};
    {
        MemoryStream ms;
        Logger logger{ms.stream()};
        EXPECT_EQ(sub.judge(logger), success);
        EXPECT_EQ(ms.contents(), "");
    }
    {
        sub.request.verbose = true;
        MemoryStream ms;
        Logger logger{ms.stream()};
        EXPECT_EQ(sub.judge(logger), success);
        auto log = ms.contents();
        EXPECT_THAT(log, testing::HasSubstr("Language: Bash\n"));
        EXPECT_THAT(log, testing::HasSubstr("Executing solution... (bash "));
        EXPECT_THAT(log, testing::HasSubstr("Program exited with 0 after "));
        EXPECT_THAT(log, testing::Not(testing::HasSubstr("Compiling")));
    }
}
