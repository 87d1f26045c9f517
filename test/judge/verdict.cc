#include <gtest/gtest.h>
#include <runjudge/judge/verdict.hh>
#include <string>

using runjudge::judge::json_quoted;
using runjudge::judge::Verdict;

// NOLINTNEXTLINE
TEST(judge_verdict, to_json) {
    EXPECT_EQ(
        (Verdict{
             .result = "Success",
             .exit_status = EXIT_SUCCESS,
             .score = Verdict::Score::ProgramSuccess,
         })
            .to_json(),
        R"({"result": "Success", "score": 6})"
    );
    EXPECT_EQ(
        (Verdict{
             .result = "Compilation Error",
             .score = Verdict::Score::CompilerError,
         })
            .to_json(),
        R"({"result": "Compilation Error", "score": 1})"
    );
    EXPECT_EQ(
        (Verdict{
             .result = "Execution Error",
             .exit_status = 3,
             .score = Verdict::Score::ExecutionError,
         })
            .to_json(),
        R"({"result": "Execution Error", "score": 3})"
    );
}

// NOLINTNEXTLINE
TEST(judge_verdict, score_values) {
    EXPECT_EQ(static_cast<int>(Verdict::Score::CompilerError), 1);
    EXPECT_EQ(static_cast<int>(Verdict::Score::TimeLimitExceeded), 2);
    EXPECT_EQ(static_cast<int>(Verdict::Score::ExecutionError), 3);
    EXPECT_EQ(static_cast<int>(Verdict::Score::WrongAnswer), 4);
    EXPECT_EQ(static_cast<int>(Verdict::Score::WrongFormatting), 5);
    EXPECT_EQ(static_cast<int>(Verdict::Score::ProgramSuccess), 6);
}

// NOLINTNEXTLINE
TEST(judge_verdict, json_quoted) {
    EXPECT_EQ(json_quoted(""), R"("")");
    EXPECT_EQ(json_quoted("Wrong Answer"), R"("Wrong Answer")");
    EXPECT_EQ(json_quoted(R"(a"b\c)"), R"("a\"b\\c")");
    EXPECT_EQ(json_quoted("\b\f\n\r\t"), R"("\b\f\n\r\t")");
    EXPECT_EQ(json_quoted(std::string("\0\x01\x1f", 3)), R"("\u0000\u0001\u001f")");
    EXPECT_EQ(json_quoted("zażółć /"), "\"zażółć /\"");
}
