#include "memory_stream.hh"

#include <cstdio>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <runjudge/logger.hh>
#include <string>

// NOLINTNEXTLINE
TEST(logger, writes_whole_lines) {
    MemoryStream ms;
    ASSERT_NE(ms.stream(), nullptr);
    Logger logger{ms.stream()};
    logger.label(false);
    logger("abc ", 42, ' ', true);
    {
        auto app = logger("x");
        app("y", 'z');
        app << -7;
        EXPECT_EQ(ms.contents(), "abc 42 true\n");
    }
    EXPECT_EQ(ms.contents(), "abc 42 true\nxyz-7\n");
}

// NOLINTNEXTLINE
TEST(logger, labels_lines_with_date) {
    MemoryStream ms;
    ASSERT_NE(ms.stream(), nullptr);
    Logger logger{ms.stream()};
    ASSERT_TRUE(logger.label());
    logger("Compiling a.c...");
    EXPECT_THAT(
        ms.contents(),
        testing::MatchesRegex(
            R"(\[ [0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2} \] Compiling a\.c\.\.\.)"
            "\n"
        )
    );
}

// NOLINTNEXTLINE
TEST(logger, dummy_logger_accepts_messages) {
    Logger logger{static_cast<FILE*>(nullptr)};
    logger("nothing ", 1, " happens");
}
