#include <gtest/gtest.h>
#include <runjudge/concat_tostr.hh>
#include <runjudge/errmsg.hh>
#include <runjudge/macros/throw.hh>

// NOLINTNEXTLINE
TEST(macros, THROW_MACRO) {
    try {
        THROW("a ", 1, -42, "c", '.', false, ";");
        ADD_FAILURE();
    } catch (const std::runtime_error& e) {
        constexpr auto line = __LINE__;
        EXPECT_EQ(
            e.what(),
            concat_tostr(
                "a ", 1, -42, "c", '.', false, "; (thrown at ", __FILE__, ':', line - 3, ')'
            )
        );
    } catch (...) {
        ADD_FAILURE();
    }
}

// NOLINTNEXTLINE
TEST(errmsg, describes_errno) {
    EXPECT_EQ(errmsg(ENOENT), " - No such file or directory (os error 2)");
    errno = EACCES;
    EXPECT_EQ(errmsg(), " - Permission denied (os error 13)");
}
