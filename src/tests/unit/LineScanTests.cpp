//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "core/LineScan.hpp"

#include <string>
#include <vector>

using namespace horder::core::scan;

TEST(LineScan, ClassifiesLines)
{
    EXPECT_TRUE(isPreprocessorLine("  #include <x>"));
    EXPECT_FALSE(isPreprocessorLine("int a; // #not"));
    EXPECT_TRUE(isCommentOnlyLine("\t// note"));
    EXPECT_FALSE(isCommentOnlyLine("/* block */"));
    EXPECT_TRUE(endsWithSemicolon("void f();  \t"));
    EXPECT_FALSE(endsWithSemicolon("void f(); // trailing"));
}

TEST(LineScan, LastCallLikeIdentifier)
{
    EXPECT_EQ(lastCallLikeIdentifier("int main(int argc, char **argv);").value_or(""), "main");
    EXPECT_EQ(lastCallLikeIdentifier("void f() noexcept(true);").value_or(""), "noexcept");
    EXPECT_FALSE(lastCallLikeIdentifier("x = 2 * (y + 1);").has_value());
    EXPECT_EQ(lastCallLikeIdentifier("9lives(int);").value_or(""), "lives");
}

TEST(LineScan, FindBlockEndCountsBracesFlat)
{
    const std::vector<std::string> lines{"void f()", "{", "  const char *s = \"}\";", "}", "}"};
    // The brace inside the string literal closes the body early.
    EXPECT_EQ(findBlockEnd(lines, 1), 2u);

    const std::vector<std::string> open{"{", "  {", "  }"};
    EXPECT_EQ(findBlockEnd(open, 0), 0u);
}
