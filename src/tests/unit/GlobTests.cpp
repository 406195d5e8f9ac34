//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/GlobTests.cpp
// Purpose: Verify the candidate-file glob dialect.
// Key invariants: '*' and '?' never cross '/', "**/" matches zero or more
//                 directories, braces expand to alternatives.
// Links: src/support/glob.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "core/Workspace.hpp"
#include "support/glob.hpp"

#include <string>
#include <vector>

using horder::support::expandBraces;
using horder::support::globMatch;
using horder::support::GlobPattern;

TEST(Glob, StarStaysInsideSegment)
{
    EXPECT_TRUE(globMatch("*.cpp", "main.cpp"));
    EXPECT_FALSE(globMatch("*.cpp", "src/main.cpp"));
    EXPECT_TRUE(globMatch("src/*.cpp", "src/main.cpp"));
    EXPECT_TRUE(globMatch("src/?.c", "src/a.c"));
    EXPECT_FALSE(globMatch("src?a.c", "src/a.c"));
}

TEST(Glob, DoubleStarMatchesAnyDepth)
{
    EXPECT_TRUE(globMatch("**/*.cpp", "main.cpp"));
    EXPECT_TRUE(globMatch("**/*.cpp", "a/b/c/main.cpp"));
    EXPECT_TRUE(globMatch("src/**", "src/a/b"));
    EXPECT_FALSE(globMatch("**/lib/*.c", "mylib/x.c"));
    EXPECT_TRUE(globMatch("**/lib/*.c", "deep/lib/x.c"));
}

TEST(Glob, BracesExpandInOrder)
{
    EXPECT_EQ(expandBraces("*.{c,h}"), (std::vector<std::string>{"*.c", "*.h"}));
    EXPECT_EQ(expandBraces("{a,b{1,2}}.x"), (std::vector<std::string>{"a.x", "b1.x", "b2.x"}));
    EXPECT_EQ(expandBraces("plain"), (std::vector<std::string>{"plain"}));
}

TEST(Glob, DefaultCandidateQuery)
{
    const GlobPattern include(horder::core::kDefaultCandidateGlob);
    const GlobPattern exclude(horder::core::kDefaultExcludeGlob);

    for (const char *path : {"a.cpp", "src/b.cc", "c.cxx", "d.c", "e.hpp", "f.ccpp"})
        EXPECT_TRUE(include.matches(path)) << path;
    EXPECT_FALSE(include.matches("g.h"));
    EXPECT_FALSE(include.matches("notes.cpp.txt"));

    EXPECT_TRUE(exclude.matches("node_modules/pkg/x.cpp"));
    EXPECT_TRUE(exclude.matches("web/node_modules/x.c"));
    EXPECT_TRUE(exclude.matches("node_modules/"));
    EXPECT_FALSE(exclude.matches("src/modules/x.cpp"));
}

TEST(Glob, EmptyPatternMatchesNothing)
{
    const GlobPattern none("");
    EXPECT_TRUE(none.empty());
    EXPECT_FALSE(none.matches("a.cpp"));
}
