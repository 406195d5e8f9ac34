//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ImplementationLocatorTests.cpp
// Purpose: Verify body discovery: brace window, declaration rejection, brace
//          matching and unreadable-file handling.
// Key invariants: Spans are inclusive and 0-based; result order is file,
//                 then line, then name.
// Ownership/Lifetime: Tests own the in-memory workspace.
// Links: src/core/ImplementationLocator.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "core/ImplementationLocator.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tests/common/MemoryWorkspace.hpp"

#include <sstream>
#include <string>
#include <vector>

using horder::core::Implementation;
using horder::core::ImplementationLocator;
using horder::core::LineSpan;
using horder::tests::MemoryWorkspace;

TEST(ImplementationLocator, EmptyNamesReadsNothing)
{
    MemoryWorkspace ws;
    ws.setFile("a.cpp", "void f() {}\n");
    ImplementationLocator locator(ws);

    const auto impls = locator.locate({}, {"a.cpp"});
    EXPECT_TRUE(impls.empty());
    EXPECT_TRUE(ws.reads.empty());
}

TEST(ImplementationLocator, SingleLineBody)
{
    const auto impls = ImplementationLocator::locateInText({"f"}, "void f() { return; }\n", "a.cpp");
    ASSERT_EQ(impls.size(), 1u);
    EXPECT_EQ(impls[0].name, "f");
    EXPECT_EQ(impls[0].definitionLine, 0u);
    EXPECT_EQ(impls[0].span, (LineSpan{0, 0}));
    EXPECT_EQ(impls[0].sourceFile, "a.cpp");
}

TEST(ImplementationLocator, NestedBracesEndAtOwnClose)
{
    const std::string text = "int g(int x)\n"       // 0
                             "{\n"                  // 1
                             "    if (x) {\n"       // 2
                             "        return 1;\n"  // 3
                             "    }\n"              // 4
                             "    return 0;\n"      // 5
                             "}\n"                  // 6
                             "int after() { return 2; }\n";
    const auto impls = ImplementationLocator::locateInText({"g"}, text, "g.cpp");
    ASSERT_EQ(impls.size(), 1u);
    EXPECT_EQ(impls[0].span, (LineSpan{0, 6}));
}

TEST(ImplementationLocator, DeclarationIsNotADefinition)
{
    const std::string text = "void h(int);\n"
                             "struct S { int v; };\n";
    EXPECT_TRUE(ImplementationLocator::locateInText({"h"}, text, "h.cpp").empty());
}

TEST(ImplementationLocator, CallStatementIsNotADefinition)
{
    // A call statement ending in ';' stops the brace search.
    const std::string text = "void caller()\n"
                             "{\n"
                             "    helper(1);\n"
                             "}\n";
    const auto impls = ImplementationLocator::locateInText({"helper", "caller"}, text, "c.cpp");
    ASSERT_EQ(impls.size(), 1u);
    EXPECT_EQ(impls[0].name, "caller");
    EXPECT_EQ(impls[0].span, (LineSpan{0, 3}));
}

TEST(ImplementationLocator, BraceBeyondWindowIsMissed)
{
    std::string text = "void spread(\n";
    for (int i = 0; i < 30; ++i)
        text += "    int p" + std::to_string(i) + ",\n";
    text += "    int last)\n{\n}\n";
    EXPECT_TRUE(ImplementationLocator::locateInText({"spread"}, text, "s.cpp").empty());
}

TEST(ImplementationLocator, BraceOnLastWindowLineIsFound)
{
    std::string text = "void edge(\n";
    for (int i = 0; i < 28; ++i)
        text += "    int p" + std::to_string(i) + ",\n";
    text += "    int last) {\n}\n";
    const auto impls = ImplementationLocator::locateInText({"edge"}, text, "e.cpp");
    ASSERT_EQ(impls.size(), 1u);
    EXPECT_EQ(impls[0].span, (LineSpan{0, 30}));
}

TEST(ImplementationLocator, CommentLinesAreSkipped)
{
    const std::string text = "// see compute() { for details }\n"
                             "int compute() { return 4; }\n";
    const auto impls = ImplementationLocator::locateInText({"compute"}, text, "c.cpp");
    ASSERT_EQ(impls.size(), 1u);
    EXPECT_EQ(impls[0].definitionLine, 1u);
}

TEST(ImplementationLocator, SubstringMatchHasNoWordBoundary)
{
    const auto impls =
        ImplementationLocator::locateInText({"name"}, "void rename(int) { }\n", "r.cpp");
    ASSERT_EQ(impls.size(), 1u);
    EXPECT_EQ(impls[0].name, "name");
}

TEST(ImplementationLocator, SpaceBeforeParenIsNotMatched)
{
    EXPECT_TRUE(ImplementationLocator::locateInText({"f"}, "void f (void) { }\n", "f.cpp").empty());
}

TEST(ImplementationLocator, UnbalancedBodyEndsAtBraceLine)
{
    const std::string text = "void open_ended()\n"
                             "{\n"
                             "    int x = 0;\n";
    const auto impls = ImplementationLocator::locateInText({"open_ended"}, text, "o.cpp");
    ASSERT_EQ(impls.size(), 1u);
    EXPECT_EQ(impls[0].span, (LineSpan{0, 1}));
}

TEST(ImplementationLocator, SeveralNamesOnOneLineFollowNameOrder)
{
    const auto impls =
        ImplementationLocator::locateInText({"beta", "alpha"}, "int alpha() { return beta(); }\n", "x.cpp");
    ASSERT_EQ(impls.size(), 2u);
    EXPECT_EQ(impls[0].name, "beta");
    EXPECT_EQ(impls[1].name, "alpha");
}

TEST(ImplementationLocator, DuplicateNamesReportedOnce)
{
    const auto impls = ImplementationLocator::locateInText({"f", "f"}, "void f() {}\n", "f.cpp");
    EXPECT_EQ(impls.size(), 1u);
}

TEST(ImplementationLocator, OverloadsAreAllReported)
{
    const std::string text = "int area(int s) { return s * s; }\n"
                             "double area(double r) { return 3.14 * r * r; }\n";
    const auto impls = ImplementationLocator::locateInText({"area"}, text, "a.cpp");
    ASSERT_EQ(impls.size(), 2u);
    EXPECT_EQ(impls[0].definitionLine, 0u);
    EXPECT_EQ(impls[1].definitionLine, 1u);
}

TEST(ImplementationLocator, FilesScannedInGivenOrder)
{
    MemoryWorkspace ws;
    ws.setFile("b.cpp", "void g() {}\n");
    ws.setFile("a.cpp", "void f() {}\nvoid g() {}\n");
    ImplementationLocator locator(ws);

    const auto impls = locator.locate({"f", "g"}, {"b.cpp", "a.cpp"});
    ASSERT_EQ(impls.size(), 3u);
    EXPECT_EQ(impls[0].sourceFile, "b.cpp");
    EXPECT_EQ(impls[1].sourceFile, "a.cpp");
    EXPECT_EQ(impls[1].name, "f");
    EXPECT_EQ(impls[2].name, "g");
    EXPECT_EQ(ws.reads, (std::vector<std::string>{"b.cpp", "a.cpp"}));
}

TEST(ImplementationLocator, UnreadableFileIsSkippedWithWarning)
{
    MemoryWorkspace ws;
    ws.makeUnreadable("locked.cpp");
    ws.setFile("ok.cpp", "void f() {}\n");

    horder::support::DiagnosticEngine diags;
    horder::support::SourceManager sm;
    ImplementationLocator locator(ws, &diags, &sm);

    const auto impls = locator.locate({"f"}, {"locked.cpp", "ok.cpp"});
    ASSERT_EQ(impls.size(), 1u);
    EXPECT_EQ(impls[0].sourceFile, "ok.cpp");

    EXPECT_EQ(diags.warningCount(), 1u);
    EXPECT_EQ(diags.errorCount(), 0u);
    std::ostringstream os;
    diags.printAll(os, &sm);
    EXPECT_EQ(os.str(), "locked.cpp: warning: skipped unreadable file: unable to open locked.cpp\n");
}

TEST(ImplementationLocator, UniqueNamesKeepsFirstDeclarationOrder)
{
    std::vector<horder::core::Prototype> protos{
        {"b", "void b();", {0, 0}}, {"a", "void a();", {1, 1}}, {"b", "int b(int);", {2, 2}}};
    EXPECT_EQ(ImplementationLocator::uniqueNames(protos), (std::vector<std::string>{"b", "a"}));
}
