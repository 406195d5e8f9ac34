//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tools/HorderCliTests.cpp
// Purpose: Drive the horder CLI end to end through runCLI with string
//          streams and a temporary workspace.
// Key invariants: Informational lines go to stdout, `error:` lines to stderr;
//                 exit status is 0 for success and empty results.
// Ownership/Lifetime: Each test owns a temporary directory and its streams.
// Links: src/tools/horder/driver.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/common/TempDir.hpp"
#include "tools/horder/cli.hpp"

#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

using horder::tests::TempDir;

namespace
{
constexpr const char *kHeader = "#pragma once\n"
                                "void init();\n"
                                "int compute(int x);\n";

constexpr const char *kSource = "#include \"calc.h\"\n"
                                "\n"
                                "int compute(int x)\n"
                                "{\n"
                                "    return x * 2;\n"
                                "}\n"
                                "\n"
                                "void init()\n"
                                "{\n"
                                "}\n";

struct CliRun
{
    int rc = 0;
    std::string out;
    std::string err;
};

CliRun runHorder(std::initializer_list<std::string> args, const std::string &input = {})
{
    std::vector<std::string> storage{"horder"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv;
    for (auto &arg : storage)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream err;
    CliRun run;
    run.rc = horder::tools::cli::runCLI(static_cast<int>(storage.size()), argv.data(), in, out, err);
    run.out = out.str();
    run.err = err.str();
    return run;
}

struct CliFixture : ::testing::Test
{
    CliFixture()
    {
        header = dir.write("inc/calc.h", kHeader);
        source = dir.write("src/calc.cpp", kSource);
        root = dir.path().string();
    }

    TempDir dir;
    std::string header;
    std::string source;
    std::string root;
};
} // namespace

TEST(HorderCli, VersionAndUsage)
{
    const auto version = runHorder({"--version"});
    EXPECT_EQ(version.rc, 0);
    EXPECT_EQ(version.out.rfind("horder v", 0), 0u);

    const auto help = runHorder({"--help"});
    EXPECT_EQ(help.rc, 0);
    EXPECT_NE(help.out.find("Usage:"), std::string::npos);

    const auto none = runHorder({});
    EXPECT_EQ(none.rc, 1);
    EXPECT_NE(none.err.find("Usage:"), std::string::npos);

    const auto unknown = runHorder({"reorder"});
    EXPECT_EQ(unknown.rc, 1);
    EXPECT_NE(unknown.err.find("error: unknown command 'reorder'"), std::string::npos);
}

TEST_F(CliFixture, ScanListsPrototypes)
{
    const auto run = runHorder({"scan", header, "--root", root});
    EXPECT_EQ(run.rc, 0) << run.err;
    EXPECT_EQ(run.out, "Found 2 prototype(s) in " + header + "\n  2: init\n  3: compute\n");
    EXPECT_TRUE(run.err.empty());
}

TEST_F(CliFixture, ScanVerbosePrintsSignatures)
{
    dir.write("inc/wide.h", "int combine(int a,\n            int b);\n");
    const auto run = runHorder({"scan", dir.file("inc/wide.h"), "--root", root, "--verbose"});
    EXPECT_EQ(run.rc, 0);
    EXPECT_NE(run.out.find("  1: combine  int combine(int a, int b);\n"), std::string::npos);
}

TEST_F(CliFixture, ScanRejectsNonHeader)
{
    const auto run = runHorder({"scan", source, "--root", root});
    EXPECT_EQ(run.rc, 1);
    EXPECT_TRUE(run.out.empty());
    EXPECT_EQ(run.err, "error: '" + source + "' is not recognized as a header\n");
}

TEST_F(CliFixture, FindPrintsPickList)
{
    const auto run = runHorder({"find", header, "--root", root});
    EXPECT_EQ(run.rc, 0) << run.err;
    EXPECT_EQ(run.out,
              "Found 2 implementation(s) across workspace for header " + header +
                  "\n  compute — src/calc.cpp:3\n  init — src/calc.cpp:8\n");
}

TEST_F(CliFixture, SyncWithoutTargetListsCandidates)
{
    const auto run = runHorder({"sync", header, "--root", root});
    EXPECT_EQ(run.rc, 1);
    EXPECT_EQ(run.out, "Candidate files:\n  src/calc.cpp\n");
    EXPECT_EQ(run.err, "error: choose a target file\n");
}

TEST_F(CliFixture, SyncDryRunLeavesFileAlone)
{
    const auto run = runHorder({"sync", header, source, "--dry-run", "--root", root});
    EXPECT_EQ(run.rc, 0) << run.err;
    EXPECT_EQ(run.out,
              "Would replace lines 3-10 of src/calc.cpp with:\n"
              "void init()\n{\n}\n\nint compute(int x)\n{\n    return x * 2;\n}\n");
    EXPECT_EQ(dir.read("src/calc.cpp"), kSource);
}

TEST_F(CliFixture, SyncRewritesFile)
{
    const auto run = runHorder({"sync", header, source, "--root", root});
    EXPECT_EQ(run.rc, 0) << run.err;
    EXPECT_EQ(run.out, "Reordered functions to match header prototype order.\n");
    EXPECT_EQ(dir.read("src/calc.cpp"),
              "#include \"calc.h\"\n"
              "\n"
              "void init()\n"
              "{\n"
              "}\n"
              "\n"
              "int compute(int x)\n"
              "{\n"
              "    return x * 2;\n"
              "}\n");

    // Already in order: a second run produces the same text.
    const auto again = runHorder({"sync", header, source, "--root", root});
    EXPECT_EQ(again.rc, 0);
    EXPECT_EQ(dir.read("src/calc.cpp").find("void init()"), 19u);
}

TEST_F(CliFixture, SyncReportsEmptyResults)
{
    dir.write("inc/lonely.h", "void lonely();\n");
    const auto none = runHorder({"sync", dir.file("inc/lonely.h"), source, "--root", root});
    EXPECT_EQ(none.rc, 0);
    EXPECT_EQ(none.out, "No implementations found in workspace.\n");

    const std::string other = dir.write("src/other.cpp", "static int unrelated() { return 0; }\n");
    const auto elsewhere = runHorder({"sync", header, other, "--root", root});
    EXPECT_EQ(elsewhere.rc, 0);
    EXPECT_EQ(elsewhere.out, "No implementations from selected header found in this file.\n");
}

TEST_F(CliFixture, QuietSuppressesInformation)
{
    const auto run = runHorder({"sync", header, source, "--root", root, "--quiet"});
    EXPECT_EQ(run.rc, 0);
    EXPECT_TRUE(run.out.empty());
}

TEST_F(CliFixture, OptionErrors)
{
    const auto badLimit = runHorder({"find", header, "--root", root, "--limit", "0"});
    EXPECT_EQ(badLimit.rc, 1);
    EXPECT_NE(badLimit.err.find("--limit expects a positive integer"), std::string::npos);

    const auto missing = runHorder({"find", header, "--root"});
    EXPECT_EQ(missing.rc, 1);
    EXPECT_NE(missing.err.find("missing value for --root"), std::string::npos);

    const auto unknown = runHorder({"scan", header, "--sorted"});
    EXPECT_EQ(unknown.rc, 1);
    EXPECT_NE(unknown.err.find("unknown option '--sorted'"), std::string::npos);
}

TEST_F(CliFixture, ManifestErrorStopsCommand)
{
    dir.write("horder.project", "order alpha\n");
    const auto run = runHorder({"scan", header, "--root", root});
    EXPECT_EQ(run.rc, 1);
    EXPECT_NE(run.err.find(":1: unknown directive 'order'"), std::string::npos);
}

TEST_F(CliFixture, IncludeOverrideNarrowsCandidates)
{
    dir.write("tests/calc_test.cpp", "void init() { }\n");
    const auto all = runHorder({"find", header, "--root", root});
    EXPECT_NE(all.out.find("tests/calc_test.cpp"), std::string::npos);

    const auto narrowed = runHorder({"find", header, "--root", root, "--include", "src/**"});
    EXPECT_EQ(narrowed.out.find("tests/calc_test.cpp"), std::string::npos);
    EXPECT_NE(narrowed.out.find("src/calc.cpp"), std::string::npos);
}

TEST_F(CliFixture, SessionKeepsCacheBetweenCommands)
{
    const std::string script = "# warm-up\n"
                               "find " + header + "\n"
                               "scan " + header + "\n"
                               "find " + header + "\n"
                               "invalidate " + header + "\n"
                               "sync " + header + " " + source + "\n"
                               "quit\n"
                               "scan " + header + "\n";
    const auto run = runHorder({"session", "--root", root}, script);

    EXPECT_EQ(run.rc, 1);
    const std::string noCache = "error: No cached prototypes — run \"scan\" first.\n";
    EXPECT_EQ(run.err, noCache + noCache);

    EXPECT_NE(run.out.find("Found 2 prototype(s) in " + header), std::string::npos);
    EXPECT_NE(run.out.find("Found 2 implementation(s) across workspace"), std::string::npos);
    EXPECT_NE(run.out.find("Invalidated " + header), std::string::npos);
    // Nothing after `quit` runs.
    EXPECT_EQ(run.out.find("Found 2 prototype(s)"), run.out.rfind("Found 2 prototype(s)"));
    EXPECT_EQ(dir.read("src/calc.cpp"), kSource);
}

TEST_F(CliFixture, SessionSyncUsesCachedPrototypes)
{
    const std::string script = "scan " + header + "\n"
                               "sync " + header + " " + source + " --dry-run\n"
                               "sync " + header + " " + source + "\n";
    const auto run = runHorder({"session", "--root", root}, script);
    EXPECT_EQ(run.rc, 0) << run.err;
    EXPECT_NE(run.out.find("Would replace lines 3-10 of src/calc.cpp with:"), std::string::npos);
    EXPECT_NE(run.out.find("Reordered functions to match header prototype order."), std::string::npos);
    EXPECT_EQ(dir.read("src/calc.cpp").find("void init()"), 19u);
}
