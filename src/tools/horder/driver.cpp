//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Subcommand dispatch for the horder tool.  Kept out of main.cpp so tests can
// drive the whole CLI with string streams.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Dispatches horder subcommands.

#include "cli.hpp"
#include "usage.hpp"

#include <iostream>
#include <string_view>

namespace horder::tools::cli
{

/// @brief Dispatch `argv[1]` to its subcommand handler.
/// @details The handler receives the arguments that follow the subcommand
///          name.  A missing or unknown subcommand prints usage and fails.
int runCLI(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err)
{
    if (argc < 2)
    {
        printUsage(err);
        return 1;
    }

    const std::string_view cmd = argv[1];
    if (cmd == "--version")
    {
        printVersion(out);
        return 0;
    }
    if (cmd == "-h" || cmd == "--help")
    {
        printUsage(out);
        return 0;
    }
    if (cmd == "scan")
        return cmdScan(argc - 2, argv + 2, out, err);
    if (cmd == "find")
        return cmdFind(argc - 2, argv + 2, out, err);
    if (cmd == "sync")
        return cmdSync(argc - 2, argv + 2, out, err);
    if (cmd == "session")
        return cmdSession(argc - 2, argv + 2, in, out, err);

    err << "error: unknown command '" << cmd << "'\n";
    printUsage(err);
    return 1;
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    return runCLI(argc, argv, std::cin, out, err);
}

} // namespace horder::tools::cli
