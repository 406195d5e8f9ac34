//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for the horder command-line tool.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return horder::tools::cli::runCLI(argc, argv, std::cout, std::cerr);
}
