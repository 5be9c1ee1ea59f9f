//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `fountain` CLI tool.

#include "support/diag_expected.hpp"
#include "tools/fountain/cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    auto config = fountain::tools::parseArgs(argc - 1, argv + 1);
    if (!config)
    {
        fountain::support::printDiag(config.error(), std::cerr);
        std::cerr << '\n';
        fountain::tools::printUsage(std::cerr);
        return fountain::tools::kExitUsage;
    }
    return fountain::tools::runCli(config.value(), std::cin, std::cout, std::cerr);
}
