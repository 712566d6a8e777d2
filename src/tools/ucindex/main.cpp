//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the ucindex command-line tool.  The first argument
// selects the subcommand; everything after it is handed to the handler.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include <iostream>
#include <string_view>

using namespace ucindex::tools;

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printUsage(std::cerr);
        return 1;
    }

    const std::string_view cmd = argv[1];
    const ArgvView rest{argc - 2, argv + 2};

    if (cmd == "--version")
    {
        printVersion(std::cout);
        return 0;
    }
    if (cmd == "-h" || cmd == "--help")
    {
        printUsage(std::cout);
        return 0;
    }
    if (cmd == "scan")
        return cmdScan(rest, std::cout, std::cerr);
    if (cmd == "outline")
        return cmdOutline(rest, std::cout, std::cerr);
    if (cmd == "highlight")
        return cmdHighlight(rest, std::cout, std::cerr);
    if (cmd == "complete")
        return cmdComplete(rest, std::cout, std::cerr);
    if (cmd == "show")
        return cmdShow(rest, std::cout, std::cerr);

    std::cerr << "error: unknown command: " << cmd << "\n\n";
    printUsage(std::cerr);
    return 1;
}
