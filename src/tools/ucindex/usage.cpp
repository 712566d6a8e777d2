//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"

#include "ucindex/version.hpp"

namespace ucindex::tools
{

void printVersion(std::ostream &os)
{
    os << "ucindex v" << UCINDEX_VERSION_STR << "\n";
    os << "UnrealScript package indexer\n";
}

void printUsage(std::ostream &os)
{
    os << "ucindex v" << UCINDEX_VERSION_STR << " - UnrealScript package indexer\n"
       << "\n"
       << "Usage: ucindex scan <root> [--carry-class]\n"
       << "       ucindex outline <file.uc>\n"
       << "       ucindex highlight [--root DIR] [--encoded] <file.uc>\n"
       << "       ucindex complete [--root DIR]\n"
       << "       ucindex show [--root DIR] <ClassName>\n"
       << "\n"
       << "Options:\n"
       << "  --root DIR                     Game folder holding the package folders\n"
       << "  --carry-class                  Keep the current class across file boundaries\n"
       << "  --encoded                      Print highlights as a delta-encoded token stream\n"
       << "  --debug                        Trace the scan on stderr\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Environment:\n"
       << "  UCINDEX_ROOT                   Default for --root\n"
       << "  UCINDEX_DEBUG                  Non-empty value enables --debug\n"
       << "\n"
       << "Lines and columns are printed 1-based.\n";
}

} // namespace ucindex::tools
