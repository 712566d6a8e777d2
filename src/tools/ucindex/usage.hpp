//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace ucindex::tools
{

void printVersion(std::ostream &os);
void printUsage(std::ostream &os);

} // namespace ucindex::tools
