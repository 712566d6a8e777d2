//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_loader.cpp
// Purpose: Standardise how the scanner and the CLI load source files.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned buffer is owned by the caller.
//
//===----------------------------------------------------------------------===//

#include "support/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace ucindex::support
{

Expected<std::string> loadSourceFile(const std::string &path, SourceLoc loc)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Expected<std::string>(makeIoError(Severity::Error, "unable to open " + path, loc));

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return Expected<std::string>(makeIoError(
            Severity::Error, "source file too large or unseekable: " + path, loc));
    }

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            return Expected<std::string>(makeIoError(Severity::Error, "read failed: " + path, loc));
        return Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return Expected<std::string>(
            makeIoError(Severity::Error, "out of memory reading " + path, loc));
    }
}

} // namespace ucindex::support
