//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `[DEBUG]` trace channel used by the scanner and the CLI.  The
// flag starts from the UCINDEX_DEBUG environment variable and may be flipped
// by `--debug`.
//
//===----------------------------------------------------------------------===//

#include "support/debug_log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>

namespace ucindex::support
{
namespace
{
std::atomic<bool> &debugFlag() noexcept
{
    static std::atomic<bool> enabled = []
    {
        if (const char *flag = std::getenv(kDebugEnvVar))
            return flag[0] != '\0';
        return false;
    }();
    return enabled;
}
} // namespace

bool isDebugLoggingEnabled() noexcept
{
    return debugFlag().load(std::memory_order_relaxed);
}

void setDebugLogging(bool enabled) noexcept
{
    debugFlag().store(enabled, std::memory_order_relaxed);
}

void debugLog(std::string_view tag, std::string_view message)
{
    if (!isDebugLoggingEnabled())
        return;
    std::cerr << "[DEBUG][" << tag << "] " << message << "\n";
}

} // namespace ucindex::support
