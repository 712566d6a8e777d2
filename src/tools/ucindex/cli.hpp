//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/ucindex/cli.hpp
// Purpose: Option parsing and subcommand handlers of the ucindex driver.
// Key invariants: Handlers write results to `out` and problems to `err` and
//                 return a process exit status.
// Ownership/Lifetime: N/A.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tools/common/ArgvView.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace ucindex::service
{
class IndexService;
}

namespace ucindex::tools
{

/// @brief Environment variable consulted when no `--root` is given.
inline constexpr const char *kRootEnvVar = "UCINDEX_ROOT";

/// @brief Configuration shared by every subcommand.
struct CliOptions
{
    /// @brief Game root holding the package folders.
    std::string rootPath{};

    /// @brief Enable `[DEBUG]` traces on stderr.
    bool debug = false;

    /// @brief Attribute members of class-less files to the previous file's class.
    bool carryClass = false;

    /// @brief Print highlight spans as the delta-encoded integer stream.
    bool encoded = false;

    /// @brief `-h` / `--help` was given.
    bool help = false;

    /// @brief Non-option arguments in order.
    std::vector<std::string> positional{};
};

/// @brief Result of attempting to parse a shared CLI option.
enum class OptionParseResult
{
    NotMatched, ///< Argument does not correspond to a shared option.
    Parsed,     ///< Argument consumed and reflected in the configuration.
    Error       ///< Argument looked like a shared option but was malformed.
};

/// @brief Parse the option at @p index, advancing it past consumed values.
OptionParseResult parseSharedOption(int &index, ArgvView args, CliOptions &opts);

/// @brief Parse every argument of a subcommand.
/// @return False after printing a message to @p err on malformed or unknown options.
bool parseCommandLine(ArgvView args, CliOptions &opts, std::ostream &err);

/// @brief `--root` when given, otherwise the UCINDEX_ROOT environment variable.
[[nodiscard]] std::string resolveRootPath(const CliOptions &opts);

/// @brief Rebuild @p svc from resolveRootPath(@p opts).
/// @param required When false and no root is configured, @p svc keeps its
///        empty table and the call succeeds.
/// @return False after printing diagnostics to @p err on failure.
bool rebuildFromOptions(const CliOptions &opts,
                        service::IndexService &svc,
                        std::ostream &err,
                        bool required);

int cmdScan(ArgvView args, std::ostream &out, std::ostream &err);
int cmdOutline(ArgvView args, std::ostream &out, std::ostream &err);
int cmdHighlight(ArgvView args, std::ostream &out, std::ostream &err);
int cmdComplete(ArgvView args, std::ostream &out, std::ostream &err);
int cmdShow(ArgvView args, std::ostream &out, std::ostream &err);

} // namespace ucindex::tools
