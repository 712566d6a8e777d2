//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option parsing shared by the ucindex subcommands.  Each handler
// calls parseCommandLine() and then only looks at the resulting CliOptions.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "service/IndexService.hpp"
#include "support/debug_log.hpp"

#include <cstdlib>
#include <string_view>

namespace ucindex::tools
{

/// @brief Parse a ucindex option and update the shared options structure.
///
/// @details Recognised options are `--root DIR` (also `--root=DIR`),
///          `--debug`, `--carry-class`, `--encoded` and `-h`/`--help`.
///          Options that do not match are reported as NotMatched so the caller
///          can treat them as positional arguments or reject them.
///
/// @param index Current position in @p args; advanced past a consumed value.
/// @param args Arguments following the subcommand name.
/// @param opts Structure receiving parsed option values.
OptionParseResult parseSharedOption(int &index, ArgvView args, CliOptions &opts)
{
    const std::string_view arg = args.at(index);
    if (arg == "--root")
    {
        if (index + 1 >= args.size())
            return OptionParseResult::Error;
        opts.rootPath = std::string(args.at(++index));
        return OptionParseResult::Parsed;
    }
    if (arg.starts_with("--root="))
    {
        opts.rootPath = std::string(arg.substr(std::string_view("--root=").size()));
        return opts.rootPath.empty() ? OptionParseResult::Error : OptionParseResult::Parsed;
    }
    if (arg == "--debug")
    {
        opts.debug = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--carry-class")
    {
        opts.carryClass = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--encoded")
    {
        opts.encoded = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "-h" || arg == "--help")
    {
        opts.help = true;
        return OptionParseResult::Parsed;
    }
    return OptionParseResult::NotMatched;
}

bool parseCommandLine(ArgvView args, CliOptions &opts, std::ostream &err)
{
    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);
        switch (parseSharedOption(i, args, opts))
        {
            case OptionParseResult::Parsed:
                continue;
            case OptionParseResult::Error:
                err << "error: " << arg << " requires a value\n";
                return false;
            case OptionParseResult::NotMatched:
                break;
        }
        if (arg.size() > 1 && arg.front() == '-')
        {
            err << "error: unknown option: " << arg << "\n";
            return false;
        }
        opts.positional.emplace_back(arg);
    }

    if (opts.debug)
        support::setDebugLogging(true);
    return true;
}

std::string resolveRootPath(const CliOptions &opts)
{
    if (!opts.rootPath.empty())
        return opts.rootPath;
    if (const char *env = std::getenv(kRootEnvVar))
        return env;
    return {};
}

bool rebuildFromOptions(const CliOptions &opts,
                        service::IndexService &svc,
                        std::ostream &err,
                        bool required)
{
    const std::string root = resolveRootPath(opts);
    if (root.empty())
    {
        if (!required)
            return true;
        err << "error: no game root given (use --root DIR or set " << kRootEnvVar << ")\n";
        return false;
    }

    auto rebuilt = svc.rebuild(root);
    if (!rebuilt)
    {
        support::printDiag(rebuilt.error(), err);
        return false;
    }
    svc.printLastDiagnostics(err);
    return true;
}

} // namespace ucindex::tools
