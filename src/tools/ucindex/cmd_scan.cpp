//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `ucindex scan`: rebuild the index of a game folder and list every
// class with its member counts, followed by a summary of the walk.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "service/IndexService.hpp"

namespace ucindex::tools
{

/// @brief Handle `ucindex scan <root>`.
///
/// Output format, one line per class in name order:
/// `<Package>.<Class> functions=<n> variables=<m>`, then a summary line.
/// Skipped packages and files are reported as warnings on @p err and do not
/// change the exit status.
///
/// @return 0 on success, 1 on usage errors or when the root is unreadable.
int cmdScan(ArgvView args, std::ostream &out, std::ostream &err)
{
    CliOptions opts;
    if (!parseCommandLine(args, opts, err))
    {
        printUsage(err);
        return 1;
    }
    if (opts.help)
    {
        printUsage(out);
        return 0;
    }
    if (opts.positional.size() > 1 || (opts.positional.size() == 1 && !opts.rootPath.empty()))
    {
        err << "error: scan takes exactly one root folder\n";
        return 1;
    }
    if (!opts.positional.empty())
        opts.rootPath = opts.positional.front();

    index::ScanOptions scanOptions;
    scanOptions.carryClassAcrossFiles = opts.carryClass;
    service::IndexService svc(scanOptions);
    if (!rebuildFromOptions(opts, svc, err, /*required=*/true))
        return 1;

    const auto table = svc.snapshot();
    for (const auto &[name, record] : *table)
    {
        out << record.package << '.' << name << " functions=" << record.functions.size()
            << " variables=" << record.variables.size() << "\n";
    }

    const index::ScanStats stats = svc.lastStats();
    out << table->size() << " classes in " << stats.packagesScanned << " packages ("
        << stats.filesIndexed << " files";
    if (stats.packagesSkipped != 0 || stats.filesSkipped != 0)
    {
        out << ", skipped " << stats.packagesSkipped << " packages and " << stats.filesSkipped
            << " files";
    }
    out << ")\n";
    return 0;
}

} // namespace ucindex::tools
