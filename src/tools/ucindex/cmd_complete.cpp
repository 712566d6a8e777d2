//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the index query commands: `ucindex complete` dumps the completion
// vocabulary and `ucindex show` prints the record of one class.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "analysis/Completion.hpp"
#include "service/IndexService.hpp"

namespace ucindex::tools
{

namespace
{

void printList(std::ostream &out, const char *label, const std::vector<std::string> &names)
{
    out << label << ':';
    for (const auto &name : names)
        out << ' ' << name;
    out << "\n";
}

} // namespace

/// @brief Handle `ucindex complete [--root DIR]`; prints `label TAB kind` records.
int cmdComplete(ArgvView args, std::ostream &out, std::ostream &err)
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
    if (!opts.positional.empty())
    {
        err << "error: complete takes no positional arguments\n";
        return 1;
    }

    index::ScanOptions scanOptions;
    scanOptions.carryClassAcrossFiles = opts.carryClass;
    service::IndexService svc(scanOptions);
    if (!rebuildFromOptions(opts, svc, err, /*required=*/false))
        return 1;

    out << analysis::serialize(svc.completions());
    return 0;
}

/// @brief Handle `ucindex show [--root DIR] <ClassName>`.
/// @return 0 when the class is indexed, 1 otherwise.
int cmdShow(ArgvView args, std::ostream &out, std::ostream &err)
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
    if (opts.positional.size() != 1)
    {
        err << "error: expected exactly one class name\n";
        return 1;
    }

    index::ScanOptions scanOptions;
    scanOptions.carryClassAcrossFiles = opts.carryClass;
    service::IndexService svc(scanOptions);
    if (!rebuildFromOptions(opts, svc, err, /*required=*/true))
        return 1;

    const auto table = svc.snapshot();
    const std::string &name = opts.positional.front();
    const index::ClassRecord *record = table->find(name);
    if (!record)
    {
        err << "error: unknown class: " << name << "\n";
        return 1;
    }

    out << "class " << record->name << " (package " << record->package << ")\n";
    printList(out, "functions", record->functions);
    printList(out, "variables", record->variables);
    return 0;
}

} // namespace ucindex::tools
