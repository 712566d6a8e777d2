//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `ucindex outline` and `ucindex highlight`, the two per-document
// commands.  Both read one source file and print the analyzer's output.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "analysis/DocumentAnalyzer.hpp"
#include "analysis/SemanticTokens.hpp"
#include "service/IndexService.hpp"
#include "support/source_loader.hpp"
#include "support/text_lines.hpp"

#include <optional>

namespace ucindex::tools
{

namespace
{

/// @brief Parse options and load the single document argument.
/// @return Document text, or std::nullopt with @p status set to the exit code.
std::optional<std::string> loadDocument(ArgvView args,
                                        CliOptions &opts,
                                        std::ostream &out,
                                        std::ostream &err,
                                        int &status)
{
    status = 1;
    if (!parseCommandLine(args, opts, err))
    {
        printUsage(err);
        return std::nullopt;
    }
    if (opts.help)
    {
        printUsage(out);
        status = 0;
        return std::nullopt;
    }
    if (opts.positional.size() != 1)
    {
        err << "error: expected exactly one source file\n";
        return std::nullopt;
    }

    auto source = support::loadSourceFile(opts.positional.front());
    if (!source)
    {
        support::printDiag(source.error(), err);
        return std::nullopt;
    }
    status = 0;
    return std::string(support::stripUtf8Bom(source.value()));
}

} // namespace

/// @brief Handle `ucindex outline <file.uc>`; prints `<line> <kind> <name>`.
int cmdOutline(ArgvView args, std::ostream &out, std::ostream &err)
{
    CliOptions opts;
    int status = 0;
    auto text = loadDocument(args, opts, out, err, status);
    if (!text)
        return status;

    const analysis::DocumentAnalyzer analyzer;
    for (const auto &entry : analyzer.outline(support::splitLines(*text)))
        out << entry.line + 1 << ' ' << analysis::outlineKindName(entry.kind) << ' ' << entry.name
            << "\n";
    return 0;
}

/// @brief Handle `ucindex highlight [--root DIR] [--encoded] <file.uc>`.
///
/// Without a root only declaration spans appear, since no class names are
/// known.  The default format is `<line>:<col> <length> <category>`;
/// `--encoded` prints five integers per token instead.
int cmdHighlight(ArgvView args, std::ostream &out, std::ostream &err)
{
    CliOptions opts;
    int status = 0;
    auto text = loadDocument(args, opts, out, err, status);
    if (!text)
        return status;

    index::ScanOptions scanOptions;
    scanOptions.carryClassAcrossFiles = opts.carryClass;
    service::IndexService svc(scanOptions);
    if (!rebuildFromOptions(opts, svc, err, /*required=*/false))
        return 1;

    const auto result = svc.analyze(service::DocumentRequest{*text});
    if (opts.encoded)
    {
        const auto data = analysis::encodeSemanticTokens(result.highlights);
        for (size_t i = 0; i < data.size(); ++i)
        {
            out << data[i];
            out << ((i + 1) % analysis::kIntsPerToken == 0 ? '\n' : ' ');
        }
        return 0;
    }

    for (const auto &span : result.highlights)
    {
        out << span.line + 1 << ':' << span.column + 1 << ' ' << span.length << ' '
            << analysis::tokenCategoryName(span.category) << "\n";
    }
    return 0;
}

} // namespace ucindex::tools
