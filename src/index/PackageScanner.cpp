//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/index/PackageScanner.cpp
// Purpose: Directory walk and per-line indexing behind PackageScanner.
// Key invariants: The table under construction is private to rebuildIndex()
//                 until it is returned; a failed root yields no table at all.
//
//===----------------------------------------------------------------------===//

#include "index/PackageScanner.hpp"

#include "support/debug_log.hpp"
#include "support/source_loader.hpp"
#include "support/text_lines.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace ucindex::index
{

namespace
{

constexpr std::string_view kTag = "scan";

using frontends::unrealscript::DeclKind;

/// @brief List entries of @p dir accepted by @p keep, sorted by file name.
/// @return Names on success; std::nullopt when the directory cannot be read.
template <typename Pred>
std::optional<std::vector<std::string>> listSorted(const fs::path &dir,
                                                   std::error_code &ec,
                                                   Pred keep)
{
    std::vector<std::string> names;
    fs::directory_iterator it(dir, ec);
    if (ec)
        return std::nullopt;
    for (const fs::directory_iterator end{}; it != end; it.increment(ec))
    {
        if (ec)
            return std::nullopt;
        if (keep(*it))
            names.push_back(it->path().filename().string());
    }
    if (ec)
        return std::nullopt;
    std::sort(names.begin(), names.end());
    return names;
}

bool isDirectory(const fs::path &p)
{
    std::error_code ec;
    return fs::is_directory(p, ec);
}

std::string joinNames(const std::vector<std::string> &names)
{
    std::string joined;
    for (const auto &name : names)
    {
        if (!joined.empty())
            joined += ", ";
        joined += name;
    }
    return joined;
}

} // namespace

PackageScanner::PackageScanner(support::DiagnosticEngine &diags,
                               support::SourceManager &sm,
                               ScanOptions options,
                               const frontends::unrealscript::LineClassifier &classifier)
    : diags_(diags), sm_(sm), options_(std::move(options)), classifier_(classifier)
{
}

support::Expected<SymbolTable> PackageScanner::rebuildIndex(const std::string &rootPath)
{
    stats_ = ScanStats{};
    support::debugLog(kTag, "Scanning game packages in folder: " + rootPath);

    const fs::path root(rootPath);
    if (rootPath.empty() || !isDirectory(root))
    {
        return support::Expected<SymbolTable>(support::makeIoError(
            support::Severity::Error, "root path is not a readable directory: " + rootPath));
    }

    std::error_code ec;
    auto packages = listSorted(root,
                               ec,
                               [](const fs::directory_entry &entry)
                               {
                                   std::error_code typeEc;
                                   return entry.is_directory(typeEc);
                               });
    if (!packages)
    {
        return support::Expected<SymbolTable>(support::makeIoError(
            support::Severity::Error,
            "unable to list root path " + rootPath + ": " + ec.message()));
    }

    support::debugLog(kTag, "Found packages: " + joinNames(*packages));

    SymbolTable table;
    ClassRecord *current = nullptr;
    for (const auto &package : *packages)
        scanPackage(package, root / package, table, current);

    if (support::isDebugLoggingEnabled())
        support::debugLog(kTag, "Total classes found: " + std::to_string(table.size()));
    return support::Expected<SymbolTable>(std::move(table));
}

void PackageScanner::scanPackage(const std::string &package,
                                 const fs::path &packageDir,
                                 SymbolTable &table,
                                 ClassRecord *&current)
{
    fs::path folder = packageDir / options_.classesFolder;
    if (!isDirectory(folder))
    {
        if (!isDirectory(packageDir))
        {
            ++stats_.packagesSkipped;
            warn("package folder does not exist: " + folder.generic_string());
            return;
        }
        folder = packageDir;
    }

    const std::string &ext = options_.sourceExtension;
    std::error_code ec;
    auto files = listSorted(folder,
                            ec,
                            [&ext](const fs::directory_entry &entry)
                            {
                                std::error_code typeEc;
                                return entry.is_regular_file(typeEc) &&
                                       entry.path().filename().string().ends_with(ext);
                            });
    if (!files)
    {
        ++stats_.packagesSkipped;
        warn("skipping package " + package + ": unable to list " + folder.generic_string() +
             ": " + ec.message());
        return;
    }

    ++stats_.packagesScanned;
    if (support::isDebugLoggingEnabled())
    {
        std::ostringstream os;
        os << "Scanning package \"" << package << "\" in folder \"" << folder.generic_string()
           << "\", found " << files->size() << " UC files";
        support::debugLog(kTag, os.str());
    }

    for (const auto &file : *files)
    {
        const std::string path = (folder / file).string();
        const support::SourceLoc loc{sm_.addFile(path)};

        auto source = support::loadSourceFile(path, loc);
        if (!source)
        {
            ++stats_.filesSkipped;
            warn("skipping file: " + source.error().message, loc);
            continue;
        }

        ++stats_.filesIndexed;
        if (!options_.carryClassAcrossFiles)
            current = nullptr;
        indexSource(package, source.value(), table, current);

        if (current && support::isDebugLoggingEnabled())
        {
            std::ostringstream os;
            os << "Completed class " << current->name << " with " << current->functions.size()
               << " functions and " << current->variables.size() << " variables";
            support::debugLog(kTag, os.str());
        }
    }
}

void PackageScanner::indexSource(const std::string &package,
                                 std::string_view text,
                                 SymbolTable &table,
                                 ClassRecord *&current)
{
    const bool trace = support::isDebugLoggingEnabled();

    for (std::string_view line : support::splitLines(support::stripUtf8Bom(text)))
    {
        auto decl = classifier_.classify(line);
        if (!decl)
            continue;

        switch (decl->kind)
        {
            case DeclKind::Class:
                ++stats_.classDeclarations;
                current = &table.insertOrReplace(ClassRecord{package, decl->name.text, {}, {}});
                if (trace)
                    support::debugLog(kTag, "Found class " + current->name);
                break;
            case DeclKind::Function:
                if (!current)
                    break;
                current->functions.push_back(decl->name.text);
                if (trace)
                    support::debugLog(kTag,
                                      "  Found function " + decl->name.text + " in " + current->name);
                break;
            case DeclKind::Variable:
                if (!current)
                    break;
                current->variables.push_back(decl->name.text);
                if (trace)
                    support::debugLog(kTag,
                                      "  Found variable " + decl->name.text + " in " + current->name);
                break;
            case DeclKind::State:
                // States are outlined per document but not indexed.
                break;
        }
    }
}

void PackageScanner::warn(std::string message, support::SourceLoc loc)
{
    support::debugLog(kTag, message);
    diags_.report(support::makeIoError(support::Severity::Warning, std::move(message), loc));
}

support::Expected<SymbolTable> rebuildIndex(const std::string &rootPath,
                                            support::DiagnosticEngine &diags,
                                            const ScanOptions &options)
{
    support::SourceManager sm;
    PackageScanner scanner(diags, sm, options);
    return scanner.rebuildIndex(rootPath);
}

} // namespace ucindex::index
