//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file PackageScanner.hpp
/// @brief Builds a SymbolTable from an UnrealScript package tree.
///
/// @details The expected layout is a game root holding one folder per package:
///
/// ```
///  <root>/
///    Core/Classes/Object.uc
///    Engine/Classes/Actor.uc
///    MyMod/Pawn2.uc            (no Classes folder: package root is used)
/// ```
///
/// Every `.uc` file directly inside the resolved folder is read and its lines
/// are fed through a LineClassifier.  A class declaration opens a new
/// ClassRecord; function and variable declarations are appended to the most
/// recently opened record; state declarations are ignored.
///
/// Packages and files are visited in ascending name order, which fixes the
/// winner when two files declare the same class name (the later one wins).
///
/// ## Failure model
///
/// - Root missing or not listable: `rebuildIndex` returns an IoError.
/// - Package folder or file unreadable: a warning is reported to the
///   DiagnosticEngine and the unit is skipped; the scan continues.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/unrealscript/LineClassifier.hpp"
#include "index/SymbolTable.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace ucindex::index
{

/// @brief Tunables for a package scan.
struct ScanOptions
{
    /// @brief Preferred class-source subfolder inside each package.
    std::string classesFolder{"Classes"};

    /// @brief Case-sensitive file name suffix of source files.
    std::string sourceExtension{".uc"};

    /// @brief Keep the current-class cursor across file boundaries.
    /// @details When false (the default) the cursor is cleared before each
    ///          file, so members of a file without a class declaration are
    ///          dropped.  This matches the editor extension the indexer
    ///          replaces, which tracked the current class per file.  When true
    ///          they are attributed to the class that was current at the end
    ///          of the previously indexed file, which suits trees that
    ///          spread one class over several files.
    bool carryClassAcrossFiles{false};
};

/// @brief Counters describing the last scan.
struct ScanStats
{
    size_t packagesScanned = 0;
    size_t packagesSkipped = 0;
    size_t filesIndexed = 0;
    size_t filesSkipped = 0;
    size_t classDeclarations = 0; ///< Class lines matched, duplicates included.
};

/// @brief Walks a package tree and produces a fresh SymbolTable.
/// @details One scanner may be reused for several scans; stats() describes
///          the most recent one.  The scanner never publishes anything: the
///          returned table is handed to the caller, which decides when
///          readers get to see it.
class PackageScanner
{
  public:
    /// @param diags Receives warnings for skipped packages and files.
    /// @param sm Registers every source file the scan attempts to read.
    /// @param options Folder, extension and cursor settings.
    /// @param classifier Declaration recogniser; must outlive the scanner.
    PackageScanner(support::DiagnosticEngine &diags,
                   support::SourceManager &sm,
                   ScanOptions options = {},
                   const frontends::unrealscript::LineClassifier &classifier =
                       frontends::unrealscript::defaultClassifier());

    /// @brief Scan @p rootPath and return the resulting table.
    /// @return The table on success, or an IoError diagnostic when the root
    ///         cannot be listed as a directory.
    [[nodiscard]] support::Expected<SymbolTable> rebuildIndex(const std::string &rootPath);

    [[nodiscard]] const ScanStats &stats() const
    {
        return stats_;
    }

  private:
    void scanPackage(const std::string &package,
                     const std::filesystem::path &packageDir,
                     SymbolTable &table,
                     ClassRecord *&current);

    void indexSource(const std::string &package,
                     std::string_view text,
                     SymbolTable &table,
                     ClassRecord *&current);

    void warn(std::string message, support::SourceLoc loc = {});

    support::DiagnosticEngine &diags_;
    support::SourceManager &sm_;
    ScanOptions options_;
    const frontends::unrealscript::LineClassifier &classifier_;
    ScanStats stats_;
};

/// @brief One-shot scan with a throw-away SourceManager.
/// @param rootPath Game root holding the package folders.
/// @param diags Receives warnings for skipped units.
/// @param options Scan settings.
[[nodiscard]] support::Expected<SymbolTable> rebuildIndex(const std::string &rootPath,
                                                          support::DiagnosticEngine &diags,
                                                          const ScanOptions &options = {});

} // namespace ucindex::index
