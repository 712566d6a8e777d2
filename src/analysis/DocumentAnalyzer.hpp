//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file DocumentAnalyzer.hpp
/// @brief Outline entries and highlight spans for a single UnrealScript document.
///
/// @details Two independent passes run over the lines of one document:
///
/// - **Outline**: every class, function and state declaration becomes one
///   flat entry, in line order.  Variables are not outlined and nothing is
///   nested.
/// - **Highlights**: declaration identifiers are highlighted by kind, and
///   each line is additionally searched for literal occurrences of every
///   class name in the SymbolTable (category Class) and of every variable
///   declared so far in the current class or function (category Variable).
///
/// Occurrence search is a plain, case-sensitive substring search: `Actor`
/// also lights up inside `MyActorHelper`.  Spans on a line are merged in
/// column order; a span beginning inside an earlier span is dropped so the
/// result always forms a valid token stream.  Declaration spans take
/// precedence over occurrences at the same column.
///
/// Both passes accept arbitrary text and never fail.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/unrealscript/LineClassifier.hpp"
#include "index/SymbolTable.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ucindex::analysis
{

/// @brief Kind of an outline entry.
enum class OutlineKind
{
    Class,
    Function,
    State,
};

/// @brief One row of a document outline.
/// @details The entry covers the whole declaration line, columns
///          [0, lineLength).
struct OutlineEntry
{
    std::string name;
    OutlineKind kind{OutlineKind::Class};
    size_t line = 0;       ///< 0-based line number.
    size_t lineLength = 0; ///< Byte length of the line.
};

/// @brief Highlight category; values are the fixed token legend indices.
enum class TokenCategory : uint32_t
{
    Class = 0,
    Function = 1,
    Variable = 2,
    Parameter = 3, ///< Reserved; never produced by the current passes.
};

/// @brief A highlighted stretch of one line.
struct HighlightSpan
{
    size_t line = 0;   ///< 0-based line number.
    size_t column = 0; ///< 0-based byte offset within the line.
    size_t length = 0; ///< Byte length.
    TokenCategory category{TokenCategory::Class};

    bool operator==(const HighlightSpan &) const = default;
};

/// @brief Both passes over one document.
struct DocumentAnalysis
{
    std::vector<OutlineEntry> outline;
    std::vector<HighlightSpan> highlights;
};

[[nodiscard]] const char *outlineKindName(OutlineKind kind) noexcept;
[[nodiscard]] const char *tokenCategoryName(TokenCategory category) noexcept;

/// @brief Runs the outline and highlight passes.
/// @details Stateless between calls; every call recomputes from scratch.
class DocumentAnalyzer
{
  public:
    /// @param classifier Declaration recogniser; must outlive the analyzer.
    explicit DocumentAnalyzer(const frontends::unrealscript::LineClassifier &classifier =
                                  frontends::unrealscript::defaultClassifier());

    /// @brief Outline pass over already split lines.
    [[nodiscard]] std::vector<OutlineEntry> outline(const std::vector<std::string_view> &lines) const;

    /// @brief Highlight pass over already split lines.
    /// @param table Class names whose occurrences are highlighted.
    /// @return Spans ordered by line, then column; never overlapping.
    [[nodiscard]] std::vector<HighlightSpan> highlights(const std::vector<std::string_view> &lines,
                                                        const index::SymbolTable &table) const;

    /// @brief Split @p text on any line ending and run both passes.
    [[nodiscard]] DocumentAnalysis analyze(std::string_view text,
                                           const index::SymbolTable &table) const;

  private:
    const frontends::unrealscript::LineClassifier &classifier_;
};

/// @brief Append every non-overlapping occurrence of @p needle in @p line.
/// @details Scans left to right and resumes just past each match.  An empty
///          needle produces nothing.
void appendOccurrences(std::string_view line,
                       size_t lineNumber,
                       std::string_view needle,
                       TokenCategory category,
                       std::vector<HighlightSpan> &out);

} // namespace ucindex::analysis
