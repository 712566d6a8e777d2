//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file LineClassifier.hpp
/// @brief Line-level declaration recogniser for UnrealScript sources.
///
/// @details UnrealScript is not parsed.  Each line is matched independently
/// against four anchored, case-insensitive patterns, tried in priority order:
///
/// | Kind     | Shape                                                    |
/// |----------|----------------------------------------------------------|
/// | Class    | `class Name [extends Parent]` or `class Name based on P` |
/// | Function | `function Name`                                          |
/// | Variable | `var Type Name` (only the last identifier is captured)   |
/// | State    | `state Name`                                             |
///
/// Only leading whitespace may precede the keyword.  The first pattern that
/// matches wins.  Comments, string literals and multi-line declarations are
/// not understood, so a commented-out declaration still classifies.
///
/// The scanner and the document analyzer depend on the abstract
/// `LineClassifier` only; `RegexLineClassifier` is the shipped implementation.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/unrealscript/Declaration.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string_view>

namespace ucindex::frontends::unrealscript
{

/// @brief Recognises declaration lines.
/// @details Implementations must be stateless with respect to classify():
///          the same line always yields the same result, and concurrent calls
///          on one instance are allowed.
class LineClassifier
{
  public:
    virtual ~LineClassifier() = default;

    /// @brief Classify a single line of source text.
    /// @param line One line without its terminator.
    /// @return The declaration on the line, or std::nullopt when the line
    ///         declares nothing.  Never throws.
    [[nodiscard]] virtual std::optional<DeclarationMatch> classify(std::string_view line) const = 0;
};

/// @brief Regex-backed classifier implementing the four declaration patterns.
class RegexLineClassifier final : public LineClassifier
{
  public:
    /// @brief Longest stretch of text after the leading whitespace handed to
    ///        the regex engine; declarations are expected well within it.
    static constexpr size_t kMaxDeclarationPrefix = 1024;

    RegexLineClassifier();

    [[nodiscard]] std::optional<DeclarationMatch> classify(std::string_view line) const override;

  private:
    std::regex classPattern_;
    std::regex functionPattern_;
    std::regex variablePattern_;
    std::regex statePattern_;
};

/// @brief Shared immutable classifier used when callers do not supply one.
[[nodiscard]] const LineClassifier &defaultClassifier();

/// @brief Convenience wrapper around `defaultClassifier().classify(line)`.
[[nodiscard]] std::optional<DeclarationMatch> classifyLine(std::string_view line);

} // namespace ucindex::frontends::unrealscript
