//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/SemanticTokens.hpp
// Purpose: Relative (delta) encoding of highlight spans for editor token streams.
// Key invariants: Legend order is class, function, variable, parameter and
//                 matches the TokenCategory values.
// Ownership/Lifetime: Returned vectors are owned by the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/DocumentAnalyzer.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ucindex::analysis
{

/// @brief Number of integers emitted per span.
inline constexpr size_t kIntsPerToken = 5;

/// @brief Token type names indexed by TokenCategory.
inline constexpr std::array<std::string_view, 4> kTokenLegend = {
    "class", "function", "variable", "parameter"};

/// @brief Legend handed to hosts when registering the token provider.
[[nodiscard]] std::vector<std::string> tokenLegend();

/// @brief Encode @p spans as (deltaLine, deltaStart, length, type, modifiers).
/// @details deltaStart is relative to the previous span when both sit on the
///          same line and absolute otherwise.  No modifiers are used.
/// @pre @p spans are ordered by line then column, as produced by
///      DocumentAnalyzer::highlights().
[[nodiscard]] std::vector<uint32_t> encodeSemanticTokens(const std::vector<HighlightSpan> &spans);

} // namespace ucindex::analysis
