//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Completion.hpp
/// @brief Completion vocabulary built from fixed word lists and the SymbolTable.
///
/// @details The list is not context sensitive: it always holds the language
/// keywords, then the primitive type names, then every indexed class name in
/// ascending order.  Filtering by the typed prefix is left to the host.
///
/// ## Serialization
///
/// `serialize(items)` returns one tab-delimited record per item:
///
///   label TAB kindInt NEWLINE
///
/// `kind` integers: Keyword=0 Type=1 Class=2
///
//===----------------------------------------------------------------------===//

#pragma once

#include "index/SymbolTable.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ucindex::analysis
{

/// @brief Category of a completion item (maps to an icon in the UI).
enum class CompletionKind : uint8_t
{
    Keyword = 0,
    Type = 1,
    Class = 2,
};

/// @brief A single completion suggestion.
struct CompletionItem
{
    std::string label;
    CompletionKind kind{CompletionKind::Keyword};
};

[[nodiscard]] const char *completionKindName(CompletionKind kind) noexcept;

/// @brief Keywords, type names and known classes, in that order.
[[nodiscard]] std::vector<CompletionItem> enumerateCompletions(const index::SymbolTable &table);

/// @brief Serialize @p items to tab-delimited text.
[[nodiscard]] std::string serialize(const std::vector<CompletionItem> &items);

} // namespace ucindex::analysis
