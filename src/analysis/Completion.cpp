//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Completion.cpp
/// @brief Completion vocabulary enumeration and serialization.
///
//===----------------------------------------------------------------------===//

#include "analysis/Completion.hpp"

#include "frontends/unrealscript/Keywords.hpp"

namespace ucindex::analysis
{

const char *completionKindName(CompletionKind kind) noexcept
{
    switch (kind)
    {
        case CompletionKind::Keyword:
            return "keyword";
        case CompletionKind::Type:
            return "type";
        case CompletionKind::Class:
            return "class";
    }
    return "";
}

std::vector<CompletionItem> enumerateCompletions(const index::SymbolTable &table)
{
    namespace us = frontends::unrealscript;

    std::vector<CompletionItem> items;
    items.reserve(us::kKeywords.size() + us::kTypeNames.size() + table.size());

    for (auto kw : us::kKeywords)
        items.push_back(CompletionItem{std::string(kw), CompletionKind::Keyword});
    for (auto type : us::kTypeNames)
        items.push_back(CompletionItem{std::string(type), CompletionKind::Type});
    for (const auto &entry : table)
        items.push_back(CompletionItem{entry.first, CompletionKind::Class});
    return items;
}

std::string serialize(const std::vector<CompletionItem> &items)
{
    std::string out;
    out.reserve(items.size() * 16);
    for (const auto &item : items)
    {
        out += item.label;
        out += '\t';
        out += std::to_string(static_cast<int>(item.kind));
        out += '\n';
    }
    return out;
}

} // namespace ucindex::analysis
