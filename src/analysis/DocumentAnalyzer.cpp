//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file DocumentAnalyzer.cpp
/// @brief Outline and highlight passes for UnrealScript documents.
///
//===----------------------------------------------------------------------===//

#include "analysis/DocumentAnalyzer.hpp"

#include "support/text_lines.hpp"

#include <algorithm>
#include <functional>
#include <set>

namespace ucindex::analysis
{

using frontends::unrealscript::DeclKind;
using frontends::unrealscript::Identifier;

namespace
{

/// @brief Span awaiting the per-line merge.
struct Candidate
{
    HighlightSpan span;
    bool declaration = false;
};

void pushDeclaration(std::vector<Candidate> &out,
                     size_t line,
                     const Identifier &ident,
                     TokenCategory category)
{
    out.push_back(Candidate{HighlightSpan{line, ident.column, ident.length(), category}, true});
}

/// @brief Order candidates by column and drop those starting inside an
///        already accepted span.
void mergeLine(std::vector<Candidate> &candidates, std::vector<HighlightSpan> &out)
{
    std::sort(candidates.begin(),
              candidates.end(),
              [](const Candidate &a, const Candidate &b)
              {
                  if (a.span.column != b.span.column)
                      return a.span.column < b.span.column;
                  if (a.declaration != b.declaration)
                      return a.declaration;
                  return a.span.length > b.span.length;
              });

    size_t end = 0;
    bool any = false;
    for (const auto &c : candidates)
    {
        if (any && c.span.column < end)
            continue;
        out.push_back(c.span);
        end = c.span.column + c.span.length;
        any = true;
    }
}

} // namespace

const char *outlineKindName(OutlineKind kind) noexcept
{
    switch (kind)
    {
        case OutlineKind::Class:
            return "class";
        case OutlineKind::Function:
            return "function";
        case OutlineKind::State:
            return "state";
    }
    return "";
}

const char *tokenCategoryName(TokenCategory category) noexcept
{
    switch (category)
    {
        case TokenCategory::Class:
            return "class";
        case TokenCategory::Function:
            return "function";
        case TokenCategory::Variable:
            return "variable";
        case TokenCategory::Parameter:
            return "parameter";
    }
    return "";
}

void appendOccurrences(std::string_view line,
                       size_t lineNumber,
                       std::string_view needle,
                       TokenCategory category,
                       std::vector<HighlightSpan> &out)
{
    if (needle.empty())
        return;
    for (size_t pos = line.find(needle); pos != std::string_view::npos;
         pos = line.find(needle, pos + needle.size()))
    {
        out.push_back(HighlightSpan{lineNumber, pos, needle.size(), category});
    }
}

DocumentAnalyzer::DocumentAnalyzer(const frontends::unrealscript::LineClassifier &classifier)
    : classifier_(classifier)
{
}

std::vector<OutlineEntry> DocumentAnalyzer::outline(const std::vector<std::string_view> &lines) const
{
    std::vector<OutlineEntry> entries;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        auto decl = classifier_.classify(lines[i]);
        if (!decl)
            continue;

        OutlineKind kind = OutlineKind::Class;
        switch (decl->kind)
        {
            case DeclKind::Class:
                kind = OutlineKind::Class;
                break;
            case DeclKind::Function:
                kind = OutlineKind::Function;
                break;
            case DeclKind::State:
                kind = OutlineKind::State;
                break;
            case DeclKind::Variable:
                continue;
        }
        entries.push_back(OutlineEntry{decl->name.text, kind, i, lines[i].size()});
    }
    return entries;
}

std::vector<HighlightSpan> DocumentAnalyzer::highlights(const std::vector<std::string_view> &lines,
                                                        const index::SymbolTable &table) const
{
    std::vector<HighlightSpan> spans;
    std::set<std::string, std::less<>> classVariables;
    std::set<std::string, std::less<>> functionVariables;

    std::vector<Candidate> candidates;
    std::vector<HighlightSpan> occurrences;

    for (size_t i = 0; i < lines.size(); ++i)
    {
        const std::string_view line = lines[i];
        candidates.clear();
        occurrences.clear();

        if (auto decl = classifier_.classify(line))
        {
            switch (decl->kind)
            {
                case DeclKind::Class:
                    pushDeclaration(candidates, i, decl->name, TokenCategory::Class);
                    if (decl->parent)
                        pushDeclaration(candidates, i, *decl->parent, TokenCategory::Class);
                    classVariables.clear();
                    functionVariables.clear();
                    break;
                case DeclKind::Function:
                    pushDeclaration(candidates, i, decl->name, TokenCategory::Function);
                    functionVariables.clear();
                    break;
                case DeclKind::Variable:
                    pushDeclaration(candidates, i, decl->name, TokenCategory::Variable);
                    classVariables.insert(decl->name.text);
                    functionVariables.insert(decl->name.text);
                    break;
                case DeclKind::State:
                    break;
            }
        }

        for (const auto &entry : table)
            appendOccurrences(line, i, entry.first, TokenCategory::Class, occurrences);

        std::set<std::string_view> knownVariables(classVariables.begin(), classVariables.end());
        knownVariables.insert(functionVariables.begin(), functionVariables.end());
        for (std::string_view name : knownVariables)
            appendOccurrences(line, i, name, TokenCategory::Variable, occurrences);

        if (candidates.empty() && occurrences.empty())
            continue;
        for (const auto &span : occurrences)
            candidates.push_back(Candidate{span, false});
        mergeLine(candidates, spans);
    }
    return spans;
}

DocumentAnalysis DocumentAnalyzer::analyze(std::string_view text,
                                           const index::SymbolTable &table) const
{
    const auto lines = support::splitLines(text);
    return DocumentAnalysis{outline(lines), highlights(lines, table)};
}

} // namespace ucindex::analysis
