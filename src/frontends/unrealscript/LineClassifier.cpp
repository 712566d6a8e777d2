//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file LineClassifier.cpp
/// @brief Regex implementation of the UnrealScript declaration recogniser.
///
//===----------------------------------------------------------------------===//

#include "frontends/unrealscript/LineClassifier.hpp"

#include "support/debug_log.hpp"
#include "support/text_lines.hpp"

#include <string>

namespace ucindex::frontends::unrealscript
{

namespace
{

constexpr auto kPatternFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

/// @brief Characters matched by `\s` for the ASCII subset we care about.
bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

/// @brief Offset of the first character after the leading whitespace.
/// @details A UTF-8 byte-order mark at the very start counts as whitespace so
///          the first line of a BOM-prefixed document classifies normally.
size_t skipLeadingWhitespace(std::string_view line)
{
    size_t pos = 0;
    if (line.substr(0, support::kUtf8Bom.size()) == support::kUtf8Bom)
        pos = support::kUtf8Bom.size();
    while (pos < line.size() && isSpace(line[pos]))
        ++pos;
    return pos;
}

Identifier captureAt(const std::cmatch &m, size_t group, size_t base)
{
    return Identifier{m[group].str(), base + static_cast<size_t>(m.position(group))};
}

} // namespace

const char *declKindName(DeclKind kind) noexcept
{
    switch (kind)
    {
        case DeclKind::Class:
            return "class";
        case DeclKind::Function:
            return "function";
        case DeclKind::Variable:
            return "variable";
        case DeclKind::State:
            return "state";
    }
    return "";
}

// The keyword must be the first token, so every pattern is matched with
// match_continuous against the text following the leading whitespace.
RegexLineClassifier::RegexLineClassifier()
    : classPattern_(R"(class\s+(\w+)(?:\s+(?:extends|based\s+on)\s+(\w+))?)", kPatternFlags),
      functionPattern_(R"(function\s+(\w+))", kPatternFlags),
      variablePattern_(R"(var\s+\w+\s+(\w+))", kPatternFlags),
      statePattern_(R"(state\s+(\w+))", kPatternFlags)
{
}

std::optional<DeclarationMatch> RegexLineClassifier::classify(std::string_view line) const
{
    const size_t base = skipLeadingWhitespace(line);
    std::string_view rest = line.substr(base, kMaxDeclarationPrefix);
    if (rest.empty())
        return std::nullopt;

    const char *first = rest.data();
    const char *last = rest.data() + rest.size();
    constexpr auto flags = std::regex_constants::match_continuous;

    try
    {
        std::cmatch m;
        if (std::regex_search(first, last, m, classPattern_, flags))
        {
            DeclarationMatch decl{DeclKind::Class, captureAt(m, 1, base), std::nullopt};
            if (m[2].matched)
                decl.parent = captureAt(m, 2, base);
            return decl;
        }
        if (std::regex_search(first, last, m, functionPattern_, flags))
            return DeclarationMatch{DeclKind::Function, captureAt(m, 1, base), std::nullopt};
        if (std::regex_search(first, last, m, variablePattern_, flags))
            return DeclarationMatch{DeclKind::Variable, captureAt(m, 1, base), std::nullopt};
        if (std::regex_search(first, last, m, statePattern_, flags))
            return DeclarationMatch{DeclKind::State, captureAt(m, 1, base), std::nullopt};
    }
    catch (const std::regex_error &err)
    {
        support::debugLog("classify",
                          std::string("pattern engine gave up on line: ") + err.what());
    }
    return std::nullopt;
}

const LineClassifier &defaultClassifier()
{
    static const RegexLineClassifier classifier;
    return classifier;
}

std::optional<DeclarationMatch> classifyLine(std::string_view line)
{
    return defaultClassifier().classify(line);
}

} // namespace ucindex::frontends::unrealscript
