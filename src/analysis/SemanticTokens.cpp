//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "analysis/SemanticTokens.hpp"

namespace ucindex::analysis
{

std::vector<std::string> tokenLegend()
{
    return std::vector<std::string>(kTokenLegend.begin(), kTokenLegend.end());
}

std::vector<uint32_t> encodeSemanticTokens(const std::vector<HighlightSpan> &spans)
{
    std::vector<uint32_t> data;
    data.reserve(spans.size() * kIntsPerToken);

    size_t prevLine = 0;
    size_t prevColumn = 0;
    for (const auto &span : spans)
    {
        const size_t deltaLine = span.line - prevLine;
        const size_t deltaStart = deltaLine == 0 ? span.column - prevColumn : span.column;
        data.push_back(static_cast<uint32_t>(deltaLine));
        data.push_back(static_cast<uint32_t>(deltaStart));
        data.push_back(static_cast<uint32_t>(span.length));
        data.push_back(static_cast<uint32_t>(span.category));
        data.push_back(0);
        prevLine = span.line;
        prevColumn = span.column;
    }
    return data;
}

} // namespace ucindex::analysis
