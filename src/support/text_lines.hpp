//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/text_lines.hpp
// Purpose: Line splitting helpers shared by the scanner and the document analyzer.
// Key invariants: Returned views never contain '\r' or '\n' terminators.
// Ownership/Lifetime: Views borrow from the caller's buffer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>
#include <vector>

namespace ucindex::support
{

/// @brief UTF-8 encoded byte-order mark.
inline constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// @brief Split @p text into lines on "\r\n", "\n" or a lone "\r".
/// @details A trailing terminator yields a final empty line, so the result
///          always has (number of terminators + 1) entries.
/// @param text Full document text.
/// @return Views into @p text, one per line, terminators excluded.
[[nodiscard]] std::vector<std::string_view> splitLines(std::string_view text);

/// @brief Drop a leading UTF-8 byte-order mark from @p text if present.
[[nodiscard]] std::string_view stripUtf8Bom(std::string_view text) noexcept;

} // namespace ucindex::support
