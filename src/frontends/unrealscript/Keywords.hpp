//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/unrealscript/Keywords.hpp
// Purpose: Fixed UnrealScript vocabularies offered by code completion.
// Key invariants: Order is presentation order; entries are lowercase.
// Ownership/Lifetime: Static storage.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <string_view>

namespace ucindex::frontends::unrealscript
{

/// @brief Statement and declaration keywords.
inline constexpr std::array<std::string_view, 17> kKeywords = {
    "class",  "extends", "function", "event",  "state",    "defaultproperties",
    "if",     "else",    "while",    "for",    "foreach",  "switch",
    "case",   "return",  "break",    "continue", "until",
};

/// @brief Primitive and aggregate type names.
/// @note "class" appears here as well because it doubles as a type
///       constructor (`class<Actor>`).
inline constexpr std::array<std::string_view, 11> kTypeNames = {
    "int",  "float",  "bool",    "byte",  "string", "name",
    "vector", "rotator", "array", "struct", "class",
};

/// @brief Language identifier hosts attach to UnrealScript documents.
inline constexpr std::string_view kLanguageId = "unrealscript";

/// @brief Characters that trigger a completion request in the host.
inline constexpr std::string_view kCompletionTriggerCharacters = ".";

} // namespace ucindex::frontends::unrealscript
