//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/unrealscript/Declaration.hpp
// Purpose: Result type produced when a source line is recognised as a declaration.
// Key invariants: Identifier columns are 0-based byte offsets into the classified line.
// Ownership/Lifetime: Value types; identifiers own copies of their text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace ucindex::frontends::unrealscript
{

/// @brief Structural category of a declaration line.
enum class DeclKind
{
    Class,
    Function,
    Variable,
    State,
};

/// @brief An identifier captured from a declaration line.
struct Identifier
{
    std::string text;  ///< Identifier spelling as written in the source.
    size_t column = 0; ///< 0-based byte offset of the first character.

    /// @brief Byte length of the identifier.
    [[nodiscard]] size_t length() const
    {
        return text.size();
    }
};

/// @brief Declaration recognised on a single line.
/// @details Only class declarations carry a @ref parent, and only when the
///          line names one via `extends` or `based on`.
struct DeclarationMatch
{
    DeclKind kind{DeclKind::Class};
    Identifier name;
    std::optional<Identifier> parent;
};

/// @brief Lowercase name of @p kind ("class", "function", "variable", "state").
[[nodiscard]] const char *declKindName(DeclKind kind) noexcept;

} // namespace ucindex::frontends::unrealscript
