//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/ArgvView.hpp
// Purpose: Lightweight non-owning view over argv-style argument arrays.
// Key invariants: Never modifies or owns the underlying argument storage.
// Ownership/Lifetime: Borrows pointers from the C runtime; callers must ensure
//                     validity through the view's lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace ucindex::tools
{

/// @brief Non-owning view over the arguments that follow a subcommand name.
struct ArgvView
{
    int argc;
    char **argv;

    [[nodiscard]] bool empty() const
    {
        return argc <= 0 || argv == nullptr;
    }

    [[nodiscard]] int size() const
    {
        return empty() ? 0 : argc;
    }

    /// @brief Read the argument at @p index, returning an empty view on overflow.
    [[nodiscard]] std::string_view at(int index) const
    {
        if (index < 0 || index >= argc || argv == nullptr)
            return std::string_view{};
        return std::string_view(argv[index]);
    }

    /// @brief Produce a suffix view that skips the first @p count entries.
    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (count >= argc)
            return ArgvView{0, nullptr};
        return ArgvView{argc - count, argv + count};
    }
};

} // namespace ucindex::tools
