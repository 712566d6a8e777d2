//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/TempPackageTree.hpp
// Purpose: Throw-away game root under the system temp directory for tests
//          that exercise the package scanner.
// Key invariants: Each instance owns a unique directory that is removed on
//                 destruction.
// Ownership/Lifetime: RAII; copying is disabled.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace ucindex::tests
{

class TempPackageTree
{
  public:
    TempPackageTree()
    {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = std::filesystem::temp_directory_path() /
                ("ucindex-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    ~TempPackageTree()
    {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempPackageTree(const TempPackageTree &) = delete;
    TempPackageTree &operator=(const TempPackageTree &) = delete;

    const std::filesystem::path &path() const
    {
        return root_;
    }

    std::string root() const
    {
        return root_.string();
    }

    /// @brief Write @p text to @p relative, creating parent folders.
    std::filesystem::path write(std::string_view relative, std::string_view text) const
    {
        const auto file = root_ / std::filesystem::path(relative);
        std::filesystem::create_directories(file.parent_path());
        std::ofstream ofs(file, std::ios::binary);
        ofs << text;
        return file;
    }

    /// @brief Create an empty folder at @p relative.
    std::filesystem::path mkdir(std::string_view relative) const
    {
        const auto dir = root_ / std::filesystem::path(relative);
        std::filesystem::create_directories(dir);
        return dir;
    }

  private:
    std::filesystem::path root_;
};

} // namespace ucindex::tests
