//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/ucindex/version.hpp
// Purpose: Version string reported by the ucindex tool.
//
//===----------------------------------------------------------------------===//

#pragma once

#define UCINDEX_VERSION_MAJOR 0
#define UCINDEX_VERSION_MINOR 3
#define UCINDEX_VERSION_PATCH 0
#define UCINDEX_VERSION_STR "0.3.0"
