//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/debug_log.hpp
// Purpose: Environment-gated `[DEBUG]` tracing to standard error.
// Key invariants: Nothing is written unless tracing was enabled through
//                 UCINDEX_DEBUG or setDebugLogging(true).
// Ownership/Lifetime: Process-wide flag; no owned resources.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace ucindex::support
{

/// @brief Environment variable that enables tracing when set to a non-empty value.
inline constexpr const char *kDebugEnvVar = "UCINDEX_DEBUG";

/// @brief Check whether `[DEBUG]` tracing is currently enabled.
/// @details The environment is consulted once; later calls to
///          setDebugLogging() override that initial decision.
bool isDebugLoggingEnabled() noexcept;

/// @brief Force tracing on or off regardless of the environment.
void setDebugLogging(bool enabled) noexcept;

/// @brief Emit `[DEBUG][tag] message` on stderr when tracing is enabled.
void debugLog(std::string_view tag, std::string_view message);

} // namespace ucindex::support
