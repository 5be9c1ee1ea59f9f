//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/InterpConstants.hpp
// Purpose: Centralized limits and tuning defaults for the interpreter.
// Key invariants: All constants are compile-time evaluable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

namespace fountain::interp
{

/// @brief Maximum depth of nested Fountain function calls.
/// @details Each Fountain call costs a handful of host frames in the
///          tree walker, so the limit sits well below what the default
///          8 MB host stack can hold. Exceeding it raises a ResourceError.
constexpr size_t kMaxCallDepth = 1000;

/// @brief Host stack the evaluator may use below the frame that started
///        execute() before raising a ResourceError.
/// @details Half of the usual 8 MB main-thread stack, which leaves room for
///          the frames between two checks. Nested blocks and expressions
///          consume host stack without adding Fountain calls, so this bound
///          holds where kMaxCallDepth alone would not.
constexpr size_t kMaxStackBytes = 4 * 1024 * 1024;

/// @brief Allocations between garbage collections before the heap first
///        grows its threshold.
constexpr size_t kDefaultGcThreshold = 1024;

/// @brief Factor applied to the surviving object count to compute the next
///        collection threshold.
constexpr size_t kGcGrowthFactor = 2;

} // namespace fountain::interp
