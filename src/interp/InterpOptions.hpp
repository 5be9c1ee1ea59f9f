//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/InterpOptions.hpp
// Purpose: Runtime configuration for the tree-walking interpreter.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/InterpConstants.hpp"

#include <cstddef>

namespace fountain::interp
{

/// @brief Knobs controlling interpreter limits and diagnostics.
struct InterpreterOptions
{
    /// @brief Deepest permitted Fountain call nesting.
    size_t maxCallDepth = kMaxCallDepth;

    /// @brief Host stack bytes evaluation may use. Lower it when running on a
    ///        thread with a small stack.
    size_t maxStackBytes = kMaxStackBytes;

    /// @brief Live object count that triggers a collection; the threshold
    ///        then grows with the surviving heap. Zero collects at every
    ///        statement boundary.
    size_t gcThreshold = kDefaultGcThreshold;

    /// @brief Write one "[trace] line N: <stmt>" line per executed statement
    ///        to stderr.
    bool trace = false;
};

} // namespace fountain::interp
