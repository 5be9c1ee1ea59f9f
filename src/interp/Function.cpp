//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Tracing for closures.

#include "interp/Function.hpp"

#include "interp/Environment.hpp"

namespace fountain::interp
{

void Closure::trace(GcMarker &marker) const
{
    marker.mark(captured_);
}

} // namespace fountain::interp
