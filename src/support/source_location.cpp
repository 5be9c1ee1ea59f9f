//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Out-of-line validity query for `SourceLoc`.
/// @details Locations synthesized by the runtime (builtins, host calls) carry
///          no file id; diagnostics use this predicate to elide the path
///          prefix for them.

#include "support/source_location.hpp"

namespace fountain::support
{

/// @brief Determine whether the location carries a real source attachment.
/// @return True when the location originated from a tracked source buffer.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace fountain::support
