//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Completion record returned by statement execution.
/// @details break, continue and return travel outward as ExecResult values.
///          Each block, loop and call frame inspects the result and either
///          consumes it or hands it to its caller.

#pragma once

#include "interp/Value.hpp"
#include "support/source_location.hpp"

namespace fountain::interp
{

struct ExecResult
{
    enum class Kind
    {
        Completed,
        Broke,
        Continued,
        Returned,
    };

    Kind kind = Kind::Completed;
    Value value; ///< Return value; nil unless kind == Returned.
    fountain::support::SourceLoc loc{}; ///< Statement that raised the signal.

    static ExecResult completed()
    {
        return {};
    }

    static ExecResult broke(fountain::support::SourceLoc at)
    {
        return {Kind::Broke, Value::nil(), at};
    }

    static ExecResult continued(fountain::support::SourceLoc at)
    {
        return {Kind::Continued, Value::nil(), at};
    }

    static ExecResult returned(Value v, fountain::support::SourceLoc at)
    {
        return {Kind::Returned, std::move(v), at};
    }

    [[nodiscard]] bool isCompleted() const
    {
        return kind == Kind::Completed;
    }
};

} // namespace fountain::interp
