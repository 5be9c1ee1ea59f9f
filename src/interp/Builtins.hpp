//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Host functions shipped with the interpreter.

#pragma once

#include "interp/Value.hpp"

#include <vector>

namespace fountain::interp
{

class Interpreter;

/// @brief Seconds since the Unix epoch as a Number.
Value builtinClock(const std::vector<Value> &args);

/// @brief Entry count of a table or byte length of a string.
Value builtinLen(const std::vector<Value> &args);

/// @brief Display string of any value.
Value builtinStr(const std::vector<Value> &args);

/// @brief Kind name of any value ("nil", "number", "table", ...).
Value builtinType(const std::vector<Value> &args);

/// @brief Bind clock, len, str and type in the root environment.
void installStandardBuiltins(Interpreter &interp);

} // namespace fountain::interp
