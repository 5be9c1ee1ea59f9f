//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the standard builtins.

#include "interp/Builtins.hpp"

#include "interp/Interpreter.hpp"
#include "interp/RuntimeError.hpp"
#include "interp/Table.hpp"

#include <chrono>
#include <string>

namespace fountain::interp
{

Value builtinClock(const std::vector<Value> &)
{
    using namespace std::chrono;
    const auto now = system_clock::now().time_since_epoch();
    return Value::number(duration_cast<duration<double>>(now).count());
}

Value builtinLen(const std::vector<Value> &args)
{
    const Value &v = args.at(0);
    if (v.isTable())
        return Value::number(static_cast<double>(v.asTable()->size()));
    if (v.isString())
        return Value::number(static_cast<double>(v.asString().size()));
    throw RuntimeError(ErrorKind::TypeError,
                       "len() argument must be a table or string, not " +
                           std::string(valueKindName(v.kind())));
}

Value builtinStr(const std::vector<Value> &args)
{
    return Value::string(toDisplayString(args.at(0)));
}

Value builtinType(const std::vector<Value> &args)
{
    return Value::string(std::string(valueKindName(args.at(0).kind())));
}

void installStandardBuiltins(Interpreter &interp)
{
    interp.defineBuiltin("clock", 0, builtinClock);
    interp.defineBuiltin("len", 1, builtinLen);
    interp.defineBuiltin("str", 1, builtinStr);
    interp.defineBuiltin("type", 1, builtinType);
}

} // namespace fountain::interp
