//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Function calls and argument binding.
/// @details Binding order for closures:
///            1. positional arguments fill parameters left to right;
///            2. named arguments fill the parameter of the same name;
///            3. remaining parameters take their defaults, evaluated in the
///               new call environment so they can see earlier parameters.
///          The callee and every argument stay rooted until the call returns.

#include "interp/Interpreter.hpp"

#include "interp/Environment.hpp"

#include <string>

namespace fountain::interp
{

using namespace fountain::frontends::fountain;

namespace
{

/// @brief Tracks Fountain call nesting for the lifetime of one call.
class CallDepthGuard
{
  public:
    explicit CallDepthGuard(size_t &depth) : depth_(depth)
    {
        ++depth_;
    }

    ~CallDepthGuard()
    {
        --depth_;
    }

    CallDepthGuard(const CallDepthGuard &) = delete;
    CallDepthGuard &operator=(const CallDepthGuard &) = delete;

  private:
    size_t &depth_;
};

[[noreturn]] void throwArityError(const std::string &fn, size_t expected, size_t given, SourceLoc loc)
{
    std::string msg = fn + "() takes " + std::to_string(expected) + " positional argument" +
                      (expected == 1 ? "" : "s") + " but " + std::to_string(given) +
                      (given == 1 ? " was" : " were") + " given";
    throw RuntimeError(ErrorKind::ArgumentError, msg, loc);
}

[[noreturn]] void throwArgumentError(const std::string &fn, const std::string &what, SourceLoc loc)
{
    throw RuntimeError(ErrorKind::ArgumentError, fn + "() " + what, loc);
}

} // namespace

Value Interpreter::evalCall(const CallExpr &expr, Environment &env)
{
    TempRootScope roots(*this);
    Value callee = eval(*expr.callee, env);
    if (!callee.isFunction())
    {
        throw RuntimeError(ErrorKind::TypeError,
                           "can only call functions, not " +
                               std::string(valueKindName(callee.kind())),
                           expr.loc);
    }
    roots.add(callee);

    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> named;
    positional.reserve(expr.args.size());
    for (const auto &arg : expr.args)
    {
        Value value = eval(*arg.value, env);
        roots.add(value);
        if (arg.name)
            named.emplace_back(*arg.name, std::move(value));
        else
            positional.push_back(std::move(value));
    }

    Function *fn = callee.asFunction();
    if (fn->kind() == Function::Kind::Builtin)
        return callBuiltin(static_cast<const Builtin &>(*fn), positional, named, expr.loc);
    return callClosure(static_cast<Closure &>(*fn), positional, named, expr.loc);
}

Value Interpreter::callClosure(Closure &fn,
                               std::vector<Value> &positional,
                               std::vector<std::pair<std::string, Value>> &named,
                               SourceLoc loc)
{
    if (callDepth_ >= options_.maxCallDepth)
        throw RuntimeError(ErrorKind::ResourceError, "maximum recursion depth exceeded", loc);
    checkStack(loc);
    CallDepthGuard depth(callDepth_);

    const FnDeclStmt &decl = fn.decl();
    const auto &params = decl.params;
    if (positional.size() > params.size())
        throwArityError(fn.name(), params.size(), positional.size(), loc);

    Environment *callEnv = newEnvironment(fn.captured());
    FrameScope frame(*this, callEnv);

    std::vector<bool> bound(params.size(), false);
    for (size_t i = 0; i < positional.size(); ++i)
    {
        callEnv->define(params[i].name, std::move(positional[i]));
        bound[i] = true;
    }

    for (auto &[name, value] : named)
    {
        size_t slot = 0;
        while (slot < params.size() && params[slot].name != name)
            ++slot;
        if (slot == params.size())
            throwArgumentError(fn.name(), "got an unexpected keyword argument '" + name + "'", loc);
        if (bound[slot])
            throwArgumentError(fn.name(), "got multiple values for argument '" + name + "'", loc);
        callEnv->define(name, std::move(value));
        bound[slot] = true;
    }

    for (size_t i = 0; i < params.size(); ++i)
    {
        if (!bound[i] && !params[i].defaultValue)
            throwArgumentError(fn.name(), "missing required argument '" + params[i].name + "'", loc);
    }

    for (size_t i = 0; i < params.size(); ++i)
    {
        if (bound[i])
            continue;
        callEnv->define(params[i].name, eval(*params[i].defaultValue, *callEnv));
    }

    ExecResult result = execStatements(decl.body, *callEnv);
    switch (result.kind)
    {
        case ExecResult::Kind::Completed:
            return Value::nil();
        case ExecResult::Kind::Returned:
            return result.value;
        case ExecResult::Kind::Broke:
            throw RuntimeError(ErrorKind::ControlFlowError, "'break' outside loop", result.loc);
        case ExecResult::Kind::Continued:
            throw RuntimeError(ErrorKind::ControlFlowError, "'continue' outside loop", result.loc);
    }
    return Value::nil();
}

Value Interpreter::callBuiltin(const Builtin &fn,
                               const std::vector<Value> &positional,
                               const std::vector<std::pair<std::string, Value>> &named,
                               SourceLoc loc)
{
    if (!named.empty())
    {
        throwArgumentError(
            fn.name(), "got an unexpected keyword argument '" + named.front().first + "'", loc);
    }
    if (fn.arity() != kVariadic && positional.size() != static_cast<size_t>(fn.arity()))
        throwArityError(fn.name(), static_cast<size_t>(fn.arity()), positional.size(), loc);

    try
    {
        return fn.invoke(positional);
    }
    catch (RuntimeError &err)
    {
        err.setLocIfMissing(loc);
        throw;
    }
}

} // namespace fountain::interp
