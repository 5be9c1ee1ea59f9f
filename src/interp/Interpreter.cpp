//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Interpreter setup, program execution and garbage collection.
/// @details Statement and expression evaluation live in Interpreter_Stmt.cpp,
///          Interpreter_Expr.cpp and Interpreter_Call.cpp.

#include "interp/Interpreter.hpp"

#include "interp/Environment.hpp"
#include "interp/Table.hpp"

#include <algorithm>
#include <iostream>

#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace fountain::interp
{

using namespace fountain::frontends::fountain;

Interpreter::Interpreter(InterpreterOptions options)
    : options_(options), out_(&std::cout), traceOut_(&std::cerr)
{
    globals_ = heap_.make<Environment>(nullptr);
    nextCollectAt_ = options_.gcThreshold;
}

Interpreter::~Interpreter() = default;

void Interpreter::defineBuiltin(const std::string &name, int arity, BuiltinFn fn)
{
    Builtin *builtin = heap_.make<Builtin>(name, arity, std::move(fn));
    globals_->define(name, Value::function(builtin));
}

Table *Interpreter::newTable()
{
    return heap_.make<Table>();
}

Environment *Interpreter::newEnvironment(Environment *parent)
{
    return heap_.make<Environment>(parent);
}

void Interpreter::execute(ProgramPtr program)
{
    lastValue_ = Value::nil();
    errorPayload_ = Value::nil();
    stackBase_ = stackAddress();
    programs_.push_back(std::move(program));

    try
    {
        executeProgram(*programs_.back());
    }
    catch (const RuntimeError &err)
    {
        errorPayload_ = err.payload();
        throw;
    }
}

void Interpreter::executeProgram(const Program &prog)
{
    for (const auto &stmt : prog.statements)
    {
        if (stmt->kind == StmtKind::Expr)
        {
            maybeCollect();
            if (options_.trace)
                traceStmt(*stmt);
            lastValue_ = eval(*static_cast<const ExprStmt &>(*stmt).expr, *globals_);
            continue;
        }

        ExecResult result = execStmt(*stmt, *globals_);
        switch (result.kind)
        {
            case ExecResult::Kind::Completed:
                break;
            case ExecResult::Kind::Returned:
                return;
            case ExecResult::Kind::Broke:
                throw RuntimeError(ErrorKind::ControlFlowError, "'break' outside loop", result.loc);
            case ExecResult::Kind::Continued:
                throw RuntimeError(
                    ErrorKind::ControlFlowError, "'continue' outside loop", result.loc);
        }
    }
}

size_t Interpreter::collectGarbage()
{
    const size_t freed = heap_.collect([this](GcMarker &marker) { markRoots(marker); });
    nextCollectAt_ = std::max(options_.gcThreshold, heap_.liveCount() * kGcGrowthFactor);
    return freed;
}

std::uintptr_t Interpreter::stackAddress()
{
#if defined(_MSC_VER)
    return reinterpret_cast<std::uintptr_t>(_AddressOfReturnAddress());
#else
    return reinterpret_cast<std::uintptr_t>(__builtin_frame_address(0));
#endif
}

void Interpreter::checkStack(SourceLoc loc) const
{
    const std::uintptr_t here = stackAddress();
    const std::uintptr_t used = here < stackBase_ ? stackBase_ - here : here - stackBase_;
    if (used > options_.maxStackBytes)
        throw RuntimeError(ErrorKind::ResourceError, "maximum recursion depth exceeded", loc);
}

void Interpreter::maybeCollect()
{
    if (options_.gcThreshold != 0 && heap_.liveCount() < nextCollectAt_)
        return;
    collectGarbage();
}

void Interpreter::markRoots(GcMarker &marker) const
{
    marker.mark(globals_);
    for (Environment *env : frames_)
        marker.mark(env);
    for (GcObject *obj : tempRoots_)
        marker.mark(obj);
    marker.mark(lastValue_);
    marker.mark(errorPayload_);
}

void Interpreter::traceStmt(const Stmt &stmt)
{
    *traceOut_ << "[trace] line " << stmt.loc.line << ": " << stmtKindToString(stmt.kind) << '\n';
}

} // namespace fountain::interp
