//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Statement execution for the Fountain interpreter.
/// @details Each statement returns an ExecResult. Blocks, loops and call
///          frames are the only places that consume break, continue and
///          return signals; everything else hands them outward unchanged.

#include "interp/Interpreter.hpp"

#include "interp/Environment.hpp"

#include <ostream>

namespace fountain::interp
{

using namespace fountain::frontends::fountain;

namespace
{

BinaryOp compoundToBinary(AssignOp op)
{
    switch (op)
    {
        case AssignOp::Add:
            return BinaryOp::Add;
        case AssignOp::Sub:
            return BinaryOp::Sub;
        case AssignOp::Mul:
            return BinaryOp::Mul;
        case AssignOp::Div:
        case AssignOp::Assign:
            break;
    }
    return BinaryOp::Div;
}

} // namespace

ExecResult Interpreter::execStmt(const Stmt &stmt, Environment &env)
{
    maybeCollect();
    if (options_.trace)
        traceStmt(stmt);

    switch (stmt.kind)
    {
        case StmtKind::Expr:
            eval(*static_cast<const ExprStmt &>(stmt).expr, env);
            return ExecResult::completed();
        case StmtKind::Print:
            execPrint(static_cast<const PrintStmt &>(stmt), env);
            return ExecResult::completed();
        case StmtKind::Assign:
            execAssign(static_cast<const AssignStmt &>(stmt), env);
            return ExecResult::completed();
        case StmtKind::Block:
            return execBlock(static_cast<const BlockStmt &>(stmt), env);
        case StmtKind::If:
            return execIf(static_cast<const IfStmt &>(stmt), env);
        case StmtKind::For:
            return execFor(static_cast<const ForStmt &>(stmt), env);
        case StmtKind::Break:
            return ExecResult::broke(stmt.loc);
        case StmtKind::Continue:
            return ExecResult::continued(stmt.loc);
        case StmtKind::Return:
        {
            const auto &ret = static_cast<const ReturnStmt &>(stmt);
            Value value = ret.value ? eval(*ret.value, env) : Value::nil();
            return ExecResult::returned(std::move(value), stmt.loc);
        }
        case StmtKind::FnDecl:
            execFnDecl(static_cast<const FnDeclStmt &>(stmt), env);
            return ExecResult::completed();
        case StmtKind::Assert:
            execAssert(static_cast<const AssertStmt &>(stmt), env);
            return ExecResult::completed();
    }
    return ExecResult::completed();
}

ExecResult Interpreter::execStatements(const StmtList &stmts, Environment &env)
{
    for (const auto &stmt : stmts)
    {
        ExecResult result = execStmt(*stmt, env);
        if (!result.isCompleted())
            return result;
    }
    return ExecResult::completed();
}

ExecResult Interpreter::execBlock(const BlockStmt &block, Environment &env)
{
    checkStack(block.loc);
    Environment *scope = newEnvironment(&env);
    FrameScope frame(*this, scope);
    return execStatements(block.statements, *scope);
}

ExecResult Interpreter::execIf(const IfStmt &stmt, Environment &env)
{
    if (eval(*stmt.condition, env).truthy())
        return execBlock(*stmt.thenBlock, env);
    if (stmt.elseBlock)
        return execBlock(*stmt.elseBlock, env);
    return ExecResult::completed();
}

ExecResult Interpreter::execFor(const ForStmt &stmt, Environment &env)
{
    for (;;)
    {
        ExecResult result = execBlock(*stmt.body, env);
        switch (result.kind)
        {
            case ExecResult::Kind::Completed:
            case ExecResult::Kind::Continued:
                break;
            case ExecResult::Kind::Broke:
                return ExecResult::completed();
            case ExecResult::Kind::Returned:
                return result;
        }
    }
}

void Interpreter::execPrint(const PrintStmt &stmt, Environment &env)
{
    Value value = eval(*stmt.expr, env);
    *out_ << toDisplayString(value) << '\n';
}

void Interpreter::execFnDecl(const FnDeclStmt &stmt, Environment &env)
{
    Closure *fn = heap_.make<Closure>(stmt, &env);
    env.define(stmt.name, Value::function(fn));
}

void Interpreter::execAssert(const AssertStmt &stmt, Environment &env)
{
    if (eval(*stmt.condition, env).truthy())
        return;

    Value payload = stmt.message ? eval(*stmt.message, env) : Value::string("assertion failed");
    throw RuntimeError(ErrorKind::AssertionError, toDisplayString(payload), stmt.loc, payload);
}

/// @details The target's base and key are evaluated once, before the
///          right-hand side. Compound forms read the current value through
///          the same base and key and write the combined result back.
void Interpreter::execAssign(const AssignStmt &stmt, Environment &env)
{
    const Expr &target = *stmt.target;
    const bool compound = stmt.op != AssignOp::Assign;

    if (target.kind == ExprKind::Ident)
    {
        const auto &ident = static_cast<const IdentExpr &>(target);
        if (!compound)
        {
            env.assign(ident.name, eval(*stmt.value, env));
            return;
        }

        Value current = evalIdent(ident, env);
        TempRootScope roots(*this);
        roots.add(current);
        Value rhs = eval(*stmt.value, env);
        env.assign(ident.name, numericOp(compoundToBinary(stmt.op), current, rhs, stmt.loc));
        return;
    }

    TempRootScope roots(*this);
    Value base;
    Value key;
    if (target.kind == ExprKind::Index)
    {
        const auto &index = static_cast<const IndexExpr &>(target);
        base = eval(*index.base, env);
        roots.add(base);
        key = eval(*index.index, env);
        roots.add(key);
    }
    else
    {
        const auto &field = static_cast<const FieldExpr &>(target);
        base = eval(*field.base, env);
        roots.add(base);
        key = Value::string(field.field);
    }

    if (!compound)
    {
        Value value = eval(*stmt.value, env);
        indexSet(base, key, std::move(value), stmt.loc);
        return;
    }

    Value current = indexGet(base, key, stmt.loc);
    roots.add(current);
    Value rhs = eval(*stmt.value, env);
    indexSet(base, key, numericOp(compoundToBinary(stmt.op), current, rhs, stmt.loc), stmt.loc);
}

} // namespace fountain::interp
