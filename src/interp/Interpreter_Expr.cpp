//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Expression evaluation for the Fountain interpreter.
/// @details Operands are evaluated left to right. A heap value produced by an
///          earlier operand is pushed as a temporary root before the next
///          operand runs, since that operand may call a function whose
///          statements trigger a collection.

#include "interp/Interpreter.hpp"

#include "interp/Environment.hpp"
#include "interp/Table.hpp"

#include <string>

namespace fountain::interp
{

using namespace fountain::frontends::fountain;

namespace
{

const char *binaryOpSpelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
    }
    return "?";
}

std::string notIndexable(const Value &base)
{
    return "can only index tables, not " + std::string(valueKindName(base.kind()));
}

} // namespace

Value Interpreter::eval(const Expr &expr, Environment &env)
{
    checkStack(expr.loc);
    switch (expr.kind)
    {
        case ExprKind::NilLiteral:
            return Value::nil();
        case ExprKind::BoolLiteral:
            return Value::boolean(static_cast<const BoolLiteralExpr &>(expr).value);
        case ExprKind::NumberLiteral:
            return Value::number(static_cast<const NumberLiteralExpr &>(expr).value);
        case ExprKind::StringLiteral:
            return Value::string(static_cast<const StringLiteralExpr &>(expr).value);
        case ExprKind::Ident:
            return evalIdent(static_cast<const IdentExpr &>(expr), env);
        case ExprKind::Unary:
            return evalUnary(static_cast<const UnaryExpr &>(expr), env);
        case ExprKind::Binary:
            return evalBinary(static_cast<const BinaryExpr &>(expr), env);
        case ExprKind::Logical:
            return evalLogical(static_cast<const LogicalExpr &>(expr), env);
        case ExprKind::Conditional:
            return evalConditional(static_cast<const ConditionalExpr &>(expr), env);
        case ExprKind::Call:
            return evalCall(static_cast<const CallExpr &>(expr), env);
        case ExprKind::Index:
            return evalIndex(static_cast<const IndexExpr &>(expr), env);
        case ExprKind::Field:
            return evalField(static_cast<const FieldExpr &>(expr), env);
        case ExprKind::Grouping:
            return eval(*static_cast<const GroupingExpr &>(expr).inner, env);
        case ExprKind::Table:
            return evalTable(static_cast<const TableExpr &>(expr), env);
    }
    return Value::nil();
}

Value Interpreter::evalIdent(const IdentExpr &expr, Environment &env)
{
    if (const Value *value = env.lookup(expr.name))
        return *value;
    throw RuntimeError(
        ErrorKind::UndefinedNameError, "name '" + expr.name + "' is not defined", expr.loc);
}

Value Interpreter::evalUnary(const UnaryExpr &expr, Environment &env)
{
    Value operand = eval(*expr.operand, env);
    switch (expr.op)
    {
        case UnaryOp::Neg:
            if (!operand.isNumber())
                throw RuntimeError(
                    ErrorKind::TypeError, "operand must be a number for '-'", expr.loc);
            return Value::number(-operand.asNumber());
        case UnaryOp::Not:
            return Value::boolean(!operand.truthy());
    }
    return Value::nil();
}

Value Interpreter::evalBinary(const BinaryExpr &expr, Environment &env)
{
    TempRootScope roots(*this);
    Value lhs = eval(*expr.left, env);
    roots.add(lhs);
    Value rhs = eval(*expr.right, env);

    switch (expr.op)
    {
        case BinaryOp::Eq:
            return Value::boolean(lhs == rhs);
        case BinaryOp::Ne:
            return Value::boolean(lhs != rhs);
        default:
            return numericOp(expr.op, lhs, rhs, expr.loc);
    }
}

/// @details Division follows IEEE-754: dividing by zero yields an infinity
///          or NaN rather than an error.
Value Interpreter::numericOp(BinaryOp op, const Value &lhs, const Value &rhs, SourceLoc loc) const
{
    if (!lhs.isNumber() || !rhs.isNumber())
    {
        throw RuntimeError(ErrorKind::TypeError,
                           std::string("operands must be numbers for '") + binaryOpSpelling(op) +
                               "'",
                           loc);
    }

    const double a = lhs.asNumber();
    const double b = rhs.asNumber();
    switch (op)
    {
        case BinaryOp::Add:
            return Value::number(a + b);
        case BinaryOp::Sub:
            return Value::number(a - b);
        case BinaryOp::Mul:
            return Value::number(a * b);
        case BinaryOp::Div:
            return Value::number(a / b);
        case BinaryOp::Lt:
            return Value::boolean(a < b);
        case BinaryOp::Le:
            return Value::boolean(a <= b);
        case BinaryOp::Gt:
            return Value::boolean(a > b);
        case BinaryOp::Ge:
            return Value::boolean(a >= b);
        case BinaryOp::Eq:
            return Value::boolean(a == b);
        case BinaryOp::Ne:
            return Value::boolean(a != b);
    }
    return Value::nil();
}

Value Interpreter::evalLogical(const LogicalExpr &expr, Environment &env)
{
    Value lhs = eval(*expr.left, env);
    if (expr.op == LogicalOp::And)
        return lhs.truthy() ? eval(*expr.right, env) : lhs;
    return lhs.truthy() ? lhs : eval(*expr.right, env);
}

Value Interpreter::evalConditional(const ConditionalExpr &expr, Environment &env)
{
    if (eval(*expr.condition, env).truthy())
        return eval(*expr.thenExpr, env);
    return eval(*expr.elseExpr, env);
}

Value Interpreter::evalIndex(const IndexExpr &expr, Environment &env)
{
    TempRootScope roots(*this);
    Value base = eval(*expr.base, env);
    roots.add(base);
    Value key = eval(*expr.index, env);
    return indexGet(base, key, expr.loc);
}

Value Interpreter::evalField(const FieldExpr &expr, Environment &env)
{
    Value base = eval(*expr.base, env);
    return indexGet(base, Value::string(expr.field), expr.loc);
}

Value Interpreter::evalTable(const TableExpr &expr, Environment &env)
{
    Table *table = newTable();
    TempRootScope roots(*this);
    roots.add(Value::table(table));

    double nextPositional = 0;
    for (const auto &item : expr.items)
    {
        switch (item.kind)
        {
            case TableItemKind::Positional:
            {
                Value value = eval(*item.value, env);
                table->set(Value::number(nextPositional), std::move(value));
                nextPositional += 1;
                break;
            }
            case TableItemKind::Named:
            {
                Value value = eval(*item.value, env);
                table->set(Value::string(item.name), std::move(value));
                break;
            }
            case TableItemKind::Keyed:
            {
                Value key = eval(*item.key, env);
                if (auto problem = Table::validateKey(key))
                    throw RuntimeError(ErrorKind::TypeError, std::string(*problem), item.loc);
                roots.add(key);
                Value value = eval(*item.value, env);
                table->set(key, std::move(value));
                break;
            }
        }
    }
    return Value::table(table);
}

Value Interpreter::indexGet(const Value &base, const Value &key, SourceLoc loc) const
{
    if (!base.isTable())
        throw RuntimeError(ErrorKind::TypeError, notIndexable(base), loc);
    return base.asTable()->get(key);
}

void Interpreter::indexSet(const Value &base, const Value &key, Value value, SourceLoc loc)
{
    if (!base.isTable())
        throw RuntimeError(ErrorKind::TypeError, notIndexable(base), loc);
    if (auto problem = Table::validateKey(key))
        throw RuntimeError(ErrorKind::TypeError, std::string(*problem), loc);
    base.asTable()->set(key, std::move(value));
}

} // namespace fountain::interp
