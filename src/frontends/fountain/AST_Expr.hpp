//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression nodes of the Fountain AST.
///
/// @details Every node derives from Expr and is identified by its ExprKind
/// tag; consumers switch on the tag and static_cast to the concrete type.
/// Nodes are built once by the Parser and never mutated afterwards.
///
/// ## Precedence (lowest to highest)
///
/// | Level       | Operators               | Associativity |
/// |-------------|-------------------------|---------------|
/// | conditional | `a if c else b`         | right         |
/// | disjunction | `or`                    | left          |
/// | conjunction | `and`                   | left          |
/// | equality    | `==` `!=`               | left          |
/// | comparison  | `<` `<=` `>` `>=`       | left          |
/// | term        | `+` `-`                 | left          |
/// | factor      | `*` `/`                 | left          |
/// | unary       | `-` `not`               | right         |
/// | call        | `f(...)` `t[k]` `t.name`| left          |
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/AST_Fwd.hpp"

#include <optional>
#include <string>
#include <utility>

namespace fountain::frontends::fountain
{

/// @brief Discriminator for expression nodes.
enum class ExprKind
{
    NilLiteral,
    BoolLiteral,
    NumberLiteral,
    StringLiteral,
    Ident,
    Unary,
    Binary,
    Logical,
    Conditional,
    Call,
    Index,
    Field,
    Grouping,
    Table,
};

/// @brief Readable node name used by diagnostics ("call", "table", ...).
const char *exprKindToString(ExprKind kind);

/// @brief Base class for all expression nodes.
struct Expr
{
    /// @brief Identifies the concrete expression kind for downcasting.
    ExprKind kind;

    /// @brief Location of the first token of the expression.
    SourceLoc loc;

    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

/// @brief The `nil` literal.
struct NilLiteralExpr : Expr
{
    explicit NilLiteralExpr(SourceLoc l) : Expr(ExprKind::NilLiteral, l) {}
};

/// @brief `true` or `false`.
struct BoolLiteralExpr : Expr
{
    bool value;

    BoolLiteralExpr(SourceLoc l, bool v) : Expr(ExprKind::BoolLiteral, l), value(v) {}
};

/// @brief Numeric literal. Integer and decimal spellings both become a double.
struct NumberLiteralExpr : Expr
{
    double value;

    NumberLiteralExpr(SourceLoc l, double v) : Expr(ExprKind::NumberLiteral, l), value(v) {}
};

/// @brief String literal with its quotes removed.
struct StringLiteralExpr : Expr
{
    std::string value;

    StringLiteralExpr(SourceLoc l, std::string v)
        : Expr(ExprKind::StringLiteral, l), value(std::move(v))
    {
    }
};

/// @brief Reference to a variable by name.
struct IdentExpr : Expr
{
    std::string name;

    IdentExpr(SourceLoc l, std::string n) : Expr(ExprKind::Ident, l), name(std::move(n)) {}
};

/// @brief Unary operators for UnaryExpr.
enum class UnaryOp
{
    Neg, ///< Arithmetic negation: `-a`; requires a number.
    Not, ///< Logical negation: `not a`; accepts any value.
};

/// @brief Prefix operator application.
struct UnaryExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;

    UnaryExpr(SourceLoc l, UnaryOp o, ExprPtr e)
        : Expr(ExprKind::Unary, l), op(o), operand(std::move(e))
    {
    }
};

/// @brief Eagerly evaluated binary operators.
enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

/// @brief Arithmetic, comparison or equality; both operands are evaluated.
struct BinaryExpr : Expr
{
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Binary, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

/// @brief Short-circuiting operators.
enum class LogicalOp
{
    And,
    Or,
};

/// @brief `a and b` / `a or b`.
/// @details Kept apart from BinaryExpr because the right operand is evaluated
/// lazily and the result is one of the operand values, not a coerced Bool.
struct LogicalExpr : Expr
{
    LogicalOp op;
    ExprPtr left;
    ExprPtr right;

    LogicalExpr(SourceLoc l, LogicalOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Logical, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

/// @brief `thenExpr if condition else elseExpr`; only one branch is evaluated.
struct ConditionalExpr : Expr
{
    ExprPtr thenExpr;
    ExprPtr condition;
    ExprPtr elseExpr;

    ConditionalExpr(SourceLoc l, ExprPtr t, ExprPtr c, ExprPtr e)
        : Expr(ExprKind::Conditional, l), thenExpr(std::move(t)), condition(std::move(c)),
          elseExpr(std::move(e))
    {
    }
};

/// @brief Call argument, positional when @ref name is empty.
struct CallArg
{
    /// @brief The argument name if using named syntax, nullopt for positional.
    std::optional<std::string> name;

    /// @brief The argument value expression.
    ExprPtr value;

    /// @brief Location of the argument (its name for named arguments).
    SourceLoc loc;
};

/// @brief Function call: `f(1, 2, y = 3)`.
/// @invariant All positional arguments precede all named arguments, and no
///            name appears twice. The parser rejects anything else.
struct CallExpr : Expr
{
    ExprPtr callee;
    std::vector<CallArg> args;

    CallExpr(SourceLoc l, ExprPtr c, std::vector<CallArg> a)
        : Expr(ExprKind::Call, l), callee(std::move(c)), args(std::move(a))
    {
    }
};

/// @brief Table subscript: `t[k]`.
struct IndexExpr : Expr
{
    ExprPtr base;
    ExprPtr index;

    IndexExpr(SourceLoc l, ExprPtr b, ExprPtr i)
        : Expr(ExprKind::Index, l), base(std::move(b)), index(std::move(i))
    {
    }
};

/// @brief Field access `t.name`, equivalent to `t["name"]`.
struct FieldExpr : Expr
{
    ExprPtr base;
    std::string field;

    FieldExpr(SourceLoc l, ExprPtr b, std::string f)
        : Expr(ExprKind::Field, l), base(std::move(b)), field(std::move(f))
    {
    }
};

/// @brief Parenthesized expression, kept so renderers can reproduce grouping.
struct GroupingExpr : Expr
{
    ExprPtr inner;

    GroupingExpr(SourceLoc l, ExprPtr e) : Expr(ExprKind::Grouping, l), inner(std::move(e)) {}
};

/// @brief Shape of one entry in a table constructor.
enum class TableItemKind
{
    Positional, ///< `expr`; keyed by the running positional counter
    Named,      ///< `name = expr`; keyed by the string "name"
    Keyed,      ///< `[key] = expr`
};

struct TableItem
{
    TableItemKind kind = TableItemKind::Positional;
    std::string name; ///< Only for Named items.
    ExprPtr key;      ///< Only for Keyed items.
    ExprPtr value;
    SourceLoc loc;
};

/// @brief Table constructor: `{10, 20, x = 1, ["k"] = 2}`.
/// @details Positional items are keyed 0, 1, 2, ... counting positional
/// items only, in source order.
struct TableExpr : Expr
{
    std::vector<TableItem> items;

    TableExpr(SourceLoc l, std::vector<TableItem> i)
        : Expr(ExprKind::Table, l), items(std::move(i))
    {
    }
};

} // namespace fountain::frontends::fountain
