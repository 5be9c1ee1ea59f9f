//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement nodes of the Fountain AST.
///
/// @details Statements are identified by StmtKind. Bodies of `if` and `for`
/// are BlockStmt nodes so that each entry runs in a fresh scope; a function
/// body is a plain statement list because the call frame already provides
/// the scope.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/AST_Expr.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fountain::frontends::fountain
{

/// @brief Discriminator for statement nodes.
enum class StmtKind
{
    Expr,
    Print,
    Assign,
    Block,
    If,
    For,
    Break,
    Continue,
    Return,
    FnDecl,
    Assert,
};

/// @brief Short lowercase name of a statement kind ("print", "for", ...).
const char *stmtKindToString(StmtKind kind);

/// @brief Base class for all statement nodes.
struct Stmt
{
    StmtKind kind;
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

/// @brief Expression evaluated for its side effects (and REPL echo).
struct ExprStmt : Stmt
{
    ExprPtr expr;

    ExprStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expr, l), expr(std::move(e)) {}
};

/// @brief `print expr`.
struct PrintStmt : Stmt
{
    ExprPtr expr;

    PrintStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Print, l), expr(std::move(e)) {}
};

/// @brief Assignment operator; compound forms read the target first.
enum class AssignOp
{
    Assign, ///< `=`
    Add,    ///< `+=`
    Sub,    ///< `-=`
    Mul,    ///< `*=`
    Div,    ///< `/=`
};

/// @brief `target = value` or a compound assignment.
/// @invariant target is an IdentExpr, IndexExpr or FieldExpr.
struct AssignStmt : Stmt
{
    ExprPtr target;
    AssignOp op;
    ExprPtr value;

    AssignStmt(SourceLoc l, ExprPtr t, AssignOp o, ExprPtr v)
        : Stmt(StmtKind::Assign, l), target(std::move(t)), op(o), value(std::move(v))
    {
    }
};

/// @brief Statement sequence executed in a fresh child scope.
struct BlockStmt : Stmt
{
    StmtList statements;

    BlockStmt(SourceLoc l, StmtList s) : Stmt(StmtKind::Block, l), statements(std::move(s)) {}
};

/// @brief `if cond do ... else ... end`.
struct IfStmt : Stmt
{
    ExprPtr condition;
    BlockPtr thenBlock;
    BlockPtr elseBlock; ///< Null when there is no `else`.

    IfStmt(SourceLoc l, ExprPtr c, BlockPtr t, BlockPtr e)
        : Stmt(StmtKind::If, l), condition(std::move(c)), thenBlock(std::move(t)),
          elseBlock(std::move(e))
    {
    }
};

/// @brief `for do ... end`: an unconditional loop left only by break or return.
struct ForStmt : Stmt
{
    BlockPtr body;

    ForStmt(SourceLoc l, BlockPtr b) : Stmt(StmtKind::For, l), body(std::move(b)) {}
};

struct BreakStmt : Stmt
{
    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

struct ContinueStmt : Stmt
{
    explicit ContinueStmt(SourceLoc l) : Stmt(StmtKind::Continue, l) {}
};

/// @brief `return` with an optional value; a missing value returns nil.
struct ReturnStmt : Stmt
{
    ExprPtr value;

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}
};

/// @brief Function parameter with an optional default expression.
struct Param
{
    std::string name;
    ExprPtr defaultValue; ///< Evaluated in the callee's frame when needed.
    SourceLoc loc;
};

/// @brief `fn name(params) body end`.
/// @invariant Parameters without defaults precede those with defaults, and
///            parameter names are unique.
struct FnDeclStmt : Stmt
{
    std::string name;
    std::vector<Param> params;
    StmtList body;

    FnDeclStmt(SourceLoc l, std::string n, std::vector<Param> p, StmtList b)
        : Stmt(StmtKind::FnDecl, l), name(std::move(n)), params(std::move(p)), body(std::move(b))
    {
    }
};

/// @brief `assert cond` or `assert cond, message`.
struct AssertStmt : Stmt
{
    ExprPtr condition;
    ExprPtr message; ///< Null when absent.

    AssertStmt(SourceLoc l, ExprPtr c, ExprPtr m)
        : Stmt(StmtKind::Assert, l), condition(std::move(c)), message(std::move(m))
    {
    }
};

/// @brief Root of a parsed source buffer.
struct Program
{
    StmtList statements;
    uint32_t fileId = 0;
};

using ProgramPtr = std::unique_ptr<Program>;

} // namespace fountain::frontends::fountain
