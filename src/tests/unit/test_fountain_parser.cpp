//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Unit tests for the Fountain parser: precedence, statement forms, call and
// table syntax, assignment targets and nesting limits.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "FountainTestUtils.hpp"
#include "frontends/fountain/AST.hpp"

#include <string>

using namespace fountain::frontends::fountain;
using fountain::support::DiagnosticEngine;
using fountain::test::hasDiagContaining;
using fountain::test::parseExpr;
using fountain::test::parseProgram;

namespace
{

std::string repeat(const std::string &s, int n)
{
    std::string out;
    for (int i = 0; i < n; ++i)
        out += s;
    return out;
}

/// Build `f(0, 0, ...)` with @p n arguments.
std::string callWithArgs(int n)
{
    std::string src = "f(";
    for (int i = 0; i < n; ++i)
        src += i == 0 ? "0" : ", 0";
    return src + ")";
}

} // namespace

TEST(FountainParser, MultiplicationBindsTighterThanAddition)
{
    DiagnosticEngine diag;
    auto expr = parseExpr("1 + 2 * 3", diag);
    ASSERT_TRUE(expr);
    ASSERT_EQ(expr->kind, ExprKind::Binary);
    const auto &add = static_cast<const BinaryExpr &>(*expr);
    EXPECT_EQ(add.op, BinaryOp::Add);
    EXPECT_EQ(add.loc.column, 3u);
    ASSERT_EQ(add.right->kind, ExprKind::Binary);
    EXPECT_EQ(static_cast<const BinaryExpr &>(*add.right).op, BinaryOp::Mul);
}

TEST(FountainParser, SubtractionIsLeftAssociative)
{
    DiagnosticEngine diag;
    auto expr = parseExpr("10 - 4 - 3", diag);
    ASSERT_TRUE(expr);
    const auto &outer = static_cast<const BinaryExpr &>(*expr);
    EXPECT_EQ(outer.op, BinaryOp::Sub);
    ASSERT_EQ(outer.left->kind, ExprKind::Binary);
    EXPECT_EQ(outer.right->kind, ExprKind::NumberLiteral);
}

TEST(FountainParser, LogicalOperatorsBindLooserThanComparison)
{
    DiagnosticEngine diag;
    auto expr = parseExpr("a < b or c and not d == e", diag);
    ASSERT_TRUE(expr);
    ASSERT_EQ(expr->kind, ExprKind::Logical);
    const auto &orExpr = static_cast<const LogicalExpr &>(*expr);
    EXPECT_EQ(orExpr.op, LogicalOp::Or);
    EXPECT_EQ(orExpr.left->kind, ExprKind::Binary);
    ASSERT_EQ(orExpr.right->kind, ExprKind::Logical);
    const auto &andExpr = static_cast<const LogicalExpr &>(*orExpr.right);
    EXPECT_EQ(andExpr.op, LogicalOp::And);
    // `not` applies to `d`, and `==` applies to the result.
    ASSERT_EQ(andExpr.right->kind, ExprKind::Binary);
    const auto &eq = static_cast<const BinaryExpr &>(*andExpr.right);
    EXPECT_EQ(eq.op, BinaryOp::Eq);
    EXPECT_EQ(eq.left->kind, ExprKind::Unary);
}

TEST(FountainParser, UnaryMinusNests)
{
    DiagnosticEngine diag;
    auto expr = parseExpr("- -5", diag);
    ASSERT_TRUE(expr);
    ASSERT_EQ(expr->kind, ExprKind::Unary);
    EXPECT_EQ(static_cast<const UnaryExpr &>(*expr).operand->kind, ExprKind::Unary);
}

TEST(FountainParser, ConditionalIsRightAssociative)
{
    DiagnosticEngine diag;
    auto expr = parseExpr("a if c else b if d else e", diag);
    ASSERT_TRUE(expr);
    ASSERT_EQ(expr->kind, ExprKind::Conditional);
    const auto &cond = static_cast<const ConditionalExpr &>(*expr);
    EXPECT_EQ(cond.thenExpr->kind, ExprKind::Ident);
    EXPECT_EQ(cond.elseExpr->kind, ExprKind::Conditional);
}

TEST(FountainParser, TrailingIfWithoutElseStartsAnIfStatement)
{
    DiagnosticEngine diag;
    auto program = parseProgram("print 1 if x do print 2 end", diag);
    ASSERT_TRUE(program);
    ASSERT_EQ(program->statements.size(), 2u);
    EXPECT_EQ(program->statements[0]->kind, StmtKind::Print);
    EXPECT_EQ(program->statements[1]->kind, StmtKind::If);
    EXPECT_EQ(diag.errorCount(), 0u);
}

TEST(FountainParser, PostfixChainsApplyLeftToRight)
{
    DiagnosticEngine diag;
    auto expr = parseExpr("t.a[1](2)", diag);
    ASSERT_TRUE(expr);
    ASSERT_EQ(expr->kind, ExprKind::Call);
    const auto &call = static_cast<const CallExpr &>(*expr);
    EXPECT_EQ(call.loc.column, 7u);
    ASSERT_EQ(call.callee->kind, ExprKind::Index);
    const auto &index = static_cast<const IndexExpr &>(*call.callee);
    ASSERT_EQ(index.base->kind, ExprKind::Field);
    EXPECT_EQ(static_cast<const FieldExpr &>(*index.base).field, "a");
}

TEST(FountainParser, NamedAndPositionalArguments)
{
    DiagnosticEngine diag;
    auto expr = parseExpr("f(1, b = 2)", diag);
    ASSERT_TRUE(expr);
    const auto &call = static_cast<const CallExpr &>(*expr);
    ASSERT_EQ(call.args.size(), 2u);
    EXPECT_FALSE(call.args[0].name.has_value());
    ASSERT_TRUE(call.args[1].name.has_value());
    EXPECT_EQ(*call.args[1].name, "b");
}

TEST(FountainParser, PositionalAfterNamedIsRejected)
{
    DiagnosticEngine diag;
    EXPECT_FALSE(parseProgram("f(y = 5, 1)", diag));
    EXPECT_TRUE(hasDiagContaining(diag, "positional argument follows named argument"));
}

TEST(FountainParser, DuplicateNamedArgumentIsRejected)
{
    DiagnosticEngine diag;
    EXPECT_FALSE(parseProgram("f(a = 1, a = 2)", diag));
    EXPECT_TRUE(hasDiagContaining(diag, "duplicate named argument 'a'"));
}

TEST(FountainParser, ArgumentCountLimit)
{
    DiagnosticEngine ok;
    EXPECT_TRUE(parseProgram(callWithArgs(255), ok));
    EXPECT_EQ(ok.errorCount(), 0u);

    DiagnosticEngine tooMany;
    EXPECT_FALSE(parseProgram(callWithArgs(256), tooMany));
    EXPECT_TRUE(hasDiagContaining(tooMany, "more than 255 arguments"));
}

TEST(FountainParser, ParameterRules)
{
    DiagnosticEngine dup;
    EXPECT_FALSE(parseProgram("fn f(a, a) end", dup));
    EXPECT_TRUE(hasDiagContaining(dup, "duplicate parameter 'a'"));

    DiagnosticEngine order;
    EXPECT_FALSE(parseProgram("fn f(a = 1, b) end", order));
    EXPECT_TRUE(hasDiagContaining(order, "parameter without default follows parameter with default"));

    DiagnosticEngine good;
    auto program = parseProgram("fn f(a, b = a + 1) return b end", good);
    ASSERT_TRUE(program);
    const auto &fn = static_cast<const FnDeclStmt &>(*program->statements[0]);
    ASSERT_EQ(fn.params.size(), 2u);
    EXPECT_FALSE(fn.params[0].defaultValue);
    EXPECT_TRUE(fn.params[1].defaultValue);
    EXPECT_EQ(fn.body.size(), 1u);
}

TEST(FountainParser, AssignmentTargets)
{
    DiagnosticEngine diag;
    auto program = parseProgram("x = 1 t[1] = 2 t.f += 3 x /= 4", diag);
    ASSERT_TRUE(program);
    ASSERT_EQ(program->statements.size(), 4u);
    const auto &third = static_cast<const AssignStmt &>(*program->statements[2]);
    EXPECT_EQ(third.op, AssignOp::Add);
    EXPECT_EQ(third.target->kind, ExprKind::Field);
    EXPECT_EQ(static_cast<const AssignStmt &>(*program->statements[3]).op, AssignOp::Div);
}

TEST(FountainParser, InvalidAssignmentTargets)
{
    DiagnosticEngine literal;
    EXPECT_FALSE(parseProgram("1 = 2", literal));
    EXPECT_TRUE(hasDiagContaining(literal, "cannot assign to literal"));

    DiagnosticEngine call;
    EXPECT_FALSE(parseProgram("f() = 1", call));
    EXPECT_TRUE(hasDiagContaining(call, "cannot assign to call"));

    DiagnosticEngine grouping;
    EXPECT_FALSE(parseProgram("(a) = 1", grouping));
    EXPECT_TRUE(hasDiagContaining(grouping, "cannot assign to grouping"));
}

TEST(FountainParser, SemicolonsAreOptionalSeparators)
{
    DiagnosticEngine diag;
    auto program = parseProgram("x = 1; y = 2; print x", diag);
    ASSERT_TRUE(program);
    EXPECT_EQ(program->statements.size(), 3u);
}

TEST(FountainParser, StatementForms)
{
    DiagnosticEngine diag;
    auto program = parseProgram("do end\n"
                                "if a do b() else c() end\n"
                                "for do break end\n"
                                "fn g() return end\n"
                                "assert x, 'bad'\n",
                                diag);
    ASSERT_TRUE(program);
    ASSERT_EQ(program->statements.size(), 5u);
    EXPECT_EQ(program->statements[0]->kind, StmtKind::Block);
    const auto &ifStmt = static_cast<const IfStmt &>(*program->statements[1]);
    EXPECT_TRUE(ifStmt.elseBlock);
    EXPECT_EQ(program->statements[2]->kind, StmtKind::For);
    const auto &fn = static_cast<const FnDeclStmt &>(*program->statements[3]);
    ASSERT_EQ(fn.body.size(), 1u);
    EXPECT_FALSE(static_cast<const ReturnStmt &>(*fn.body[0]).value);
    const auto &assertStmt = static_cast<const AssertStmt &>(*program->statements[4]);
    EXPECT_TRUE(assertStmt.message);
}

TEST(FountainParser, TableItems)
{
    DiagnosticEngine diag;
    auto expr = parseExpr("{1, b = 2, ['c'] = 3,}", diag);
    ASSERT_TRUE(expr);
    ASSERT_EQ(expr->kind, ExprKind::Table);
    const auto &table = static_cast<const TableExpr &>(*expr);
    ASSERT_EQ(table.items.size(), 3u);
    EXPECT_EQ(table.items[0].kind, TableItemKind::Positional);
    EXPECT_EQ(table.items[1].kind, TableItemKind::Named);
    EXPECT_EQ(table.items[1].name, "b");
    EXPECT_EQ(table.items[2].kind, TableItemKind::Keyed);
    EXPECT_TRUE(table.items[2].key);
}

TEST(FountainParser, TableSyntaxErrors)
{
    DiagnosticEngine missingEq;
    EXPECT_FALSE(parseProgram("t = {[1] 2}", missingEq));
    EXPECT_TRUE(hasDiagContaining(missingEq, "expected '=' after table key"));

    DiagnosticEngine missingBracket;
    EXPECT_FALSE(parseProgram("t = {[1 = 2}", missingBracket));
    EXPECT_TRUE(hasDiagContaining(missingBracket, "expected ']' after table key"));

    DiagnosticEngine unclosed;
    EXPECT_FALSE(parseProgram("t = {1 2}", unclosed));
    EXPECT_TRUE(hasDiagContaining(unclosed, "expected '}' to close table"));
}

TEST(FountainParser, MissingEndIsReported)
{
    DiagnosticEngine diag;
    EXPECT_FALSE(parseProgram("if x do print 1", diag));
    EXPECT_TRUE(hasDiagContaining(diag, "expected 'end' to close 'if'"));
}

TEST(FountainParser, OnlyFirstErrorIsReported)
{
    DiagnosticEngine diag;
    EXPECT_FALSE(parseProgram("print\nprint )", diag));
    ASSERT_EQ(diag.diagnostics().size(), 1u);
    EXPECT_EQ(diag.diagnostics()[0].message, "expected expression");
    EXPECT_EQ(diag.diagnostics()[0].code, "F2000");
    EXPECT_EQ(diag.diagnostics()[0].loc.line, 2u);
}

TEST(FountainParser, LexErrorIsNotReportedTwice)
{
    DiagnosticEngine diag;
    EXPECT_FALSE(parseProgram("x = @", diag));
    ASSERT_EQ(diag.diagnostics().size(), 1u);
    EXPECT_EQ(diag.diagnostics()[0].code, "F1000");
}

TEST(FountainParser, ExpressionNestingLimit)
{
    DiagnosticEngine shallow;
    EXPECT_TRUE(parseProgram("x = " + repeat("(", 200) + "1" + repeat(")", 200), shallow));

    DiagnosticEngine deep;
    EXPECT_FALSE(parseProgram("x = " + repeat("(", 300) + "1" + repeat(")", 300), deep));
    EXPECT_TRUE(hasDiagContaining(deep, "expression nesting too deep (limit: 256)"));
}

TEST(FountainParser, StatementNestingLimit)
{
    DiagnosticEngine shallow;
    EXPECT_TRUE(parseProgram(repeat("do ", 100) + repeat("end ", 100), shallow));

    DiagnosticEngine deep;
    EXPECT_FALSE(parseProgram(repeat("do ", 300) + repeat("end ", 300), deep));
    EXPECT_TRUE(hasDiagContaining(deep, "statement nesting too deep (limit: 256)"));
}

TEST(FountainParser, StandaloneExpressionRejectsTrailingTokens)
{
    DiagnosticEngine diag;
    EXPECT_FALSE(parseExpr("1 2", diag));
    EXPECT_TRUE(hasDiagContaining(diag, "unexpected number after expression"));
}
