//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Golden-output tests for the indented AST dump.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "FountainTestUtils.hpp"
#include "frontends/fountain/AstPrinter.hpp"

#include <string>

using namespace fountain::frontends::fountain;
using fountain::support::DiagnosticEngine;

namespace
{

std::string dumpProgram(const std::string &source)
{
    DiagnosticEngine diag;
    auto program = fountain::test::parseProgram(source, diag);
    if (!program)
        return "<parse error>";
    AstPrinter printer;
    return printer.dump(*program);
}

} // namespace

TEST(FountainAstPrinter, PrintStatement)
{
    EXPECT_EQ(dumpProgram("print 1 + 2"),
              "Program\n"
              "  Print (1:1)\n"
              "    Binary (+) (1:9)\n"
              "      NumberLiteral 1 (1:7)\n"
              "      NumberLiteral 2 (1:11)\n");
}

TEST(FountainAstPrinter, FunctionWithDefault)
{
    EXPECT_EQ(dumpProgram("fn f(a, b = 2) return a end"),
              "Program\n"
              "  FnDecl \"f\" (1:1)\n"
              "    Param \"a\" (1:6)\n"
              "    Param \"b\" (1:9)\n"
              "      Default:\n"
              "        NumberLiteral 2 (1:13)\n"
              "    Body:\n"
              "      Return (1:16)\n"
              "        Ident \"a\" (1:23)\n");
}

TEST(FountainAstPrinter, AssignmentAndCall)
{
    EXPECT_EQ(dumpProgram("x += f(k = 'v')"),
              "Program\n"
              "  Assign (+=) (1:1)\n"
              "    Ident \"x\" (1:1)\n"
              "    Call (1:7)\n"
              "      Ident \"f\" (1:6)\n"
              "      NamedArg \"k\"\n"
              "        StringLiteral \"v\" (1:12)\n");
}

TEST(FountainAstPrinter, IfElseAndLoop)
{
    EXPECT_EQ(dumpProgram("if not a do for do break end else print nil end"),
              "Program\n"
              "  If (1:1)\n"
              "    Unary (not) (1:4)\n"
              "      Ident \"a\" (1:8)\n"
              "    Then:\n"
              "      For (1:13)\n"
              "        Body:\n"
              "          Break (1:20)\n"
              "    Else:\n"
              "      Print (1:35)\n"
              "        NilLiteral (1:41)\n");
}

TEST(FountainAstPrinter, TableItems)
{
    EXPECT_EQ(dumpProgram("t = {1, k = true, [2] = 3}"),
              "Program\n"
              "  Assign (=) (1:1)\n"
              "    Ident \"t\" (1:1)\n"
              "    Table (1:5)\n"
              "      NumberLiteral 1 (1:6)\n"
              "      Named \"k\"\n"
              "        BoolLiteral true (1:13)\n"
              "      Keyed\n"
              "        NumberLiteral 2 (1:20)\n"
              "        NumberLiteral 3 (1:25)\n");
}

TEST(FountainAstPrinter, ConditionalExpression)
{
    DiagnosticEngine diag;
    auto expr = fountain::test::parseExpr("a if b else c", diag);
    ASSERT_TRUE(expr);
    AstPrinter printer;
    EXPECT_EQ(printer.dump(*expr),
              "Conditional (1:1)\n"
              "  Then:\n"
              "    Ident \"a\" (1:1)\n"
              "  If:\n"
              "    Ident \"b\" (1:6)\n"
              "  Else:\n"
              "    Ident \"c\" (1:13)\n");
}
