//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implements the Fountain AST tree-walking printer.
///
//===----------------------------------------------------------------------===//

#include "frontends/fountain/AstPrinter.hpp"

#include <sstream>

namespace fountain::frontends::fountain
{

const char *exprKindToString(ExprKind kind)
{
    switch (kind)
    {
        case ExprKind::NilLiteral:
        case ExprKind::BoolLiteral:
        case ExprKind::NumberLiteral:
        case ExprKind::StringLiteral:
            return "literal";
        case ExprKind::Ident:
            return "identifier";
        case ExprKind::Unary:
            return "unary expression";
        case ExprKind::Binary:
            return "binary expression";
        case ExprKind::Logical:
            return "logical expression";
        case ExprKind::Conditional:
            return "conditional expression";
        case ExprKind::Call:
            return "call";
        case ExprKind::Index:
            return "index";
        case ExprKind::Field:
            return "field access";
        case ExprKind::Grouping:
            return "grouping";
        case ExprKind::Table:
            return "table";
    }
    return "expression";
}

const char *stmtKindToString(StmtKind kind)
{
    switch (kind)
    {
        case StmtKind::Expr:
            return "expression";
        case StmtKind::Print:
            return "print";
        case StmtKind::Assign:
            return "assign";
        case StmtKind::Block:
            return "block";
        case StmtKind::If:
            return "if";
        case StmtKind::For:
            return "for";
        case StmtKind::Break:
            return "break";
        case StmtKind::Continue:
            return "continue";
        case StmtKind::Return:
            return "return";
        case StmtKind::FnDecl:
            return "fn";
        case StmtKind::Assert:
            return "assert";
    }
    return "statement";
}

namespace
{

struct Printer
{
    std::ostream &os;
    int indent = 0;

    void line(const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << '\n';
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }
};

void printStmt(const Stmt &stmt, Printer &p);
void printExpr(const Expr &expr, Printer &p);

/// @brief Format a source location as "(line:col)".
std::string locStr(const SourceLoc &loc)
{
    std::ostringstream s;
    s << "(" << loc.line << ":" << loc.column << ")";
    return s.str();
}

const char *binaryOpName(BinaryOp op)
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

const char *assignOpName(AssignOp op)
{
    switch (op)
    {
        case AssignOp::Assign:
            return "=";
        case AssignOp::Add:
            return "+=";
        case AssignOp::Sub:
            return "-=";
        case AssignOp::Mul:
            return "*=";
        case AssignOp::Div:
            return "/=";
    }
    return "?";
}

/// Print @p label on its own line and the children one level deeper.
void printBody(const char *label, const StmtList &body, Printer &p)
{
    p.line(label);
    p.push();
    for (const auto &s : body)
        printStmt(*s, p);
    p.pop();
}

void printExpr(const Expr &expr, Printer &p)
{
    switch (expr.kind)
    {
        case ExprKind::NilLiteral:
            p.line("NilLiteral " + locStr(expr.loc));
            break;
        case ExprKind::BoolLiteral:
        {
            const auto &e = static_cast<const BoolLiteralExpr &>(expr);
            p.line(std::string("BoolLiteral ") + (e.value ? "true" : "false") + " " +
                   locStr(e.loc));
            break;
        }
        case ExprKind::NumberLiteral:
        {
            const auto &e = static_cast<const NumberLiteralExpr &>(expr);
            std::ostringstream val;
            val << e.value;
            p.line("NumberLiteral " + val.str() + " " + locStr(e.loc));
            break;
        }
        case ExprKind::StringLiteral:
        {
            const auto &e = static_cast<const StringLiteralExpr &>(expr);
            p.line("StringLiteral \"" + e.value + "\" " + locStr(e.loc));
            break;
        }
        case ExprKind::Ident:
        {
            const auto &e = static_cast<const IdentExpr &>(expr);
            p.line("Ident \"" + e.name + "\" " + locStr(e.loc));
            break;
        }
        case ExprKind::Unary:
        {
            const auto &e = static_cast<const UnaryExpr &>(expr);
            p.line(std::string("Unary (") + (e.op == UnaryOp::Neg ? "-" : "not") + ") " +
                   locStr(e.loc));
            p.push();
            printExpr(*e.operand, p);
            p.pop();
            break;
        }
        case ExprKind::Binary:
        {
            const auto &e = static_cast<const BinaryExpr &>(expr);
            p.line(std::string("Binary (") + binaryOpName(e.op) + ") " + locStr(e.loc));
            p.push();
            printExpr(*e.left, p);
            printExpr(*e.right, p);
            p.pop();
            break;
        }
        case ExprKind::Logical:
        {
            const auto &e = static_cast<const LogicalExpr &>(expr);
            p.line(std::string("Logical (") + (e.op == LogicalOp::And ? "and" : "or") + ") " +
                   locStr(e.loc));
            p.push();
            printExpr(*e.left, p);
            printExpr(*e.right, p);
            p.pop();
            break;
        }
        case ExprKind::Conditional:
        {
            const auto &e = static_cast<const ConditionalExpr &>(expr);
            p.line("Conditional " + locStr(e.loc));
            p.push();
            p.line("Then:");
            p.push();
            printExpr(*e.thenExpr, p);
            p.pop();
            p.line("If:");
            p.push();
            printExpr(*e.condition, p);
            p.pop();
            p.line("Else:");
            p.push();
            printExpr(*e.elseExpr, p);
            p.pop();
            p.pop();
            break;
        }
        case ExprKind::Call:
        {
            const auto &e = static_cast<const CallExpr &>(expr);
            p.line("Call " + locStr(e.loc));
            p.push();
            printExpr(*e.callee, p);
            for (const auto &arg : e.args)
            {
                if (arg.name)
                {
                    p.line("NamedArg \"" + *arg.name + "\"");
                    p.push();
                    printExpr(*arg.value, p);
                    p.pop();
                }
                else
                {
                    printExpr(*arg.value, p);
                }
            }
            p.pop();
            break;
        }
        case ExprKind::Index:
        {
            const auto &e = static_cast<const IndexExpr &>(expr);
            p.line("Index " + locStr(e.loc));
            p.push();
            printExpr(*e.base, p);
            printExpr(*e.index, p);
            p.pop();
            break;
        }
        case ExprKind::Field:
        {
            const auto &e = static_cast<const FieldExpr &>(expr);
            p.line("Field \"" + e.field + "\" " + locStr(e.loc));
            p.push();
            printExpr(*e.base, p);
            p.pop();
            break;
        }
        case ExprKind::Grouping:
        {
            const auto &e = static_cast<const GroupingExpr &>(expr);
            p.line("Grouping " + locStr(e.loc));
            p.push();
            printExpr(*e.inner, p);
            p.pop();
            break;
        }
        case ExprKind::Table:
        {
            const auto &e = static_cast<const TableExpr &>(expr);
            p.line("Table " + locStr(e.loc));
            p.push();
            for (const auto &item : e.items)
            {
                switch (item.kind)
                {
                    case TableItemKind::Positional:
                        printExpr(*item.value, p);
                        break;
                    case TableItemKind::Named:
                        p.line("Named \"" + item.name + "\"");
                        p.push();
                        printExpr(*item.value, p);
                        p.pop();
                        break;
                    case TableItemKind::Keyed:
                        p.line("Keyed");
                        p.push();
                        printExpr(*item.key, p);
                        printExpr(*item.value, p);
                        p.pop();
                        break;
                }
            }
            p.pop();
            break;
        }
    }
}

void printStmt(const Stmt &stmt, Printer &p)
{
    switch (stmt.kind)
    {
        case StmtKind::Expr:
        {
            const auto &s = static_cast<const ExprStmt &>(stmt);
            p.line("ExprStmt " + locStr(s.loc));
            p.push();
            printExpr(*s.expr, p);
            p.pop();
            break;
        }
        case StmtKind::Print:
        {
            const auto &s = static_cast<const PrintStmt &>(stmt);
            p.line("Print " + locStr(s.loc));
            p.push();
            printExpr(*s.expr, p);
            p.pop();
            break;
        }
        case StmtKind::Assign:
        {
            const auto &s = static_cast<const AssignStmt &>(stmt);
            p.line(std::string("Assign (") + assignOpName(s.op) + ") " + locStr(s.loc));
            p.push();
            printExpr(*s.target, p);
            printExpr(*s.value, p);
            p.pop();
            break;
        }
        case StmtKind::Block:
        {
            const auto &s = static_cast<const BlockStmt &>(stmt);
            p.line("Block " + locStr(s.loc));
            p.push();
            for (const auto &child : s.statements)
                printStmt(*child, p);
            p.pop();
            break;
        }
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            p.line("If " + locStr(s.loc));
            p.push();
            printExpr(*s.condition, p);
            printBody("Then:", s.thenBlock->statements, p);
            if (s.elseBlock)
                printBody("Else:", s.elseBlock->statements, p);
            p.pop();
            break;
        }
        case StmtKind::For:
        {
            const auto &s = static_cast<const ForStmt &>(stmt);
            p.line("For " + locStr(s.loc));
            p.push();
            printBody("Body:", s.body->statements, p);
            p.pop();
            break;
        }
        case StmtKind::Break:
            p.line("Break " + locStr(stmt.loc));
            break;
        case StmtKind::Continue:
            p.line("Continue " + locStr(stmt.loc));
            break;
        case StmtKind::Return:
        {
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            p.line("Return " + locStr(s.loc));
            if (s.value)
            {
                p.push();
                printExpr(*s.value, p);
                p.pop();
            }
            break;
        }
        case StmtKind::FnDecl:
        {
            const auto &s = static_cast<const FnDeclStmt &>(stmt);
            p.line("FnDecl \"" + s.name + "\" " + locStr(s.loc));
            p.push();
            for (const auto &param : s.params)
            {
                p.line("Param \"" + param.name + "\" " + locStr(param.loc));
                if (param.defaultValue)
                {
                    p.push();
                    p.line("Default:");
                    p.push();
                    printExpr(*param.defaultValue, p);
                    p.pop();
                    p.pop();
                }
            }
            printBody("Body:", s.body, p);
            p.pop();
            break;
        }
        case StmtKind::Assert:
        {
            const auto &s = static_cast<const AssertStmt &>(stmt);
            p.line("Assert " + locStr(s.loc));
            p.push();
            printExpr(*s.condition, p);
            if (s.message)
                printExpr(*s.message, p);
            p.pop();
            break;
        }
    }
}

} // namespace

std::string AstPrinter::dump(const Program &program)
{
    std::ostringstream os;
    Printer p{os};
    p.line("Program");
    p.push();
    for (const auto &stmt : program.statements)
        printStmt(*stmt, p);
    return os.str();
}

std::string AstPrinter::dump(const Expr &expr)
{
    std::ostringstream os;
    Printer p{os};
    printExpr(expr, p);
    return os.str();
}

} // namespace fountain::frontends::fountain
