//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing for the Fountain parser.
///
//===----------------------------------------------------------------------===//

#include "frontends/fountain/Parser.hpp"

#include <unordered_set>

namespace fountain::frontends::fountain
{

namespace
{
/// RAII counter for statement nesting.
struct DepthGuard
{
    int &d;

    explicit DepthGuard(int &depth) : d(depth)
    {
        ++d;
    }

    ~DepthGuard()
    {
        --d;
    }
};
} // namespace

StmtPtr Parser::parseStatement()
{
    DepthGuard guard(stmtDepth_);
    if (stmtDepth_ > kMaxStmtDepth)
    {
        error("statement nesting too deep (limit: 256)");
        return nullptr;
    }

    StmtPtr stmt = parseSimpleStatement();
    if (!stmt)
        return nullptr;
    match(TokenKind::Semicolon);
    return stmt;
}

StmtPtr Parser::parseSimpleStatement()
{
    SourceLoc loc = peek().loc;

    switch (peek().kind)
    {
        case TokenKind::KwDo:
            advance();
            return parseBlock(loc);
        case TokenKind::KwPrint:
            advance();
            return parsePrintStmt(loc);
        case TokenKind::KwIf:
            advance();
            return parseIfStmt(loc);
        case TokenKind::KwFor:
            advance();
            return parseForStmt(loc);
        case TokenKind::KwFn:
            advance();
            return parseFnDecl(loc);
        case TokenKind::KwBreak:
            advance();
            return std::make_unique<BreakStmt>(loc);
        case TokenKind::KwContinue:
            advance();
            return std::make_unique<ContinueStmt>(loc);
        case TokenKind::KwReturn:
            advance();
            return parseReturnStmt(loc);
        case TokenKind::KwAssert:
            advance();
            return parseAssertStmt(loc);
        default:
            return parseAssignOrExprStmt();
    }
}

bool Parser::parseStatementsUntil(StmtList &out, TokenKind terminator, TokenKind alternate)
{
    while (!check(terminator) && !check(alternate) && !check(TokenKind::Eof))
    {
        StmtPtr stmt = parseStatement();
        if (!stmt)
            return false;
        out.push_back(std::move(stmt));
    }
    return true;
}

StmtPtr Parser::parseBlock(SourceLoc loc)
{
    StmtList body;
    if (!parseStatementsUntil(body, TokenKind::KwEnd))
        return nullptr;
    if (!expect(TokenKind::KwEnd, "'end' after block"))
        return nullptr;
    return std::make_unique<BlockStmt>(loc, std::move(body));
}

StmtPtr Parser::parsePrintStmt(SourceLoc loc)
{
    ExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;
    return std::make_unique<PrintStmt>(loc, std::move(expr));
}

StmtPtr Parser::parseIfStmt(SourceLoc loc)
{
    ExprPtr condition = parseExpression();
    if (!condition)
        return nullptr;
    if (!expect(TokenKind::KwDo, "'do' after condition"))
        return nullptr;

    SourceLoc thenLoc = peek().loc;
    StmtList thenBody;
    if (!parseStatementsUntil(thenBody, TokenKind::KwEnd, TokenKind::KwElse))
        return nullptr;
    auto thenBlock = std::make_unique<BlockStmt>(thenLoc, std::move(thenBody));

    BlockPtr elseBlock;
    Token elseTok;
    if (match(TokenKind::KwElse, &elseTok))
    {
        StmtList elseBody;
        if (!parseStatementsUntil(elseBody, TokenKind::KwEnd))
            return nullptr;
        elseBlock = std::make_unique<BlockStmt>(elseTok.loc, std::move(elseBody));
    }

    if (!expect(TokenKind::KwEnd, "'end' to close 'if'"))
        return nullptr;

    return std::make_unique<IfStmt>(
        loc, std::move(condition), std::move(thenBlock), std::move(elseBlock));
}

StmtPtr Parser::parseForStmt(SourceLoc loc)
{
    Token doTok;
    if (!expect(TokenKind::KwDo, "'do' after 'for'", &doTok))
        return nullptr;

    StmtList body;
    if (!parseStatementsUntil(body, TokenKind::KwEnd))
        return nullptr;
    if (!expect(TokenKind::KwEnd, "'end' to close 'for'"))
        return nullptr;

    return std::make_unique<ForStmt>(loc, std::make_unique<BlockStmt>(doTok.loc, std::move(body)));
}

StmtPtr Parser::parseFnDecl(SourceLoc loc)
{
    Token name;
    if (!expect(TokenKind::Identifier, "function name", &name))
        return nullptr;
    if (!expect(TokenKind::LParen, "'(' after function name"))
        return nullptr;

    std::vector<Param> params;
    if (!parseParameters(params))
        return nullptr;

    StmtList body;
    if (!parseStatementsUntil(body, TokenKind::KwEnd))
        return nullptr;
    if (!expect(TokenKind::KwEnd, "'end' to close function"))
        return nullptr;

    return std::make_unique<FnDeclStmt>(loc, name.text, std::move(params), std::move(body));
}

bool Parser::parseParameters(std::vector<Param> &out)
{
    if (match(TokenKind::RParen))
        return true;

    std::unordered_set<std::string> seen;
    bool sawDefault = false;

    do
    {
        if (out.size() >= kMaxArguments)
        {
            error("more than 255 parameters");
            return false;
        }

        Token name;
        if (!expect(TokenKind::Identifier, "parameter name", &name))
            return false;
        if (!seen.insert(name.text).second)
        {
            errorAt(name.loc, "duplicate parameter '" + name.text + "'");
            return false;
        }

        Param param;
        param.name = name.text;
        param.loc = name.loc;
        if (match(TokenKind::Equal))
        {
            param.defaultValue = parseExpression();
            if (!param.defaultValue)
                return false;
            sawDefault = true;
        }
        else if (sawDefault)
        {
            errorAt(name.loc, "parameter without default follows parameter with default");
            return false;
        }
        out.push_back(std::move(param));
    } while (match(TokenKind::Comma));

    return expect(TokenKind::RParen, "')' after parameters");
}

StmtPtr Parser::parseReturnStmt(SourceLoc loc)
{
    ExprPtr value;
    if (atExpressionStart())
    {
        value = parseExpression();
        if (!value)
            return nullptr;
    }
    return std::make_unique<ReturnStmt>(loc, std::move(value));
}

StmtPtr Parser::parseAssertStmt(SourceLoc loc)
{
    ExprPtr condition = parseExpression();
    if (!condition)
        return nullptr;

    ExprPtr message;
    if (match(TokenKind::Comma))
    {
        message = parseExpression();
        if (!message)
            return nullptr;
    }
    return std::make_unique<AssertStmt>(loc, std::move(condition), std::move(message));
}

StmtPtr Parser::parseAssignOrExprStmt()
{
    // Parse the left-hand side as an ordinary expression and validate it as a
    // target only once an assignment operator shows up.
    ExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;

    AssignOp op;
    switch (peek().kind)
    {
        case TokenKind::Equal:
            op = AssignOp::Assign;
            break;
        case TokenKind::PlusEqual:
            op = AssignOp::Add;
            break;
        case TokenKind::MinusEqual:
            op = AssignOp::Sub;
            break;
        case TokenKind::StarEqual:
            op = AssignOp::Mul;
            break;
        case TokenKind::SlashEqual:
            op = AssignOp::Div;
            break;
        default:
        {
            SourceLoc loc = expr->loc;
            return std::make_unique<ExprStmt>(loc, std::move(expr));
        }
    }

    Token opTok = advance();
    if (expr->kind != ExprKind::Ident && expr->kind != ExprKind::Index &&
        expr->kind != ExprKind::Field)
    {
        errorAt(opTok.loc, std::string("cannot assign to ") + exprKindToString(expr->kind));
        return nullptr;
    }

    ExprPtr value = parseExpression();
    if (!value)
        return nullptr;

    SourceLoc loc = expr->loc;
    return std::make_unique<AssignStmt>(loc, std::move(expr), op, std::move(value));
}

} // namespace fountain::frontends::fountain
