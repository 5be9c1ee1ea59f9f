//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for the Fountain parser.
///
/// @details One method per precedence level, lowest first. Binary levels
/// loop to build left-associative trees; unary recurses into itself for
/// right associativity; the call level loops over postfix operators.
///
//===----------------------------------------------------------------------===//

#include "frontends/fountain/Parser.hpp"

#include <unordered_set>

namespace fountain::frontends::fountain
{

ExprPtr Parser::parseExpression()
{
    return parseConditional();
}

/// `then if cond else otherwise`. The `if` is only taken as a conditional
/// when `else` follows the condition; otherwise it starts the next statement
/// (`x = 1` on one line, `if ready do ... end` on the next).
ExprPtr Parser::parseConditional()
{
    ExprPtr thenExpr = parseDisjunction();
    if (!thenExpr || !check(TokenKind::KwIf))
        return thenExpr;

    SourceLoc loc = thenExpr->loc;
    ExprPtr condition;
    {
        Speculation spec(*this);
        advance(); // consume 'if'
        condition = parseDisjunction();
        if (condition && check(TokenKind::KwElse))
            spec.commit();
        else
            condition.reset();
    }
    if (!condition)
        return thenExpr;

    advance(); // consume 'else'
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        error("expression nesting too deep (limit: 256)");
        return nullptr;
    }
    ExprPtr elseExpr = parseConditional();
    --exprDepth_;
    if (!elseExpr)
        return nullptr;

    return std::make_unique<ConditionalExpr>(
        loc, std::move(thenExpr), std::move(condition), std::move(elseExpr));
}

ExprPtr Parser::parseDisjunction()
{
    ExprPtr expr = parseConjunction();
    if (!expr)
        return nullptr;

    Token opTok;
    while (match(TokenKind::KwOr, &opTok))
    {
        ExprPtr right = parseConjunction();
        if (!right)
            return nullptr;
        expr = std::make_unique<LogicalExpr>(
            opTok.loc, LogicalOp::Or, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseConjunction()
{
    ExprPtr expr = parseEquality();
    if (!expr)
        return nullptr;

    Token opTok;
    while (match(TokenKind::KwAnd, &opTok))
    {
        ExprPtr right = parseEquality();
        if (!right)
            return nullptr;
        expr = std::make_unique<LogicalExpr>(
            opTok.loc, LogicalOp::And, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseEquality()
{
    ExprPtr expr = parseComparison();
    if (!expr)
        return nullptr;

    while (check(TokenKind::EqualEqual) || check(TokenKind::NotEqual))
    {
        Token opTok = advance();
        BinaryOp op = opTok.kind == TokenKind::EqualEqual ? BinaryOp::Eq : BinaryOp::Ne;

        ExprPtr right = parseComparison();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseComparison()
{
    ExprPtr expr = parseTerm();
    if (!expr)
        return nullptr;

    while (peek().isOneOf(TokenKind::Less,
                          TokenKind::LessEqual,
                          TokenKind::Greater,
                          TokenKind::GreaterEqual))
    {
        Token opTok = advance();
        BinaryOp op;
        switch (opTok.kind)
        {
            case TokenKind::Less:
                op = BinaryOp::Lt;
                break;
            case TokenKind::LessEqual:
                op = BinaryOp::Le;
                break;
            case TokenKind::Greater:
                op = BinaryOp::Gt;
                break;
            default:
                op = BinaryOp::Ge;
                break;
        }

        ExprPtr right = parseTerm();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseTerm()
{
    ExprPtr expr = parseFactor();
    if (!expr)
        return nullptr;

    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        Token opTok = advance();
        BinaryOp op = opTok.kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;

        ExprPtr right = parseFactor();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseFactor()
{
    ExprPtr expr = parseUnary();
    if (!expr)
        return nullptr;

    while (check(TokenKind::Star) || check(TokenKind::Slash))
    {
        Token opTok = advance();
        BinaryOp op = opTok.kind == TokenKind::Star ? BinaryOp::Mul : BinaryOp::Div;

        ExprPtr right = parseUnary();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseUnary()
{
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        error("expression nesting too deep (limit: 256)");
        return nullptr;
    }

    ExprPtr result;

    if (check(TokenKind::Minus) || check(TokenKind::KwNot))
    {
        Token opTok = advance();
        UnaryOp op = opTok.kind == TokenKind::Minus ? UnaryOp::Neg : UnaryOp::Not;

        ExprPtr operand = parseUnary();
        if (operand)
            result = std::make_unique<UnaryExpr>(opTok.loc, op, std::move(operand));
    }
    else
    {
        result = parseCall();
    }

    --exprDepth_;
    return result;
}

ExprPtr Parser::parseCall()
{
    ExprPtr expr = parsePrimary();
    if (!expr)
        return nullptr;

    while (true)
    {
        Token opTok;
        if (match(TokenKind::LParen, &opTok))
        {
            std::vector<CallArg> args;
            if (!parseArguments(args))
                return nullptr;
            expr = std::make_unique<CallExpr>(opTok.loc, std::move(expr), std::move(args));
        }
        else if (match(TokenKind::LBracket, &opTok))
        {
            ExprPtr index = parseExpression();
            if (!index)
                return nullptr;
            if (!expect(TokenKind::RBracket, "']' after index"))
                return nullptr;
            expr = std::make_unique<IndexExpr>(opTok.loc, std::move(expr), std::move(index));
        }
        else if (match(TokenKind::Dot, &opTok))
        {
            Token name;
            if (!expect(TokenKind::Identifier, "field name after '.'", &name))
                return nullptr;
            expr = std::make_unique<FieldExpr>(opTok.loc, std::move(expr), name.text);
        }
        else
        {
            break;
        }
    }
    return expr;
}

bool Parser::parseArguments(std::vector<CallArg> &out)
{
    if (match(TokenKind::RParen))
        return true;

    std::unordered_set<std::string> seenNames;
    bool sawNamed = false;

    do
    {
        if (out.size() >= kMaxArguments)
        {
            error("more than 255 arguments");
            return false;
        }

        CallArg arg;
        arg.loc = peek().loc;
        if (check(TokenKind::Identifier) && check(TokenKind::Equal, 1))
        {
            Token name = advance();
            advance(); // '='
            if (!seenNames.insert(name.text).second)
            {
                errorAt(name.loc, "duplicate named argument '" + name.text + "'");
                return false;
            }
            arg.name = name.text;
            sawNamed = true;
        }
        else if (sawNamed)
        {
            error("positional argument follows named argument");
            return false;
        }

        arg.value = parseExpression();
        if (!arg.value)
            return false;
        out.push_back(std::move(arg));
    } while (match(TokenKind::Comma));

    return expect(TokenKind::RParen, "')' after arguments");
}

ExprPtr Parser::parsePrimary()
{
    Token tok = peek();
    switch (tok.kind)
    {
        case TokenKind::KwNil:
            advance();
            return std::make_unique<NilLiteralExpr>(tok.loc);
        case TokenKind::KwTrue:
            advance();
            return std::make_unique<BoolLiteralExpr>(tok.loc, true);
        case TokenKind::KwFalse:
            advance();
            return std::make_unique<BoolLiteralExpr>(tok.loc, false);
        case TokenKind::Number:
            advance();
            return std::make_unique<NumberLiteralExpr>(tok.loc, tok.numberValue);
        case TokenKind::String:
            advance();
            return std::make_unique<StringLiteralExpr>(tok.loc, std::move(tok.stringValue));
        case TokenKind::Identifier:
            advance();
            return std::make_unique<IdentExpr>(tok.loc, std::move(tok.text));
        case TokenKind::LParen:
        {
            advance();
            ExprPtr inner = parseExpression();
            if (!inner)
                return nullptr;
            if (!expect(TokenKind::RParen, "')' after expression"))
                return nullptr;
            return std::make_unique<GroupingExpr>(tok.loc, std::move(inner));
        }
        case TokenKind::LBrace:
            advance();
            return parseTable(tok.loc);
        default:
            break;
    }

    error("expected expression");
    return nullptr;
}

ExprPtr Parser::parseTable(SourceLoc loc)
{
    std::vector<TableItem> items;

    while (!check(TokenKind::RBrace))
    {
        TableItem item;
        item.loc = peek().loc;

        if (check(TokenKind::Identifier) && check(TokenKind::Equal, 1))
        {
            item.kind = TableItemKind::Named;
            item.name = advance().text;
            advance(); // '='
        }
        else if (match(TokenKind::LBracket))
        {
            item.kind = TableItemKind::Keyed;
            item.key = parseExpression();
            if (!item.key)
                return nullptr;
            if (!expect(TokenKind::RBracket, "']' after table key"))
                return nullptr;
            if (!expect(TokenKind::Equal, "'=' after table key"))
                return nullptr;
        }

        item.value = parseExpression();
        if (!item.value)
            return nullptr;
        items.push_back(std::move(item));

        if (!match(TokenKind::Comma))
            break;
    }

    if (!expect(TokenKind::RBrace, "'}' to close table"))
        return nullptr;

    return std::make_unique<TableExpr>(loc, std::move(items));
}

} // namespace fountain::frontends::fountain
