//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token buffering, error reporting and program entry points for the
///        Fountain parser.
///
//===----------------------------------------------------------------------===//

#include "frontends/fountain/Parser.hpp"

namespace fountain::frontends::fountain
{

Parser::Parser(Lexer &lexer, ::fountain::support::DiagnosticEngine &diag)
    : lexer_(lexer), diag_(diag)
{
    tokens_.push_back(lexer_.next());
}

//===----------------------------------------------------------------------===//
// Entry Points
//===----------------------------------------------------------------------===//

ProgramPtr Parser::parseProgram()
{
    auto program = std::make_unique<Program>();
    program->fileId = peek().loc.file_id;

    while (!check(TokenKind::Eof))
    {
        StmtPtr stmt = parseStatement();
        if (!stmt)
            return nullptr;
        program->statements.push_back(std::move(stmt));
    }

    if (hasError_ || lexer_.failed())
        return nullptr;
    return program;
}

ExprPtr Parser::parseStandaloneExpression()
{
    ExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;
    if (!check(TokenKind::Eof))
    {
        error(std::string("unexpected ") + tokenKindToString(peek().kind) +
              " after expression");
        return nullptr;
    }
    if (lexer_.failed())
        return nullptr;
    return expr;
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

Parser::Speculation::Speculation(Parser &parser)
    : parser_(parser), savedPos_(parser.tokenPos_), savedHasError_(parser.hasError_)
{
    ++parser_.suppressionDepth_;
}

Parser::Speculation::~Speculation()
{
    --parser_.suppressionDepth_;
    if (!committed_)
    {
        parser_.tokenPos_ = savedPos_;
        parser_.hasError_ = savedHasError_;
    }
}

const Token &Parser::peek(size_t offset)
{
    while (tokens_.size() <= tokenPos_ + offset)
    {
        tokens_.push_back(lexer_.next());
    }
    return tokens_[tokenPos_ + offset];
}

Token Parser::advance()
{
    Token cur = peek();
    // Eof is sticky so lookahead past the end keeps seeing it.
    if (cur.kind != TokenKind::Eof)
        ++tokenPos_;
    return cur;
}

bool Parser::check(TokenKind kind, size_t offset)
{
    return peek(offset).kind == kind;
}

bool Parser::match(TokenKind kind, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    error(std::string("expected ") + what);
    return false;
}

bool Parser::atExpressionStart()
{
    switch (peek().kind)
    {
        case TokenKind::Identifier:
        case TokenKind::Number:
        case TokenKind::String:
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
        case TokenKind::KwNil:
        case TokenKind::KwNot:
        case TokenKind::Minus:
        case TokenKind::LParen:
        case TokenKind::LBrace:
            return true;
        default:
            return false;
    }
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::error(const std::string &message)
{
    if (peek().kind == TokenKind::Error)
    {
        if (suppressionDepth_ == 0)
            hasError_ = true;
        return;
    }
    errorAt(peek().loc, message);
}

void Parser::errorAt(SourceLoc loc, const std::string &message)
{
    if (suppressionDepth_ > 0)
        return;
    // First error only; later reports come from callers that are unwinding.
    if (hasError_)
        return;
    hasError_ = true;
    diag_.report(::fountain::support::Diagnostic{
        ::fountain::support::Severity::Error, message, loc, "F2000"});
}

} // namespace fountain::frontends::fountain
