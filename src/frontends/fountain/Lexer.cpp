//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the Fountain lexical analyzer.
///
/// @details Keywords are stored in a sorted array (kKeywordTable) and found
/// by binary search. Numbers are decoded with std::from_chars so that the
/// value matches the shortest-round-trip printer exactly. Strings carry no
/// escape sequences: everything between the quotes is taken verbatim, and a
/// newline before the closing quote is an error.
///
//===----------------------------------------------------------------------===//

#include "frontends/fountain/Lexer.hpp"
#include "frontends/common/CharUtils.hpp"
#include "frontends/common/KeywordTable.hpp"

#include <array>
#include <charconv>
#include <limits>

namespace fountain::frontends::fountain
{

//===----------------------------------------------------------------------===//
// TokenKind to string conversion
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "invalid token";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::Number:
            return "number";
        case TokenKind::String:
            return "string";

        case TokenKind::KwAnd:
            return "and";
        case TokenKind::KwAssert:
            return "assert";
        case TokenKind::KwBreak:
            return "break";
        case TokenKind::KwContinue:
            return "continue";
        case TokenKind::KwDo:
            return "do";
        case TokenKind::KwElse:
            return "else";
        case TokenKind::KwEnd:
            return "end";
        case TokenKind::KwFalse:
            return "false";
        case TokenKind::KwFn:
            return "fn";
        case TokenKind::KwFor:
            return "for";
        case TokenKind::KwIf:
            return "if";
        case TokenKind::KwNil:
            return "nil";
        case TokenKind::KwNot:
            return "not";
        case TokenKind::KwOr:
            return "or";
        case TokenKind::KwPrint:
            return "print";
        case TokenKind::KwReturn:
            return "return";
        case TokenKind::KwTrue:
            return "true";

        case TokenKind::Plus:
            return "+";
        case TokenKind::Minus:
            return "-";
        case TokenKind::Star:
            return "*";
        case TokenKind::Slash:
            return "/";
        case TokenKind::Less:
            return "<";
        case TokenKind::LessEqual:
            return "<=";
        case TokenKind::Greater:
            return ">";
        case TokenKind::GreaterEqual:
            return ">=";
        case TokenKind::EqualEqual:
            return "==";
        case TokenKind::NotEqual:
            return "!=";
        case TokenKind::Equal:
            return "=";
        case TokenKind::PlusEqual:
            return "+=";
        case TokenKind::MinusEqual:
            return "-=";
        case TokenKind::StarEqual:
            return "*=";
        case TokenKind::SlashEqual:
            return "/=";

        case TokenKind::LParen:
            return "(";
        case TokenKind::RParen:
            return ")";
        case TokenKind::LBrace:
            return "{";
        case TokenKind::RBrace:
            return "}";
        case TokenKind::LBracket:
            return "[";
        case TokenKind::RBracket:
            return "]";
        case TokenKind::Comma:
            return ",";
        case TokenKind::Dot:
            return ".";
        case TokenKind::Semicolon:
            return ";";
    }
    return "<unknown>";
}

bool Token::isKeyword() const
{
    return kind >= TokenKind::KwAnd && kind <= TokenKind::KwTrue;
}

//===----------------------------------------------------------------------===//
// Keyword lookup
//===----------------------------------------------------------------------===//

namespace
{

using common::keyword_table::KeywordEntry;

constexpr std::array<KeywordEntry<TokenKind>, 17> kKeywordTable = {{
    {"and", TokenKind::KwAnd},
    {"assert", TokenKind::KwAssert},
    {"break", TokenKind::KwBreak},
    {"continue", TokenKind::KwContinue},
    {"do", TokenKind::KwDo},
    {"else", TokenKind::KwElse},
    {"end", TokenKind::KwEnd},
    {"false", TokenKind::KwFalse},
    {"fn", TokenKind::KwFn},
    {"for", TokenKind::KwFor},
    {"if", TokenKind::KwIf},
    {"nil", TokenKind::KwNil},
    {"not", TokenKind::KwNot},
    {"or", TokenKind::KwOr},
    {"print", TokenKind::KwPrint},
    {"return", TokenKind::KwReturn},
    {"true", TokenKind::KwTrue},
}};

static_assert(common::keyword_table::isKeywordTableSorted(kKeywordTable),
              "keyword table must stay sorted for binary search");

using common::char_utils::isDigit;
using common::char_utils::isIdentifierContinue;
using common::char_utils::isIdentifierStart;
using common::char_utils::isWhitespace;

} // anonymous namespace

std::optional<TokenKind> Lexer::lookupKeyword(std::string_view name)
{
    return common::keyword_table::lookupKeywordBinary(kKeywordTable, name);
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId, ::fountain::support::DiagnosticEngine &diag)
    : source_(std::move(source)), fileId_(fileId), diag_(diag)
{
}

char Lexer::peekChar() const
{
    if (pos_ >= source_.size())
        return '\0';
    return source_[pos_];
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

::fountain::support::SourceLoc Lexer::currentLoc() const
{
    return ::fountain::support::SourceLoc{fileId_, line_, column_};
}

void Lexer::reportError(::fountain::support::SourceLoc loc, const std::string &message)
{
    failed_ = true;
    diag_.report(::fountain::support::Diagnostic{
        ::fountain::support::Severity::Error, message, loc, "F1000"});
}

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        char c = peekChar();

        if (isWhitespace(c))
        {
            getChar();
            continue;
        }

        // Line comment: -- to end of line
        if (c == '-' && peekChar(1) == '-')
        {
            while (!eof() && peekChar() != '\n')
                getChar();
            continue;
        }

        break;
    }
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();

    while (!eof() && isIdentifierContinue(peekChar()))
    {
        tok.text.push_back(getChar());
    }

    if (auto kw = lookupKeyword(tok.text))
    {
        tok.kind = *kw;
        return tok;
    }

    tok.kind = TokenKind::Identifier;
    return tok;
}

Token Lexer::lexNumber()
{
    Token tok;
    tok.kind = TokenKind::Number;
    tok.loc = currentLoc();

    while (isDigit(peekChar()))
        tok.text.push_back(getChar());

    // A '.' belongs to the number only when a digit follows it.
    if (peekChar() == '.' && isDigit(peekChar(1)))
    {
        tok.text.push_back(getChar());
        while (isDigit(peekChar()))
            tok.text.push_back(getChar());
    }

    const char *first = tok.text.data();
    const char *last = first + tok.text.size();
    auto [ptr, ec] = std::from_chars(first, last, tok.numberValue);
    if (ec == std::errc::result_out_of_range)
    {
        // Overlong literals saturate like any other IEEE overflow.
        tok.numberValue = std::numeric_limits<double>::infinity();
    }
    else if (ec != std::errc() || ptr != last)
    {
        reportError(tok.loc, "invalid number literal '" + tok.text + "'");
        tok.kind = TokenKind::Error;
    }
    return tok;
}

Token Lexer::lexString()
{
    Token tok;
    tok.loc = currentLoc();

    const char quote = getChar();
    tok.text.push_back(quote);

    while (true)
    {
        if (eof())
        {
            reportError(tok.loc, "unterminated string: EOF while scanning string literal");
            tok.kind = TokenKind::Error;
            return tok;
        }

        char c = peekChar();
        if (c == '\n')
        {
            reportError(tok.loc, "unterminated string: EOL while scanning string literal");
            tok.kind = TokenKind::Error;
            return tok;
        }

        getChar();
        tok.text.push_back(c);
        if (c == quote)
            break;
        tok.stringValue.push_back(c);
    }

    tok.kind = TokenKind::String;
    return tok;
}

Token Lexer::lexOperator(TokenKind single, TokenKind withEqual)
{
    Token tok;
    tok.loc = currentLoc();
    tok.text.push_back(getChar());
    if (peekChar() == '=')
    {
        tok.text.push_back(getChar());
        tok.kind = withEqual;
    }
    else
    {
        tok.kind = single;
    }
    return tok;
}

Token Lexer::next()
{
    if (peeked_.has_value())
    {
        Token tok = std::move(*peeked_);
        peeked_.reset();
        return tok;
    }

    // After an error the stream is over; the caller is expected to stop.
    if (failed_)
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    skipWhitespaceAndComments();

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    char c = peekChar();

    if (isIdentifierStart(c))
        return lexIdentifierOrKeyword();

    if (isDigit(c))
        return lexNumber();

    if (c == '"' || c == '\'')
        return lexString();

    switch (c)
    {
        case '+':
            return lexOperator(TokenKind::Plus, TokenKind::PlusEqual);
        case '-':
            return lexOperator(TokenKind::Minus, TokenKind::MinusEqual);
        case '*':
            return lexOperator(TokenKind::Star, TokenKind::StarEqual);
        case '/':
            return lexOperator(TokenKind::Slash, TokenKind::SlashEqual);
        case '<':
            return lexOperator(TokenKind::Less, TokenKind::LessEqual);
        case '>':
            return lexOperator(TokenKind::Greater, TokenKind::GreaterEqual);
        case '=':
            return lexOperator(TokenKind::Equal, TokenKind::EqualEqual);
        default:
            break;
    }

    Token tok;
    tok.loc = currentLoc();

    switch (c)
    {
        case '!':
            if (peekChar(1) != '=')
                break;
            getChar();
            getChar();
            tok.kind = TokenKind::NotEqual;
            tok.text = "!=";
            return tok;
        case '(':
            tok.kind = TokenKind::LParen;
            break;
        case ')':
            tok.kind = TokenKind::RParen;
            break;
        case '{':
            tok.kind = TokenKind::LBrace;
            break;
        case '}':
            tok.kind = TokenKind::RBrace;
            break;
        case '[':
            tok.kind = TokenKind::LBracket;
            break;
        case ']':
            tok.kind = TokenKind::RBracket;
            break;
        case ',':
            tok.kind = TokenKind::Comma;
            break;
        case '.':
            tok.kind = TokenKind::Dot;
            break;
        case ';':
            tok.kind = TokenKind::Semicolon;
            break;
        default:
            break;
    }

    if (tok.kind == TokenKind::Eof)
    {
        reportError(tok.loc, std::string("invalid character '") + c + "'");
        tok.kind = TokenKind::Error;
        tok.text = std::string(1, c);
        getChar();
        return tok;
    }

    tok.text = std::string(1, getChar());
    return tok;
}

const Token &Lexer::peek()
{
    if (!peeked_.has_value())
    {
        peeked_ = next();
    }
    return *peeked_;
}

} // namespace fountain::frontends::fountain
