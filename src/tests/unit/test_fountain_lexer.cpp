//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Unit tests for the Fountain lexer: token kinds, literal values, source
// positions, comments and the stop-on-first-error contract.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/fountain/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <string>
#include <vector>

using namespace fountain::frontends::fountain;
using namespace fountain::support;

namespace
{

std::vector<Token> lexAll(const std::string &source, DiagnosticEngine &diag)
{
    Lexer lexer(source, 1, diag);
    std::vector<Token> tokens;
    for (;;)
    {
        tokens.push_back(lexer.next());
        if (tokens.back().kind == TokenKind::Eof)
            break;
    }
    return tokens;
}

std::vector<TokenKind> kindsOf(const std::vector<Token> &tokens)
{
    std::vector<TokenKind> kinds;
    for (const auto &t : tokens)
        kinds.push_back(t.kind);
    return kinds;
}

} // namespace

TEST(FountainLexer, KeywordsAndIdentifiers)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("print x_1 and Fn fn", diag);
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwPrint);
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[1].text, "x_1");
    EXPECT_EQ(tokens[2].kind, TokenKind::KwAnd);
    EXPECT_EQ(tokens[3].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[4].kind, TokenKind::KwFn);
    EXPECT_TRUE(tokens[4].isKeyword());
    EXPECT_EQ(diag.errorCount(), 0u);
}

TEST(FountainLexer, NumbersIntegerAndDecimal)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("42 3.25 7.", diag);
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Number);
    EXPECT_DOUBLE_EQ(tokens[0].numberValue, 42.0);
    EXPECT_DOUBLE_EQ(tokens[1].numberValue, 3.25);
    // A trailing '.' without digits is a separate token.
    EXPECT_DOUBLE_EQ(tokens[2].numberValue, 7.0);
    EXPECT_EQ(tokens[3].kind, TokenKind::Dot);
}

TEST(FountainLexer, StringsUseEitherQuoteWithoutEscapes)
{
    DiagnosticEngine diag;
    auto tokens = lexAll(R"('a"b' "c\n")", diag);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::String);
    EXPECT_EQ(tokens[0].stringValue, "a\"b");
    EXPECT_EQ(tokens[1].stringValue, "c\\n");
}

TEST(FountainLexer, OperatorsAndPunctuation)
{
    DiagnosticEngine diag;
    auto kinds = kindsOf(lexAll("<= >= == != = += -= *= /= < > + - * / ( ) { } [ ] , . ;", diag));
    std::vector<TokenKind> expected = {
        TokenKind::LessEqual, TokenKind::GreaterEqual, TokenKind::EqualEqual, TokenKind::NotEqual,
        TokenKind::Equal,     TokenKind::PlusEqual,    TokenKind::MinusEqual, TokenKind::StarEqual,
        TokenKind::SlashEqual, TokenKind::Less,        TokenKind::Greater,    TokenKind::Plus,
        TokenKind::Minus,     TokenKind::Star,         TokenKind::Slash,      TokenKind::LParen,
        TokenKind::RParen,    TokenKind::LBrace,       TokenKind::RBrace,     TokenKind::LBracket,
        TokenKind::RBracket,  TokenKind::Comma,        TokenKind::Dot,        TokenKind::Semicolon,
        TokenKind::Eof,
    };
    EXPECT_EQ(kinds, expected);
}

TEST(FountainLexer, CommentsAndPositions)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("x -- ignored == 'text\n  y", diag);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].loc.line, 1u);
    EXPECT_EQ(tokens[0].loc.column, 1u);
    EXPECT_EQ(tokens[1].text, "y");
    EXPECT_EQ(tokens[1].loc.line, 2u);
    EXPECT_EQ(tokens[1].loc.column, 3u);
    EXPECT_EQ(tokens[1].loc.file_id, 1u);
}

TEST(FountainLexer, SpacedMinusesAreTwoTokens)
{
    DiagnosticEngine diag;
    auto kinds = kindsOf(lexAll("- - 5", diag));
    std::vector<TokenKind> expected = {
        TokenKind::Minus, TokenKind::Minus, TokenKind::Number, TokenKind::Eof};
    EXPECT_EQ(kinds, expected);
}

TEST(FountainLexer, UnterminatedStringAtEndOfLine)
{
    DiagnosticEngine diag;
    Lexer lexer("x = 'abc\ny = 1", 1, diag);
    EXPECT_EQ(lexer.next().kind, TokenKind::Identifier);
    EXPECT_EQ(lexer.next().kind, TokenKind::Equal);
    Token bad = lexer.next();
    EXPECT_EQ(bad.kind, TokenKind::Error);
    EXPECT_TRUE(lexer.failed());
    // Lexing does not resume after an error.
    EXPECT_EQ(lexer.next().kind, TokenKind::Eof);
    EXPECT_EQ(lexer.next().kind, TokenKind::Eof);

    ASSERT_EQ(diag.diagnostics().size(), 1u);
    const auto &d = diag.diagnostics()[0];
    EXPECT_EQ(d.message, "unterminated string: EOL while scanning string literal");
    EXPECT_EQ(d.code, "F1000");
    EXPECT_EQ(d.loc.line, 1u);
    EXPECT_EQ(d.loc.column, 5u);
}

TEST(FountainLexer, UnterminatedStringAtEndOfInput)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("\"abc", diag);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Error);
    ASSERT_EQ(diag.diagnostics().size(), 1u);
    EXPECT_EQ(diag.diagnostics()[0].message,
              "unterminated string: EOF while scanning string literal");
}

TEST(FountainLexer, InvalidCharacterReportsOffendingChar)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("a @ b", diag);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Error);
    ASSERT_EQ(diag.diagnostics().size(), 1u);
    EXPECT_EQ(diag.diagnostics()[0].message, "invalid character '@'");
    EXPECT_EQ(diag.diagnostics()[0].loc.column, 3u);
}

TEST(FountainLexer, LoneBangIsInvalid)
{
    DiagnosticEngine diag;
    lexAll("!x", diag);
    ASSERT_EQ(diag.diagnostics().size(), 1u);
    EXPECT_EQ(diag.diagnostics()[0].message, "invalid character '!'");
}

TEST(FountainLexer, PeekDoesNotConsume)
{
    DiagnosticEngine diag;
    Lexer lexer("a b", 1, diag);
    EXPECT_EQ(lexer.peek().text, "a");
    EXPECT_EQ(lexer.next().text, "a");
    EXPECT_EQ(lexer.next().text, "b");
}

TEST(FountainLexer, KeywordLookup)
{
    EXPECT_EQ(Lexer::lookupKeyword("end"), TokenKind::KwEnd);
    EXPECT_EQ(Lexer::lookupKeyword("assert"), TokenKind::KwAssert);
    EXPECT_FALSE(Lexer::lookupKeyword("while").has_value());
    EXPECT_FALSE(Lexer::lookupKeyword("End").has_value());
}
