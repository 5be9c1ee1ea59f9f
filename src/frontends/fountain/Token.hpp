//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the Fountain lexer.
///
/// Tokens fall into four groups:
///
/// 1. **Special Tokens**: end of input and the lexical error marker
/// 2. **Literals**: numbers, strings, and identifiers
/// 3. **Keywords**: the seventeen reserved words of the language
/// 4. **Operators and Punctuation**: arithmetic, comparison, assignment,
///    brackets, and separators
///
/// Tokens are value types that own their text. The Lexer produces them on
/// demand and the Parser buffers as many as it needs for lookahead.
///
/// @invariant Number tokens have numberValue populated; String tokens have
///            stringValue populated with the quotes stripped.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>

namespace fountain::frontends::fountain
{

/// @brief Enumeration of all token kinds recognized by the Fountain lexer.
enum class TokenKind
{
    /// @name Special Tokens
    /// @{

    /// @brief End of input. Returned forever once the source is exhausted.
    Eof,

    /// @brief Lexical error. The diagnostic has already been reported and
    /// the lexer yields Eof afterwards.
    Error,

    /// @}
    /// @name Literal Tokens
    /// @{

    Identifier,
    Number, ///< `42`, `3.25`; both forms produce one double.
    String, ///< `'text'` or `"text"`; no escape processing.

    /// @}
    /// @name Keywords
    /// @{

    KwAnd,
    KwAssert,
    KwBreak,
    KwContinue,
    KwDo,
    KwElse,
    KwEnd,
    KwFalse,
    KwFn,
    KwFor,
    KwIf,
    KwNil,
    KwNot,
    KwOr,
    KwPrint,
    KwReturn,
    KwTrue,

    /// @}
    /// @name Operators
    /// @{

    Plus,
    Minus,
    Star,
    Slash,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    EqualEqual,
    NotEqual,
    Equal,
    PlusEqual,
    MinusEqual,
    StarEqual,
    SlashEqual,

    /// @}
    /// @name Punctuation
    /// @{

    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Comma,
    Dot,
    Semicolon,

    /// @}
};

/// @brief Human-readable spelling of a token kind for diagnostics.
/// @details Keywords and operators return their source spelling; the literal
///          and special kinds return a descriptive name such as "identifier"
///          or "end of input".
const char *tokenKindToString(TokenKind kind);

/// @brief A single lexical token with its location and decoded payload.
struct Token
{
    /// @brief The kind of token this represents.
    TokenKind kind = TokenKind::Eof;

    /// @brief Location of the first character of the token.
    ::fountain::support::SourceLoc loc{};

    /// @brief Exact source text, quotes included for strings.
    std::string text;

    /// @brief Parsed value; valid only when kind == Number.
    double numberValue = 0.0;

    /// @brief String contents without quotes; valid only when kind == String.
    std::string stringValue;

    bool is(TokenKind k) const
    {
        return kind == k;
    }

    /// @brief Check whether this token matches any of @p kinds.
    template <typename... Kinds> bool isOneOf(Kinds... kinds) const
    {
        return (is(kinds) || ...);
    }

    /// @brief Check if this token is a reserved word.
    bool isKeyword() const;
};

} // namespace fountain::frontends::fountain
