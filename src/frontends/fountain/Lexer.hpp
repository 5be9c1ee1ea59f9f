//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for Fountain source text.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/Token.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fountain::frontends::fountain
{

/// @brief Produces tokens from Fountain source on demand.
///
/// @details Each call to next() skips whitespace and `--` comments and then
/// lexes exactly one token. Lexing does not recover inside a token: the
/// first unterminated string or unrecognized character is reported to the
/// diagnostic engine (code F1000), an Error token is returned, and every
/// later call yields Eof so that the caller stops.
///
/// @invariant pos_ <= source_.size()
class Lexer
{
  public:
    /// @brief Create a lexer over @p source.
    /// @param source Source text; the lexer keeps its own copy.
    /// @param fileId Identifier stamped into every token location.
    /// @param diag Diagnostic engine for lexical errors; must outlive the lexer.
    Lexer(std::string source, uint32_t fileId, ::fountain::support::DiagnosticEngine &diag);

    /// @brief Consume and return the next token.
    Token next();

    /// @brief Peek at the next token without consuming it.
    /// @note The reference is valid until the next call to next().
    const Token &peek();

    /// @brief True once a lexical error has been reported.
    [[nodiscard]] bool failed() const
    {
        return failed_;
    }

    /// @brief Look up a reserved word.
    /// @return The keyword kind, or nullopt for ordinary identifiers.
    static std::optional<TokenKind> lookupKeyword(std::string_view name);

  private:
    /// @name Character Access
    /// @{
    char peekChar() const;
    char peekChar(size_t offset) const;
    char getChar();
    bool eof() const;
    ::fountain::support::SourceLoc currentLoc() const;
    /// @}

    /// @brief Report a lexical error and switch the lexer to the failed state.
    void reportError(::fountain::support::SourceLoc loc, const std::string &message);

    /// @brief Skip whitespace and `--` line comments.
    void skipWhitespaceAndComments();

    Token lexIdentifierOrKeyword();

    /// @brief Lex `digits ("." digits)?`.
    Token lexNumber();

    /// @brief Lex a string delimited by the quote character at the cursor.
    Token lexString();

    /// @brief Build a one- or two-character operator token.
    /// @details When the character after the cursor is '=' the token becomes
    ///          @p withEqual, otherwise @p single.
    Token lexOperator(TokenKind single, TokenKind withEqual);

    std::string source_;
    uint32_t fileId_;
    ::fountain::support::DiagnosticEngine &diag_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    bool failed_ = false;
    std::optional<Token> peeked_;
};

} // namespace fountain::frontends::fountain
