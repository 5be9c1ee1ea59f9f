//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: Character classification used by the lexer and by the value
//          printer when deciding whether a table key renders as a bare name.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <string_view>

namespace fountain::frontends::common::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character can start an identifier (letter or underscore).
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_';
}

/// @brief Check if character can continue an identifier.
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isLetter(c) || isDigit(c) || c == '_';
}

/// @brief Check if character is ASCII whitespace.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/// @brief Check whether @p text is spelled like an identifier.
/// @details Keywords also pass; callers that care must consult the keyword
///          table separately.
[[nodiscard]] constexpr bool isIdentifierSpelling(std::string_view text) noexcept
{
    if (text.empty() || !isIdentifierStart(text.front()))
        return false;
    for (char c : text)
    {
        if (!isIdentifierContinue(c))
            return false;
    }
    return true;
}

} // namespace fountain::frontends::common::char_utils
