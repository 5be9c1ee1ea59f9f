//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/KeywordTable.hpp
// Purpose: Compile-time keyword tables with binary search lookup.
//
// Key Features:
//   - Sorted std::array of entries, verified with static_assert
//   - Case-sensitive lookup returning std::optional
//
//===----------------------------------------------------------------------===//
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace fountain::frontends::common::keyword_table
{

/// @brief A keyword entry mapping a lexeme to a token kind.
/// @tparam TokenKind The token kind enum type.
template <typename TokenKind> struct KeywordEntry
{
    std::string_view lexeme; ///< The keyword text.
    TokenKind kind;          ///< The token kind for this keyword.
};

/// @brief Check if a keyword table is strictly sorted by lexeme.
/// @details Used for static_assert validation of compile-time tables.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr bool isKeywordTableSorted(
    const std::array<KeywordEntry<TokenKind>, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1].lexeme < table[i].lexeme))
            return false;
    }
    return true;
}

/// @brief Binary search lookup in a sorted keyword table.
/// @return The token kind if found, std::nullopt otherwise.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr std::optional<TokenKind> lookupKeywordBinary(
    const std::array<KeywordEntry<TokenKind>, N> &table, std::string_view lexeme)
{
    std::size_t first = 0;
    std::size_t last = N;

    while (first < last)
    {
        std::size_t mid = first + (last - first) / 2;
        if (table[mid].lexeme == lexeme)
            return table[mid].kind;
        if (table[mid].lexeme < lexeme)
            first = mid + 1;
        else
            last = mid;
    }

    return std::nullopt;
}

} // namespace fountain::frontends::common::keyword_table
