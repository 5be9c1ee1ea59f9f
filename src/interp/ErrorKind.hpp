//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/ErrorKind.hpp
// Purpose: Classification of every error a Fountain run can end with.
// Key invariants: Enum values map one-to-one onto the names toString returns.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string_view>

namespace fountain::interp
{

/// @brief Categorises errors for reporting and for host-side handling.
enum class ErrorKind : int32_t
{
    LexError = 0,           ///< Bad character or unterminated string.
    ParseError = 1,         ///< Grammar violation.
    TypeError = 2,          ///< Operand kind mismatch or calling a non-function.
    ArgumentError = 3,      ///< Arity or argument naming mismatch in a call.
    UndefinedNameError = 4, ///< Read of an unbound identifier.
    AssertionError = 5,     ///< Failed `assert`.
    ControlFlowError = 6,   ///< break/continue outside a loop, return outside a function.
    ResourceError = 7,      ///< Call depth exhaustion.
};

/// @brief Convert an error kind to its canonical name.
constexpr std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::LexError:
            return "LexError";
        case ErrorKind::ParseError:
            return "ParseError";
        case ErrorKind::TypeError:
            return "TypeError";
        case ErrorKind::ArgumentError:
            return "ArgumentError";
        case ErrorKind::UndefinedNameError:
            return "UndefinedNameError";
        case ErrorKind::AssertionError:
            return "AssertionError";
        case ErrorKind::ControlFlowError:
            return "ControlFlowError";
        case ErrorKind::ResourceError:
            return "ResourceError";
    }
    return "RuntimeError";
}

} // namespace fountain::interp
