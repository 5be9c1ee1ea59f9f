//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Human-readable dump of a Fountain program.
///
/// @details Produces an indentation-based tree with one node per line, the
/// node's identifying attributes, and its "(line:col)" location. Used by
/// `fountain --dump-ast` and by parser tests.
///
/// Example output:
/// @code
///   Program
///     FnDecl "add" (1:1)
///       Param "a" (1:8)
///       Param "b" (1:11)
///         Default:
///           NumberLiteral 2 (1:13)
///       Body:
///         Return (2:5)
///           Binary (+) (2:14)
///             Ident "a" (2:12)
///             Ident "b" (2:16)
/// @endcode
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/AST.hpp"

#include <string>

namespace fountain::frontends::fountain
{

/// @brief Produces a human-readable dump of a Fountain AST.
class AstPrinter
{
  public:
    /// @brief Dump every statement of @p program.
    std::string dump(const Program &program);

    /// @brief Dump a single expression tree.
    std::string dump(const Expr &expr);
};

} // namespace fountain::frontends::fountain
