//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Fwd.hpp
/// @brief Forward declarations and shared aliases for Fountain AST nodes.
///
/// @details Expressions and statements refer to each other only through
/// the unique_ptr aliases declared here, so AST_Expr.hpp and AST_Stmt.hpp
/// can be included in either order.
///
/// @invariant All pointer aliases use std::unique_ptr. AST nodes form a tree
///            owned top-down by the Program produced by the Parser.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>
#include <vector>

namespace fountain::frontends::fountain
{

using SourceLoc = ::fountain::support::SourceLoc;

struct Expr;
struct Stmt;
struct BlockStmt;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using BlockPtr = std::unique_ptr<BlockStmt>;
using StmtList = std::vector<StmtPtr>;

} // namespace fountain::frontends::fountain
