//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Umbrella header for the Fountain AST.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/AST_Expr.hpp"
#include "frontends/fountain/AST_Fwd.hpp"
#include "frontends/fountain/AST_Stmt.hpp"
