//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Resolver.hpp
/// @brief Static placement checks for control-flow statements.
///
/// @details Runs between parsing and execution. A `break` or `continue`
/// must appear inside a `for` of the same function body, and a `return`
/// inside some function. Violations are reported with code F2100 and stop
/// the program from running.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/AST.hpp"
#include "support/diagnostics.hpp"

#include <string>

namespace fountain::frontends::fountain
{

class Resolver
{
  public:
    explicit Resolver(::fountain::support::DiagnosticEngine &diag) : diag_(diag) {}

    /// @brief Check every statement of @p program.
    /// @return True when no placement errors were found.
    bool resolve(const Program &program);

  private:
    void resolveStmt(const Stmt &stmt);
    void resolveBody(const StmtList &body);
    void error(SourceLoc loc, const std::string &message);

    ::fountain::support::DiagnosticEngine &diag_;

    /// @brief Loops enclosing the current statement within its function.
    int loopDepth_ = 0;

    /// @brief Function bodies enclosing the current statement.
    int fnDepth_ = 0;

    bool ok_ = true;
};

} // namespace fountain::frontends::fountain
