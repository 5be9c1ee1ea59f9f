//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Resolver.cpp
/// @brief Control-flow placement analysis for Fountain programs.
///
//===----------------------------------------------------------------------===//

#include "frontends/fountain/Resolver.hpp"

namespace fountain::frontends::fountain
{

bool Resolver::resolve(const Program &program)
{
    ok_ = true;
    loopDepth_ = 0;
    fnDepth_ = 0;
    resolveBody(program.statements);
    return ok_;
}

void Resolver::resolveBody(const StmtList &body)
{
    for (const auto &stmt : body)
        resolveStmt(*stmt);
}

void Resolver::error(SourceLoc loc, const std::string &message)
{
    ok_ = false;
    diag_.report(::fountain::support::Diagnostic{
        ::fountain::support::Severity::Error, message, loc, "F2100"});
}

void Resolver::resolveStmt(const Stmt &stmt)
{
    switch (stmt.kind)
    {
        case StmtKind::Block:
            resolveBody(static_cast<const BlockStmt &>(stmt).statements);
            break;
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            resolveBody(s.thenBlock->statements);
            if (s.elseBlock)
                resolveBody(s.elseBlock->statements);
            break;
        }
        case StmtKind::For:
            ++loopDepth_;
            resolveBody(static_cast<const ForStmt &>(stmt).body->statements);
            --loopDepth_;
            break;
        case StmtKind::FnDecl:
        {
            // Loops outside the function do not enclose its body.
            int savedLoops = loopDepth_;
            loopDepth_ = 0;
            ++fnDepth_;
            resolveBody(static_cast<const FnDeclStmt &>(stmt).body);
            --fnDepth_;
            loopDepth_ = savedLoops;
            break;
        }
        case StmtKind::Break:
            if (loopDepth_ == 0)
                error(stmt.loc, "'break' outside loop");
            break;
        case StmtKind::Continue:
            if (loopDepth_ == 0)
                error(stmt.loc, "'continue' outside loop");
            break;
        case StmtKind::Return:
            if (fnDepth_ == 0)
                error(stmt.loc, "'return' outside function");
            break;
        case StmtKind::Expr:
        case StmtKind::Print:
        case StmtKind::Assign:
        case StmtKind::Assert:
            break;
    }
}

} // namespace fountain::frontends::fountain
