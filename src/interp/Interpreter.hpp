//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Interpreter.hpp
// Purpose: Declares the tree-walking evaluator for Fountain programs.
// Key invariants: Every heap object reachable from a live environment, an
//                 active frame, a value under evaluation or the last
//                 expression value survives collection. Collection only runs
//                 at statement boundaries.
// Ownership/Lifetime: The interpreter owns its heap, its globals and every
//                     Program it has executed. Closures point into those
//                     trees, so programs are kept for the interpreter's
//                     lifetime and a long REPL session grows this list.
//                     State persists across execute() calls.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/AST.hpp"
#include "interp/ExecResult.hpp"
#include "interp/Function.hpp"
#include "interp/Heap.hpp"
#include "interp/InterpOptions.hpp"
#include "interp/RuntimeError.hpp"
#include "interp/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace fountain::interp
{

class Environment;
class Table;

/// @brief Executes parsed Fountain programs against a persistent root
///        environment.
/// @details Statements return ExecResult so break, continue and return unwind
///          as ordinary values. Runtime failures throw RuntimeError; the
///          interpreter never catches them itself, so callers see every
///          error.
class Interpreter
{
  public:
    explicit Interpreter(InterpreterOptions options = {});
    ~Interpreter();

    Interpreter(const Interpreter &) = delete;
    Interpreter &operator=(const Interpreter &) = delete;

    /// @brief Redirect `print` output. Defaults to std::cout.
    void setOutput(std::ostream &os)
    {
        out_ = &os;
    }

    /// @brief Redirect trace output. Defaults to std::cerr.
    void setTraceOutput(std::ostream &os)
    {
        traceOut_ = &os;
    }

    /// @brief Bind a host function in the root environment.
    /// @param arity Positional argument count, or kVariadic.
    void defineBuiltin(const std::string &name, int arity, BuiltinFn fn);

    /// @brief Allocate an empty table on the interpreter heap.
    Table *newTable();

    /// @brief Run @p program to completion.
    /// @details Top-level expression statements update lastValue(). A
    ///          top-level `return` ends the program early. The program is
    ///          kept for the interpreter's lifetime because closures it
    ///          declares refer into its tree.
    /// @throws RuntimeError on any runtime failure. Its payload stays rooted
    ///         until the next execute() call.
    void execute(frontends::fountain::ProgramPtr program);

    /// @brief Value of the most recent top-level expression statement in the
    ///        latest execute() call, or nil.
    /// @details Rooted until the next execute() call.
    [[nodiscard]] const Value &lastValue() const
    {
        return lastValue_;
    }

    /// @brief Force a full collection.
    /// @return Number of objects freed.
    size_t collectGarbage();

    /// @brief Number of heap objects currently alive.
    [[nodiscard]] size_t liveObjectCount() const
    {
        return heap_.liveCount();
    }

  private:
    using Expr = frontends::fountain::Expr;
    using Stmt = frontends::fountain::Stmt;
    using StmtList = frontends::fountain::StmtList;

    /// @brief Keeps an environment reachable while it is executing.
    class FrameScope
    {
      public:
        FrameScope(Interpreter &interp, Environment *env) : interp_(interp)
        {
            interp_.frames_.push_back(env);
        }

        ~FrameScope()
        {
            interp_.frames_.pop_back();
        }

        FrameScope(const FrameScope &) = delete;
        FrameScope &operator=(const FrameScope &) = delete;

      private:
        Interpreter &interp_;
    };

    /// @brief Releases temporary roots pushed during its lifetime.
    class TempRootScope
    {
      public:
        explicit TempRootScope(Interpreter &interp)
            : interp_(interp), mark_(interp.tempRoots_.size())
        {
        }

        ~TempRootScope()
        {
            interp_.tempRoots_.resize(mark_);
        }

        void add(const Value &v)
        {
            if (GcObject *obj = v.asObject())
                interp_.tempRoots_.push_back(obj);
        }

        TempRootScope(const TempRootScope &) = delete;
        TempRootScope &operator=(const TempRootScope &) = delete;

      private:
        Interpreter &interp_;
        size_t mark_;
    };

    void executeProgram(const frontends::fountain::Program &prog);

    // Statements (Interpreter_Stmt.cpp)
    ExecResult execStmt(const Stmt &stmt, Environment &env);
    ExecResult execStatements(const StmtList &stmts, Environment &env);
    ExecResult execBlock(const frontends::fountain::BlockStmt &block, Environment &env);
    ExecResult execIf(const frontends::fountain::IfStmt &stmt, Environment &env);
    ExecResult execFor(const frontends::fountain::ForStmt &stmt, Environment &env);
    void execAssign(const frontends::fountain::AssignStmt &stmt, Environment &env);
    void execFnDecl(const frontends::fountain::FnDeclStmt &stmt, Environment &env);
    void execAssert(const frontends::fountain::AssertStmt &stmt, Environment &env);
    void execPrint(const frontends::fountain::PrintStmt &stmt, Environment &env);
    void traceStmt(const Stmt &stmt);

    // Expressions (Interpreter_Expr.cpp)
    Value eval(const Expr &expr, Environment &env);
    Value evalIdent(const frontends::fountain::IdentExpr &expr, Environment &env);
    Value evalUnary(const frontends::fountain::UnaryExpr &expr, Environment &env);
    Value evalBinary(const frontends::fountain::BinaryExpr &expr, Environment &env);
    Value evalLogical(const frontends::fountain::LogicalExpr &expr, Environment &env);
    Value evalConditional(const frontends::fountain::ConditionalExpr &expr, Environment &env);
    Value evalIndex(const frontends::fountain::IndexExpr &expr, Environment &env);
    Value evalField(const frontends::fountain::FieldExpr &expr, Environment &env);
    Value evalTable(const frontends::fountain::TableExpr &expr, Environment &env);

    // Calls (Interpreter_Call.cpp)
    Value evalCall(const frontends::fountain::CallExpr &expr, Environment &env);
    Value callClosure(Closure &fn,
                      std::vector<Value> &positional,
                      std::vector<std::pair<std::string, Value>> &named,
                      SourceLoc loc);
    Value callBuiltin(const Builtin &fn,
                      const std::vector<Value> &positional,
                      const std::vector<std::pair<std::string, Value>> &named,
                      SourceLoc loc);

    // Shared helpers
    Value numericOp(frontends::fountain::BinaryOp op,
                    const Value &lhs,
                    const Value &rhs,
                    SourceLoc loc) const;
    Value indexGet(const Value &base, const Value &key, SourceLoc loc) const;
    void indexSet(const Value &base, const Value &key, Value value, SourceLoc loc);
    Environment *newEnvironment(Environment *parent);

    /// @brief Raise ResourceError once evaluation has used more host stack
    ///        than options_.maxStackBytes.
    void checkStack(SourceLoc loc) const;
    static std::uintptr_t stackAddress();

    void maybeCollect();
    void markRoots(GcMarker &marker) const;

    InterpreterOptions options_;
    Heap heap_;
    Environment *globals_ = nullptr;
    std::vector<Environment *> frames_;
    std::vector<GcObject *> tempRoots_;
    Value lastValue_;
    Value errorPayload_;
    /// Every executed program; closures point into these trees, so they are
    /// never released while the interpreter lives.
    std::vector<frontends::fountain::ProgramPtr> programs_;
    std::ostream *out_;
    std::ostream *traceOut_;
    size_t callDepth_ = 0;
    std::uintptr_t stackBase_ = 0;
    size_t nextCollectAt_ = 0;
};

} // namespace fountain::interp
