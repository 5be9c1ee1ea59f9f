//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Function.hpp
// Purpose: Declares callable values: user closures and host builtins.
// Key invariants: A Closure's declaration outlives it (the interpreter keeps
//                 every executed Program alive); its captured environment is
//                 traced so it survives as long as the closure does.
// Ownership/Lifetime: Heap-owned; Values refer to functions by raw pointer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/AST_Stmt.hpp"
#include "interp/Heap.hpp"
#include "interp/Value.hpp"

#include <functional>
#include <string>
#include <vector>

namespace fountain::interp
{

class Environment;

/// @brief Host callback behind a builtin. Errors are raised by throwing
///        RuntimeError.
using BuiltinFn = std::function<Value(const std::vector<Value> &args)>;

/// @brief Arity value accepting any number of positional arguments.
constexpr int kVariadic = -1;

/// @brief Common base of every callable value.
class Function : public GcObject
{
  public:
    enum class Kind
    {
        Closure,
        Builtin,
    };

    [[nodiscard]] Kind kind() const
    {
        return kind_;
    }

    [[nodiscard]] const std::string &name() const
    {
        return name_;
    }

  protected:
    Function(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {}

  private:
    Kind kind_;
    std::string name_;
};

/// @brief A `fn` declaration paired with the environment it was declared in.
class Closure final : public Function
{
  public:
    Closure(const frontends::fountain::FnDeclStmt &decl, Environment *captured)
        : Function(Kind::Closure, decl.name), decl_(decl), captured_(captured)
    {
    }

    [[nodiscard]] const frontends::fountain::FnDeclStmt &decl() const
    {
        return decl_;
    }

    [[nodiscard]] Environment *captured() const
    {
        return captured_;
    }

    void trace(GcMarker &marker) const override;

  private:
    const frontends::fountain::FnDeclStmt &decl_;
    Environment *captured_;
};

/// @brief A host-supplied function. Builtins accept positional arguments
///        only.
class Builtin final : public Function
{
  public:
    Builtin(std::string name, int arity, BuiltinFn fn)
        : Function(Kind::Builtin, std::move(name)), arity_(arity), fn_(std::move(fn))
    {
    }

    /// @brief Expected argument count, or kVariadic.
    [[nodiscard]] int arity() const
    {
        return arity_;
    }

    Value invoke(const std::vector<Value> &args) const
    {
        return fn_(args);
    }

    void trace(GcMarker &) const override {}

  private:
    int arity_;
    BuiltinFn fn_;
};

} // namespace fountain::interp
