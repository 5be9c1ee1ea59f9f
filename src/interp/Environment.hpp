//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Environment.hpp
// Purpose: Declares the scope chain used for variable lookup and closures.
// Key invariants: A name is bound at most once per environment; lookups walk
//                 from the innermost environment outward.
// Ownership/Lifetime: Heap-owned. Parents are shared, non-owning pointers kept
//                     alive by tracing.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Heap.hpp"
#include "interp/Value.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace fountain::interp
{

/// @brief One scope: a name to value map plus a link to the enclosing scope.
class Environment final : public GcObject
{
  public:
    explicit Environment(Environment *parent = nullptr) : parent_(parent) {}

    [[nodiscard]] Environment *parent() const
    {
        return parent_;
    }

    /// @brief Find the value bound to @p name in this scope or an ancestor.
    /// @return Pointer to the stored value, or nullptr when unbound.
    [[nodiscard]] const Value *lookup(const std::string &name) const;

    /// @brief Bind @p name in this scope, replacing any existing binding here.
    void define(const std::string &name, Value value);

    /// @brief Assign with first-assignment-declares semantics.
    /// @details Updates the nearest scope that binds @p name. When no scope in
    ///          the chain binds it, a new binding is created in this scope.
    void assign(const std::string &name, Value value);

    void trace(GcMarker &marker) const override;

  private:
    Value *findSlot(const std::string &name);

    Environment *parent_;
    std::unordered_map<std::string, Value> vars_;
};

} // namespace fountain::interp
