//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Table.hpp
// Purpose: Declares the insertion-ordered hash table behind Fountain tables.
// Key invariants: entries_ holds each key once, in first-insertion order;
//                 index_ maps every key to its position in entries_.
// Ownership/Lifetime: Owned by the Heap; shared by reference between all
//                     Values that point at it.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Heap.hpp"
#include "interp/Value.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fountain::interp
{

/// @brief Ordered key to value mapping unifying arrays and records.
/// @details Lookups are by key equality; iteration and rendering follow the
///          order in which keys were first inserted. Overwriting an existing
///          key keeps its original position.
class Table final : public GcObject
{
  public:
    using Entry = std::pair<Value, Value>;

    /// @brief Value stored under @p key, or nil when absent.
    [[nodiscard]] Value get(const Value &key) const;

    /// @brief Insert or overwrite @p key.
    /// @pre validateKey(key) returned no error.
    void set(const Value &key, Value value);

    [[nodiscard]] bool contains(const Value &key) const;

    /// @brief Number of keys.
    [[nodiscard]] size_t size() const
    {
        return entries_.size();
    }

    /// @brief Entries in insertion order.
    [[nodiscard]] const std::vector<Entry> &entries() const
    {
        return entries_;
    }

    /// @brief Check whether @p key may be stored in a table.
    /// @return An error message for NaN keys, nullopt otherwise.
    static std::optional<std::string_view> validateKey(const Value &key);

    void trace(GcMarker &marker) const override;

  private:
    std::vector<Entry> entries_;
    std::unordered_map<Value, size_t, ValueHash> index_;
};

/// @brief Structural comparison used to check that a rendered table parses
///        back to the same contents.
/// @details Tables are equal when they hold equal keys in the same order with
///          values that are equal (recursively structural for nested
///          tables). Cycles compare equal when both sides revisit the same
///          pair of tables.
bool deepEquals(const Value &a, const Value &b);

} // namespace fountain::interp
