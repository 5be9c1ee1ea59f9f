//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements Fountain tables and structural table comparison.

#include "interp/Table.hpp"

#include <cmath>
#include <set>

namespace fountain::interp
{

Value Table::get(const Value &key) const
{
    auto it = index_.find(key);
    if (it == index_.end())
        return Value::nil();
    return entries_[it->second].second;
}

void Table::set(const Value &key, Value value)
{
    auto it = index_.find(key);
    if (it != index_.end())
    {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, std::move(value));
}

bool Table::contains(const Value &key) const
{
    return index_.find(key) != index_.end();
}

std::optional<std::string_view> Table::validateKey(const Value &key)
{
    if (key.isNumber() && std::isnan(key.asNumber()))
        return std::string_view("table index is NaN");
    return std::nullopt;
}

void Table::trace(GcMarker &marker) const
{
    for (const auto &[key, value] : entries_)
    {
        marker.mark(key);
        marker.mark(value);
    }
}

namespace
{
using TablePair = std::pair<const Table *, const Table *>;

bool deepEqualsImpl(const Value &a, const Value &b, std::set<TablePair> &inProgress)
{
    if (!a.isTable() || !b.isTable())
        return a == b;

    const Table *ta = a.asTable();
    const Table *tb = b.asTable();
    if (ta == tb)
        return true;
    if (ta->size() != tb->size())
        return false;
    if (!inProgress.insert({ta, tb}).second)
        return true;

    const auto &ea = ta->entries();
    const auto &eb = tb->entries();
    for (size_t i = 0; i < ea.size(); ++i)
    {
        // Keys compare by language equality; table keys compare by identity.
        if (ea[i].first != eb[i].first)
            return false;
        if (!deepEqualsImpl(ea[i].second, eb[i].second, inProgress))
            return false;
    }
    return true;
}
} // namespace

bool deepEquals(const Value &a, const Value &b)
{
    std::set<TablePair> inProgress;
    return deepEqualsImpl(a, b, inProgress);
}

} // namespace fountain::interp
