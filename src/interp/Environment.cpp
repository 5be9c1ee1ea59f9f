//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Scope chain lookup and assignment.

#include "interp/Environment.hpp"

namespace fountain::interp
{

const Value *Environment::lookup(const std::string &name) const
{
    for (const Environment *env = this; env; env = env->parent_)
    {
        auto it = env->vars_.find(name);
        if (it != env->vars_.end())
            return &it->second;
    }
    return nullptr;
}

Value *Environment::findSlot(const std::string &name)
{
    for (Environment *env = this; env; env = env->parent_)
    {
        auto it = env->vars_.find(name);
        if (it != env->vars_.end())
            return &it->second;
    }
    return nullptr;
}

void Environment::define(const std::string &name, Value value)
{
    vars_.insert_or_assign(name, std::move(value));
}

void Environment::assign(const std::string &name, Value value)
{
    if (Value *slot = findSlot(name))
    {
        *slot = std::move(value);
        return;
    }
    vars_.emplace(name, std::move(value));
}

void Environment::trace(GcMarker &marker) const
{
    if (parent_)
        marker.mark(parent_);
    for (const auto &entry : vars_)
        marker.mark(entry.second);
}

} // namespace fountain::interp
