//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Heap.hpp
// Purpose: Declares the tracing mark-and-sweep heap that owns every table,
//          environment and function created by a running program.
// Key invariants: Every live GcObject is owned by exactly one Heap. Mark bits
//                 are clear outside of collect().
// Ownership/Lifetime: The Heap owns its objects through unique_ptr; Values and
//                     other objects hold raw, non-owning pointers.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Value.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace fountain::interp
{

class GcMarker;

/// @brief Base class of every heap-allocated runtime object.
class GcObject
{
  public:
    virtual ~GcObject() = default;

    /// @brief Report every object directly referenced by this one.
    virtual void trace(GcMarker &marker) const = 0;

  private:
    friend class GcMarker;
    friend class Heap;

    bool marked_ = false;
};

/// @brief Worklist-driven marker handed to GcObject::trace.
/// @details Marking is iterative so that long reference chains (deeply
///          nested tables, long scope chains) cannot exhaust the host stack.
class GcMarker
{
  public:
    void mark(GcObject *obj);

    void mark(const Value &v)
    {
        mark(v.asObject());
    }

    /// @brief Trace reachable objects until the worklist is empty.
    void drain();

  private:
    std::vector<GcObject *> worklist_;
};

/// @brief Owner of all runtime objects; reclaims unreachable ones, cycles
///        included.
class Heap
{
  public:
    Heap() = default;
    Heap(const Heap &) = delete;
    Heap &operator=(const Heap &) = delete;

    /// @brief Allocate a new object of type @p T.
    template <class T, class... Args> T *make(Args &&...args)
    {
        auto obj = std::make_unique<T>(std::forward<Args>(args)...);
        T *raw = obj.get();
        objects_.push_back(std::move(obj));
        ++allocatedSinceCollect_;
        return raw;
    }

    /// @brief Run a full collection.
    /// @param markRoots Callback that marks every root through the marker.
    /// @return Number of objects freed.
    size_t collect(const std::function<void(GcMarker &)> &markRoots);

    /// @brief Objects currently owned by the heap.
    [[nodiscard]] size_t liveCount() const
    {
        return objects_.size();
    }

    /// @brief Allocations since the last collection.
    [[nodiscard]] size_t allocatedSinceCollect() const
    {
        return allocatedSinceCollect_;
    }

  private:
    std::vector<std::unique_ptr<GcObject>> objects_;
    size_t allocatedSinceCollect_ = 0;
};

} // namespace fountain::interp
