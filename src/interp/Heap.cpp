//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Mark-and-sweep collection over the interpreter heap.
/// @details Objects only hold raw pointers to one another, so sweeping can
///          destroy unreachable objects in any order, including members of
///          reference cycles.

#include "interp/Heap.hpp"

#include <algorithm>

namespace fountain::interp
{

void GcMarker::mark(GcObject *obj)
{
    if (!obj || obj->marked_)
        return;
    obj->marked_ = true;
    worklist_.push_back(obj);
}

void GcMarker::drain()
{
    while (!worklist_.empty())
    {
        GcObject *obj = worklist_.back();
        worklist_.pop_back();
        obj->trace(*this);
    }
}

size_t Heap::collect(const std::function<void(GcMarker &)> &markRoots)
{
    GcMarker marker;
    markRoots(marker);
    marker.drain();

    const size_t before = objects_.size();
    auto firstDead = std::partition(objects_.begin(),
                                    objects_.end(),
                                    [](const std::unique_ptr<GcObject> &obj)
                                    { return obj->marked_; });
    objects_.erase(firstDead, objects_.end());

    for (auto &obj : objects_)
        obj->marked_ = false;

    allocatedSinceCollect_ = 0;
    return before - objects_.size();
}

} // namespace fountain::interp
