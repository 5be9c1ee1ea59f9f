//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping source identifiers to display paths.
// Key invariants: File ID 0 is invalid; identifiers are stable for the
//                 manager's lifetime.
// Ownership/Lifetime: Manager owns the path strings it hands out views of.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fountain::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric source identifiers and the paths
/// (or pseudo-paths such as "<stdin>" and "<command>") they were loaded from.
class SourceManager
{
  public:
    /// @brief Register @p path and return its identifier.
    /// @details Registering the same normalized path twice returns the
    ///          identifier handed out the first time.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view when unknown.
    [[nodiscard]] std::string_view getPath(uint32_t file_id) const;

  private:
    /// Index corresponds to file identifier minus one. A deque keeps the
    /// string storage stable while new files are appended.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace fountain::support
