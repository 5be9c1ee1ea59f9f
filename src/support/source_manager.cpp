//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Backing store for the file identifiers used in diagnostics.
/// @details The CLI, the REPL and embedders register each buffer they run so
///          that tokens and runtime errors can carry a compact integer id
///          instead of a path string.

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace fountain::support
{
namespace
{
/// Pseudo-paths like "<stdin>" are kept verbatim.
std::string normalizePath(std::string path)
{
    if (!path.empty() && path.front() == '<')
        return path;
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a path and assign it a stable identifier.
///
/// @details Identifiers start at one, leaving zero to represent an unknown
///          location. On exhaustion of the 32-bit identifier space the
///          overflow is reported to stderr and zero is returned.
///
/// @param path Path or pseudo-path of the buffer.
/// @return Identifier (>0) representing the stored path.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string{kSourceManagerFileIdOverflowMessage});
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the stored path associated with a file identifier.
/// @return Stored path, or an empty view if @p file_id is invalid.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace fountain::support
