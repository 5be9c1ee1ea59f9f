//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Helpers for reading Fountain source text from files and streams.
// Key invariants: A successful result holds the complete input.
// Ownership/Lifetime: The caller owns the returned buffer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <ios>
#include <iosfwd>
#include <string>

namespace fountain::tools::common
{

/// @brief Largest source file the tools will read.
inline constexpr std::streamoff kMaxSourceSize = static_cast<std::streamoff>(64ULL * 1024 * 1024);

/// @brief Read the whole file at @p path.
/// @return File contents, or a diagnostic describing the I/O failure.
fountain::support::Expected<std::string> loadSourceFile(const std::string &path);

/// @brief Read @p in until end of stream.
/// @param name Used in the diagnostic when reading fails.
fountain::support::Expected<std::string> loadSourceStream(std::istream &in, const std::string &name);

} // namespace fountain::tools::common
