//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Source loading for the fountain command-line tool.

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <istream>
#include <new>
#include <sstream>

namespace fountain::tools::common
{

using fountain::support::Diagnostic;
using fountain::support::Expected;
using fountain::support::Severity;

namespace
{

Diagnostic ioError(std::string message)
{
    return Diagnostic{Severity::Error, std::move(message), {}, {}};
}

} // namespace

Expected<std::string> loadSourceFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("unable to open " + path);

    in.seekg(0, std::ios::end);
    const std::streamoff fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
        return ioError("source file too large: " + path + " (limit: 64 MB)");

    return loadSourceStream(in, path);
}

Expected<std::string> loadSourceStream(std::istream &in, const std::string &name)
{
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            return ioError("error reading " + name);
        return ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return ioError("out of memory reading " + name);
    }
}

} // namespace fountain::tools::common
