//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Standardise how horder reads files into memory.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned string is owned by the caller.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace horder::tools::common
{

support::Expected<std::string> loadSourceFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return support::Expected<std::string>(support::makeError({}, "unable to open " + path));
    }

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || static_cast<std::uint64_t>(fileSize) > kMaxSourceSize)
    {
        return support::Expected<std::string>(
            support::makeError({}, "source file too large: " + path + " (limit: 256 MB)"));
    }

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        return support::Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return support::Expected<std::string>(support::makeError({}, "out of memory reading " + path));
    }
}

} // namespace horder::tools::common
