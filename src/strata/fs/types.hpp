#ifndef STRATA_FS_TYPES_HPP
#define STRATA_FS_TYPES_HPP

#include <filesystem>

#include <strata/core.h>

namespace strata {

// (Note that file_path is of course slightly incorrect because the path could
// refer to a directory, but it's a lot easier to read and this seems like a
// pretty common usage.)
typedef std::filesystem::path file_path;

} // namespace strata

#endif
