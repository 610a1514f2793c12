#ifndef STRATA_FS_UTILITIES_H
#define STRATA_FS_UTILITIES_H

#include <strata/fs/types.hpp>

namespace strata {

// Remove :dir (if it exists) along with everything in it and recreate it
// empty.
void
reset_directory(file_path const& dir);

} // namespace strata

#endif
