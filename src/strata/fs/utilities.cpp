#include <strata/fs/utilities.h>

namespace strata {

void
reset_directory(file_path const& dir)
{
    if (exists(dir))
        remove_all(dir);
    create_directories(dir);
}

} // namespace strata
