#include <strata/blobs/types.hpp>

namespace strata {

bool
operator==(blob_descriptor const& a, blob_descriptor const& b)
{
    return a.name == b.name && a.version == b.version
           && a.blob_id == b.blob_id && a.length == b.length
           && a.segment_count == b.segment_count
           && a.segment_length == b.segment_length
           && a.time_created == b.time_created && a.metadata == b.metadata;
}

} // namespace strata
