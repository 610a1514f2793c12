#ifndef STRATA_BLOBS_TYPES_HPP
#define STRATA_BLOBS_TYPES_HPP

#include <chrono>

#include <strata/core.h>
#include <strata/encodings/json.h>
#include <strata/utilities/errors.h>

namespace strata {

// arbitrary caller-supplied metadata - This is passed through untouched.
typedef json_document blob_metadata;

// a single version of a logical blob
struct blob_descriptor
{
    string name;

    integer version = 0;

    // the unique ID of this version (which keys its segments)
    string blob_id;

    // the total length of the blob (in bytes) - This is only exact once the
    // stream that wrote it has been closed.
    integer length = 0;

    integer segment_count = 0;

    // the capacity of each segment (in bytes)
    integer segment_length = 0;

    // when the blob was created (seconds since the Unix epoch)
    integer time_created = 0;

    blob_metadata metadata = blob_metadata::object();
};

bool
operator==(blob_descriptor const& a, blob_descriptor const& b);

// a fixed-capacity chunk of a blob's contents
struct blob_segment
{
    string blob_id;

    integer index = 0;

    byte_vector buffer;

    // Has :buffer been modified in this process since it was last persisted?
    bool dirty = false;
};

struct blob_store_config
{
    // prepended to the names of the tables and caches that the store uses
    string table_prefix;

    // the segment length used when a stream is created without one
    integer default_segment_length = 0x10'00'00;

    std::chrono::milliseconds metadata_cache_ttl = std::chrono::seconds(60);

    std::chrono::milliseconds segment_cache_ttl = std::chrono::seconds(20);

    // how often the caches are swept for expired entries
    std::chrono::milliseconds sweep_interval = std::chrono::seconds(30);

    // the interval over which a throttled stream emits its byte allowance
    std::chrono::milliseconds throttle_period = std::chrono::seconds(1);
};

// This exception indicates an attempt to create a blob version that already
// exists.
STRATA_DEFINE_EXCEPTION(blob_version_conflict)
STRATA_DEFINE_ERROR_INFO(string, blob_name)
STRATA_DEFINE_ERROR_INFO(integer, blob_version)

// This exception indicates that a blob's stored state is inconsistent (e.g.,
// its metadata promises more segments than exist). It terminates the stream
// that encounters it.
STRATA_DEFINE_EXCEPTION(blob_stream_failure)
// This exception also provides internal_error_message_info.

// This exception indicates that a blob stream was used incorrectly (e.g.,
// mixing reads and writes).
STRATA_DEFINE_EXCEPTION(blob_stream_misuse)
// This exception also provides internal_error_message_info.

} // namespace strata

#endif
