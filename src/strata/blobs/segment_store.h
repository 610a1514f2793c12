#ifndef STRATA_BLOBS_SEGMENT_STORE_H
#define STRATA_BLOBS_SEGMENT_STORE_H

#include <atomic>
#include <memory>

#include <cppcoro/static_thread_pool.hpp>
#include <cppcoro/task.hpp>

#include <strata/blobs/types.hpp>
#include <strata/caching/registry.h>
#include <strata/storage/backing_store.h>

namespace strata {

// The segment store holds the fixed-size chunks that make up blob contents,
// keyed by (blob ID, index).
//
// It's a write-back store: set_segment() only updates the cache, and a
// segment reaches the backing table when its cache entry expires (or the
// cache is cleared). Segments that were only ever read are never written
// back. If a write-back fails while the registry is running, the segment is
// put back in the cache so that the next sweep retries it (replacing any
// clean copy that was read from the table in the meantime). Failures during
// shutdown, or while the store itself is being destroyed, are only logged.
//
// Cached segments are immutable snapshots, so readers can share them freely.

typedef std::shared_ptr<blob_segment const> segment_ptr;

// the schema of the table that holds blob segments
table_schema
blob_segment_table_schema(string const& table_prefix);

// the cache key for a segment
string
segment_cache_key(string const& blob_id, integer index);

namespace detail {

// the sole owner of write access to the segment table
struct segment_writer
{
    explicit segment_writer(table_writer& table) : table_(table)
    {
    }

    void
    persist(blob_segment const& segment);

    void
    erase(string const& blob_id, integer index);

 private:
    table_writer& table_;
};

} // namespace detail

struct segment_store : noncopyable
{
    segment_store(
        cache_registry& registry,
        backing_store& store,
        cppcoro::static_thread_pool& io_pool,
        blob_store_config const& config);

    // Unregisters (and thus flushes) the segment cache.
    ~segment_store();

    // Get a segment.
    // The result is null if the segment doesn't exist.
    cppcoro::task<segment_ptr>
    get_segment(string blob_id, integer index);

    // Record new contents for a segment.
    // The segment is marked dirty and cached. It will be persisted when its
    // cache entry expires.
    void
    set_segment(blob_segment segment);

    // Remove a segment from storage.
    // Any cached copy is discarded without being written back.
    cppcoro::task<>
    remove_segment(string blob_id, integer index);

    string const&
    cache_name() const
    {
        return cache_.name();
    }

 private:
    segment_store(
        cache_registry& registry,
        backing_table& table,
        cppcoro::static_thread_pool& io_pool,
        blob_store_config const& config);

    void
    write_back(string const& key, segment_ptr const& segment);

    // Put a segment whose write-back failed back in the cache.
    void
    rearm(string const& key, segment_ptr const& segment);

    cache_registry& registry_;
    table_reader& reader_;
    detail::segment_writer writer_;
    cppcoro::static_thread_pool& io_pool_;
    cache_duration ttl_;
    ttl_cache<segment_ptr>& cache_;

    // set once the store is being destroyed, after which failed write-backs
    // can't be retried
    std::atomic<bool> closing_ = false;
};

} // namespace strata

#endif
