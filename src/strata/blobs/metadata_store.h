#ifndef STRATA_BLOBS_METADATA_STORE_H
#define STRATA_BLOBS_METADATA_STORE_H

#include <vector>

#include <cppcoro/static_thread_pool.hpp>
#include <cppcoro/task.hpp>

#include <strata/blobs/types.hpp>
#include <strata/caching/registry.h>
#include <strata/storage/backing_store.h>

namespace strata {

// The metadata store keeps track of blob descriptors, keyed by
// (name, version).
//
// Descriptors are cached per name: the cache holds (some of) the known
// versions of a name, sorted by version. Reads consult the cache first and
// fall back to the backing table. Writes are persisted immediately with an
// upsert, and a cached list is only updated once that succeeds.

// the schema of the table that holds blob descriptors
table_schema
blob_metadata_table_schema(string const& table_prefix);

struct blob_metadata_store : noncopyable
{
    blob_metadata_store(
        cache_registry& registry,
        backing_store& store,
        cppcoro::static_thread_pool& io_pool,
        blob_store_config const& config);

    ~blob_metadata_store();

    // Get a single version of the named blob.
    // If :version is omitted, the latest (highest) version is returned.
    // The result is empty if no such blob exists.
    cppcoro::task<optional<blob_descriptor>>
    get_blob(string name, optional<integer> version = none);

    // Get every version of the named blob, sorted by version.
    cppcoro::task<std::vector<blob_descriptor>>
    get_blobs(string name);

    // Record :blob, replacing any existing descriptor with the same name and
    // version.
    cppcoro::task<>
    set_blob(blob_descriptor blob);

    // Remove one version (or, if :version is omitted, every version) of the
    // named blob.
    // The result is the list of descriptors that were removed.
    cppcoro::task<std::vector<blob_descriptor>>
    remove_blob(string name, optional<integer> version = none);

    string const&
    cache_name() const
    {
        return cache_.name();
    }

 private:
    void
    merge_into_cache(blob_descriptor const& blob, bool only_if_cached);

    cache_registry& registry_;
    ttl_cache<std::vector<blob_descriptor>>& cache_;
    backing_table& table_;
    cppcoro::static_thread_pool& io_pool_;
    cache_duration ttl_;
};

} // namespace strata

#endif
