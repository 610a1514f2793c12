#ifndef STRATA_BLOBS_BLOB_STORE_H
#define STRATA_BLOBS_BLOB_STORE_H

#include <memory>

#include <strata/blobs/blob_stream.h>

namespace strata {

// The blob store is the entry point for reading and writing versioned blobs.
// It owns the metadata and segment stores (and thus their caches) and hands
// out streams bound to them.
//
// The registry, backing store and thread pool must outlive the blob store,
// and the blob store must outlive any streams it creates.

// Generate a fresh blob ID (a random UUID without dashes).
string
generate_blob_id();

struct blob_store : noncopyable
{
    blob_store(
        cache_registry& registry,
        backing_store& store,
        cppcoro::static_thread_pool& io_pool,
        blob_store_config config = blob_store_config());

    // Open a stream for reading an existing blob.
    // If :version is omitted, the latest version is opened.
    // The result is null if there's no such blob.
    cppcoro::task<std::unique_ptr<blob_stream>>
    open_stream(string name, optional<integer> version = none);

    // Create a stream for writing a new version of a blob.
    // If :version is omitted, the version after the latest existing one (or 1,
    // if there are none) is used. Otherwise, blob_version_conflict is thrown
    // if that version already exists.
    // If :segment_length is omitted, the configured default is used.
    cppcoro::task<std::unique_ptr<blob_stream>>
    create_stream(
        string name,
        optional<integer> version = none,
        optional<integer> segment_length = none);

    cppcoro::task<optional<blob_descriptor>>
    get_blob(string name, optional<integer> version = none);

    cppcoro::task<std::vector<blob_descriptor>>
    get_blobs(string name);

    // Remove one version (or all versions) of a blob, along with their
    // segments.
    // The result is the list of versions that were removed (which is empty if
    // there was nothing to remove).
    cppcoro::task<std::vector<blob_descriptor>>
    remove_blob(string name, optional<integer> version = none);

    blob_store_config const&
    config() const
    {
        return config_;
    }

    blob_metadata_store&
    metadata()
    {
        return metadata_;
    }

    segment_store&
    segments()
    {
        return segments_;
    }

 private:
    cppcoro::static_thread_pool& io_pool_;
    // drives the streams' throttle waits
    timer_service timers_;
    blob_store_config config_;
    blob_metadata_store metadata_;
    segment_store segments_;
};

} // namespace strata

#endif
