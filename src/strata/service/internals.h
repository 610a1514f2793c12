#ifndef STRATA_SERVICE_INTERNALS_H
#define STRATA_SERVICE_INTERNALS_H

#include <memory>

#include <cppcoro/static_thread_pool.hpp>

#include <strata/blobs/blob_store.h>
#include <strata/caching/registry.h>
#include <strata/storage/backing_store.h>

namespace strata {

namespace detail {

// Members are destroyed in reverse order, so the blob store (whose caches
// write back into :store) goes first and the registry goes last.
struct service_core_internals
{
    strata::cache_registry registry;

    cppcoro::static_thread_pool io_pool;

    std::unique_ptr<backing_store> store;

    std::unique_ptr<blob_store> blobs;
};

} // namespace detail

} // namespace strata

#endif
