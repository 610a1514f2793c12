#ifndef STRATA_SERVICE_CORE_H
#define STRATA_SERVICE_CORE_H

#include <memory>

#include <strata/service/config.h>

namespace strata {

struct blob_store;

namespace detail {

struct service_core_internals;

}

// The service core assembles the objects that make up a running strata
// process: the cache registry, the I/O thread pool, the backing store and
// the blob store.
struct service_core
{
    service_core()
    {
    }
    service_core(service_config const& config)
    {
        reset(config);
    }
    ~service_core();

    void
    reset();
    void
    reset(service_config const& config);

    // Start the cache sweep timers.
    void
    start();

    // Stop the sweep timers and flush every cache to the backing store.
    void
    stop();

    detail::service_core_internals&
    internals()
    {
        return *impl_;
    }

    blob_store&
    blobs();

 private:
    std::unique_ptr<detail::service_core_internals> impl_;
};

// Initialize a service for unit testing purposes.
// The service uses a private in-memory database and short cache lifetimes.
void
init_test_service(service_core& core);

} // namespace strata

#endif
