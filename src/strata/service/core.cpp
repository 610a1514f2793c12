#include <strata/service/core.h>

#include <thread>

#include <spdlog/spdlog.h>

#include <strata/service/internals.h>
#include <strata/storage/sqlite_store.h>
#include <strata/utilities/errors.h>

namespace strata {

void
service_core::reset()
{
    if (impl_)
    {
        // Flush everything while the store is still around.
        impl_->registry.stop();
        impl_.reset();
    }
}

void
service_core::reset(service_config const& config)
{
    if (config.io_concurrency && *config.io_concurrency <= 0)
    {
        STRATA_THROW(
            internal_check_failed() << internal_error_message_info(
                "io_concurrency must be positive"));
    }

    // Tear down any existing service first, so that its caches are flushed
    // before a new store is opened.
    reset();

    initialize_logging(config.logging);

    impl_.reset(new detail::service_core_internals{
        .registry = cache_registry(),
        .io_pool = cppcoro::static_thread_pool(
            config.io_concurrency
                ? static_cast<std::uint32_t>(*config.io_concurrency)
                : std::thread::hardware_concurrency()),
        .store = std::make_unique<sqlite_store>(config.sqlite)});
    impl_->blobs = std::make_unique<blob_store>(
        impl_->registry, *impl_->store, impl_->io_pool, config.blobs);

    spdlog::get("strata")->debug(
        "service initialized (database {})", config.sqlite.path);
}

service_core::~service_core()
{
    reset();
}

void
service_core::start()
{
    impl_->registry.start();
}

void
service_core::stop()
{
    impl_->registry.stop();
}

blob_store&
service_core::blobs()
{
    return *impl_->blobs;
}

void
init_test_service(service_core& core)
{
    service_config config;
    config.io_concurrency = 2;
    config.sqlite.path = ":memory:";
    config.blobs.sweep_interval = std::chrono::milliseconds(50);
    config.blobs.metadata_cache_ttl = std::chrono::milliseconds(200);
    config.blobs.segment_cache_ttl = std::chrono::milliseconds(200);
    config.blobs.throttle_period = std::chrono::milliseconds(100);
    core.reset(config);
}

} // namespace strata
