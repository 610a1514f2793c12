#ifndef STRATA_CACHING_REGISTRY_H
#define STRATA_CACHING_REGISTRY_H

#include <memory>

#include <strata/caching/ttl_cache.h>
#include <strata/utilities/errors.h>

// The cache registry owns a process's named TTL caches and the timers that
// sweep them.
//
// Caches that share a sweep interval share a timer, so the number of live
// timers is bounded by the number of distinct intervals rather than the
// number of caches.
//
// Lifecycle: construct, start() (timers begin sweeping), stop() (timers are
// stopped and every cache is cleared, which flushes all write-back state).
// The destructor calls stop().
//
// Callbacks bound through create_cache() are guarded by the registry: if one
// throws, the error is logged and the remaining entries are still processed.

namespace strata {

// This exception indicates an attempt to create a cache with a name that's
// already in use.
STRATA_DEFINE_EXCEPTION(cache_already_exists)
// This exception indicates that no cache is registered with the given name
// (or that it holds a different value type).
STRATA_DEFINE_EXCEPTION(unknown_cache)
// This provides the name of the cache.
STRATA_DEFINE_ERROR_INFO(string, cache_name)

struct cache_registry_impl;

namespace detail {

// Wrap a cache callback so that exceptions are logged rather than propagated.
template<class Value>
typename ttl_cache<Value>::callback
guard_cache_callback(
    string cache_name,
    char const* callback_name,
    typename ttl_cache<Value>::callback callback);

void
log_cache_callback_failure(
    string const& cache_name,
    char const* callback_name,
    string const& key,
    std::exception const& e);

} // namespace detail

struct cache_registry : noncopyable
{
    cache_registry();
    ~cache_registry();

    // Start the sweep timers.
    void
    start();

    // Stop the sweep timers and clear every cache.
    // Caches remain registered (and usable) afterwards; start() may be called
    // again.
    void
    stop();

    // Is the registry between start() and stop()?
    bool
    is_running() const;

    // Create and register a cache.
    // Throws cache_already_exists if :name is already registered.
    template<class Value>
    ttl_cache<Value>&
    create_cache(
        string const& name,
        cache_duration ttl,
        cache_duration sweep_interval,
        typename ttl_cache<Value>::callback on_added = nullptr,
        typename ttl_cache<Value>::callback on_expired = nullptr)
    {
        auto cache = std::make_unique<ttl_cache<Value>>(
            name,
            ttl,
            on_added ? detail::guard_cache_callback<Value>(
                name, "on_added", std::move(on_added))
                     : nullptr,
            on_expired ? detail::guard_cache_callback<Value>(
                name, "on_expired", std::move(on_expired))
                       : nullptr);
        auto& result = *cache;
        add_cache(std::move(cache), sweep_interval);
        return result;
    }

    // Look up a registered cache.
    // Throws unknown_cache if there's no cache with the given name and value
    // type.
    template<class Value>
    ttl_cache<Value>&
    get_cache(string const& name)
    {
        auto* cache = dynamic_cast<ttl_cache<Value>*>(&find_cache(name));
        if (!cache)
            STRATA_THROW(unknown_cache() << cache_name_info(name));
        return *cache;
    }

    bool
    has_cache(string const& name) const;

    // Clear the named cache (invoking its :on_expired callback for every
    // entry) and unregister it.
    void
    delete_cache(string const& name);

    // the number of sweep timers (one per distinct sweep interval)
    std::size_t
    timer_count() const;

    // Synchronously sweep every registered cache as of :now.
    void
    sweep_all(cache_time now = cache_clock::now());

    // Clear every registered cache without stopping the timers.
    void
    flush();

 private:
    void
    add_cache(
        std::unique_ptr<detail::ttl_cache_interface> cache,
        cache_duration sweep_interval);

    detail::ttl_cache_interface&
    find_cache(string const& name);

    std::unique_ptr<cache_registry_impl> impl_;
};

namespace detail {

template<class Value>
typename ttl_cache<Value>::callback
guard_cache_callback(
    string cache_name,
    char const* callback_name,
    typename ttl_cache<Value>::callback callback)
{
    return [cache_name = std::move(cache_name),
            callback_name,
            callback = std::move(callback)](
               string const& key, Value const& value, cache_time expires_at) {
        try
        {
            callback(key, value, expires_at);
        }
        catch (std::exception& e)
        {
            log_cache_callback_failure(cache_name, callback_name, key, e);
        }
    };
}

} // namespace detail

} // namespace strata

#endif
