#include <strata/caching/registry.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <thread>

#include <spdlog/spdlog.h>

#include <strata/utilities/logging.h>

namespace strata {

namespace {

// a set of caches that share a sweep interval (and thus a timer thread)
struct sweep_group : noncopyable
{
    cache_duration interval;

    // protected by both the registry mutex and :sweep_mutex
    std::vector<detail::ttl_cache_interface*> caches;

    std::thread thread;
    // protected by the registry mutex
    bool stopping = false;
    // used (with the registry mutex) to wake the timer early when stopping
    std::condition_variable cv;

    // held while this group's caches are being swept, so that a cache can't
    // be destroyed out from under the timer
    std::mutex sweep_mutex;
};

} // namespace

struct cache_registry_impl
{
    std::map<string, std::unique_ptr<detail::ttl_cache_interface>> caches;

    std::map<cache_duration, std::unique_ptr<sweep_group>> groups;

    std::atomic<bool> running = false;

    // protects :caches and :groups
    mutable std::mutex mutex;
};

static void
run_sweep_timer(cache_registry_impl& registry, sweep_group& group)
{
    std::unique_lock<std::mutex> lock(registry.mutex);
    while (!group.cv.wait_for(
        lock, group.interval, [&] { return group.stopping; }))
    {
        std::unique_lock<std::mutex> sweep_lock(group.sweep_mutex);
        auto caches = group.caches;
        lock.unlock();
        auto now = cache_clock::now();
        for (auto* cache : caches)
            cache->sweep(now);
        sweep_lock.unlock();
        lock.lock();
    }
}

// The caller must hold the registry mutex.
static void
launch_timer(cache_registry_impl& registry, sweep_group& group)
{
    group.stopping = false;
    group.thread
        = std::thread([&registry, &group] { run_sweep_timer(registry, group); });
}

// Get a snapshot of the registered caches.
static std::vector<detail::ttl_cache_interface*>
list_caches(cache_registry_impl& registry)
{
    std::scoped_lock<std::mutex> lock(registry.mutex);
    std::vector<detail::ttl_cache_interface*> caches;
    caches.reserve(registry.caches.size());
    for (auto const& [name, cache] : registry.caches)
        caches.push_back(cache.get());
    return caches;
}

cache_registry::cache_registry() : impl_(new cache_registry_impl)
{
    initialize_logging();
}

cache_registry::~cache_registry()
{
    stop();
}

void
cache_registry::start()
{
    auto& registry = *impl_;
    std::scoped_lock<std::mutex> lock(registry.mutex);
    if (registry.running)
        return;
    registry.running = true;
    for (auto& [interval, group] : registry.groups)
        launch_timer(registry, *group);
    spdlog::get("strata")->info(
        "cache registry started ({} caches, {} timers)",
        registry.caches.size(),
        registry.groups.size());
}

void
cache_registry::stop()
{
    auto& registry = *impl_;
    std::vector<std::thread> timers;
    {
        std::scoped_lock<std::mutex> lock(registry.mutex);
        registry.running = false;
        for (auto& [interval, group] : registry.groups)
        {
            group->stopping = true;
            group->cv.notify_all();
            if (group->thread.joinable())
                timers.push_back(std::move(group->thread));
        }
    }
    for (auto& timer : timers)
        timer.join();

    // Flush everything that's still buffered.
    auto caches = list_caches(registry);
    for (auto* cache : caches)
        cache->clear();

    if (!timers.empty())
    {
        spdlog::get("strata")->info(
            "cache registry stopped ({} caches flushed)", caches.size());
    }
}

bool
cache_registry::is_running() const
{
    return impl_->running;
}

void
cache_registry::add_cache(
    std::unique_ptr<detail::ttl_cache_interface> cache,
    cache_duration sweep_interval)
{
    auto& registry = *impl_;
    if (sweep_interval <= cache_duration::zero())
    {
        STRATA_THROW(
            internal_check_failed()
            << cache_name_info(cache->name())
            << internal_error_message_info(
                   "cache sweep interval must be positive"));
    }

    std::scoped_lock<std::mutex> lock(registry.mutex);
    auto const& name = cache->name();
    if (registry.caches.find(name) != registry.caches.end())
        STRATA_THROW(cache_already_exists() << cache_name_info(name));

    auto& group = registry.groups[sweep_interval];
    if (!group)
    {
        group = std::make_unique<sweep_group>();
        group->interval = sweep_interval;
        if (registry.running)
            launch_timer(registry, *group);
    }
    {
        std::scoped_lock<std::mutex> sweep_lock(group->sweep_mutex);
        group->caches.push_back(cache.get());
    }

    spdlog::get("strata")->debug(
        "created cache {} (sweep interval {} ms)",
        name,
        sweep_interval.count());
    registry.caches.emplace(name, std::move(cache));
}

detail::ttl_cache_interface&
cache_registry::find_cache(string const& name)
{
    auto& registry = *impl_;
    std::scoped_lock<std::mutex> lock(registry.mutex);
    auto i = registry.caches.find(name);
    if (i == registry.caches.end())
        STRATA_THROW(unknown_cache() << cache_name_info(name));
    return *i->second;
}

bool
cache_registry::has_cache(string const& name) const
{
    auto& registry = *impl_;
    std::scoped_lock<std::mutex> lock(registry.mutex);
    return registry.caches.find(name) != registry.caches.end();
}

void
cache_registry::delete_cache(string const& name)
{
    auto& registry = *impl_;
    std::unique_ptr<detail::ttl_cache_interface> removed;
    std::unique_ptr<sweep_group> retired;
    {
        std::scoped_lock<std::mutex> lock(registry.mutex);
        auto i = registry.caches.find(name);
        if (i == registry.caches.end())
            STRATA_THROW(unknown_cache() << cache_name_info(name));
        removed = std::move(i->second);
        registry.caches.erase(i);

        for (auto g = registry.groups.begin(); g != registry.groups.end(); ++g)
        {
            auto& group = *g->second;
            std::scoped_lock<std::mutex> sweep_lock(group.sweep_mutex);
            auto c = std::ranges::find(group.caches, removed.get());
            if (c == group.caches.end())
                continue;
            group.caches.erase(c);
            if (group.caches.empty())
            {
                group.stopping = true;
                group.cv.notify_all();
                retired = std::move(g->second);
                registry.groups.erase(g);
            }
            break;
        }
    }
    if (retired && retired->thread.joinable())
        retired->thread.join();

    removed->clear();
}

std::size_t
cache_registry::timer_count() const
{
    auto& registry = *impl_;
    std::scoped_lock<std::mutex> lock(registry.mutex);
    return registry.groups.size();
}

void
cache_registry::sweep_all(cache_time now)
{
    for (auto* cache : list_caches(*impl_))
        cache->sweep(now);
}

void
cache_registry::flush()
{
    for (auto* cache : list_caches(*impl_))
        cache->clear();
}

namespace detail {

void
log_cache_callback_failure(
    string const& cache_name,
    char const* callback_name,
    string const& key,
    std::exception const& e)
{
    spdlog::get("strata")->error(
        "cache {}: {} callback failed for key {}: {}",
        cache_name,
        callback_name,
        key,
        e.what());
}

} // namespace detail

} // namespace strata
