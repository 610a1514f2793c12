#ifndef STRATA_CACHING_TTL_CACHE_H
#define STRATA_CACHING_TTL_CACHE_H

// This file provides the TTL cache: a named collection of string-keyed
// values, each of which carries an expiry timestamp.
//
// A cache may be bound to two callbacks:
//
// - :on_added is invoked whenever a value is inserted (or replaced via set).
//
// - :on_expired is invoked whenever a value leaves the cache through expiry
//   (a sweep) or through clear(). It is NOT invoked by remove(), which is an
//   explicit discard. Caches that front a durable store use :on_expired as
//   their write-back path, so it's the only route by which buffered values
//   reach storage.
//
// Callbacks are always invoked without the cache lock held, so they may call
// back into the cache (e.g., to re-insert a value whose write-back failed).
//
// Every operation is protected by a per-cache mutex, so set_or_get() keeps
// its "first writer wins" semantics when called from multiple threads.
//
// Caches are normally created through a cache_registry, which sweeps them
// periodically and isolates the sweep loop from callback failures.

#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <strata/core.h>

namespace strata {

typedef std::chrono::steady_clock cache_clock;
typedef cache_clock::time_point cache_time;
typedef std::chrono::milliseconds cache_duration;

namespace detail {

// the type-independent portion of a cache, as seen by the registry
struct ttl_cache_interface : noncopyable
{
    virtual ~ttl_cache_interface() = default;

    virtual string const&
    name() const = 0;

    // Evict every entry whose expiry time is at or before :now.
    virtual void
    sweep(cache_time now)
        = 0;

    // Evict every entry.
    virtual void
    clear() = 0;

    virtual std::size_t
    size() const = 0;
};

} // namespace detail

template<class Value>
struct ttl_cache : detail::ttl_cache_interface
{
    typedef std::function<void(
        string const& key, Value const& value, cache_time expires_at)>
        callback;

    ttl_cache(
        string name,
        cache_duration default_ttl,
        callback on_added = nullptr,
        callback on_expired = nullptr)
        : name_(std::move(name)),
          default_ttl_(default_ttl),
          on_added_(std::move(on_added)),
          on_expired_(std::move(on_expired))
    {
    }

    string const&
    name() const override
    {
        return name_;
    }

    cache_duration
    default_ttl() const
    {
        return default_ttl_;
    }

    // Look up the value associated with :key.
    // If :ttl is supplied and the key is present, its expiry is pushed out to
    // :ttl from now.
    optional<Value>
    get(string const& key, optional<cache_duration> ttl = none)
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        auto i = entries_.find(key);
        if (i == entries_.end())
            return none;
        if (ttl)
            i->second.expires_at = cache_clock::now() + *ttl;
        return i->second.value;
    }

    // Get the current expiry time of :key (if it's present).
    optional<cache_time>
    expiry(string const& key) const
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        auto i = entries_.find(key);
        if (i == entries_.end())
            return none;
        return i->second.expires_at;
    }

    // If :key is already present, return its value (ignoring :value).
    // Otherwise, insert :value and return it.
    Value
    set_or_get(string const& key, Value value, optional<cache_duration> ttl = none)
    {
        cache_time expires_at;
        {
            std::scoped_lock<std::mutex> lock(mutex_);
            auto i = entries_.find(key);
            if (i != entries_.end())
            {
                if (ttl)
                    i->second.expires_at = cache_clock::now() + *ttl;
                return i->second.value;
            }
            expires_at = cache_clock::now() + (ttl ? *ttl : default_ttl_);
            entries_.emplace(key, entry{value, expires_at});
        }
        if (on_added_)
            on_added_(key, value, expires_at);
        return value;
    }

    // Insert :value under :key, replacing any existing value.
    // The expiry is always reset, to :ttl (if supplied) or the default TTL.
    void
    set(string const& key, Value value, optional<cache_duration> ttl = none)
    {
        cache_time expires_at = cache_clock::now() + (ttl ? *ttl : default_ttl_);
        {
            std::scoped_lock<std::mutex> lock(mutex_);
            entries_.insert_or_assign(key, entry{value, expires_at});
        }
        if (on_added_)
            on_added_(key, value, expires_at);
    }

    // Apply :function to the value stored under :key (if any), under the
    // cache lock. The expiry is left untouched and no callbacks are invoked.
    // Returns whether or not the key was present.
    template<class Function>
    bool
    modify(string const& key, Function&& function)
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        auto i = entries_.find(key);
        if (i == entries_.end())
            return false;
        std::forward<Function>(function)(i->second.value);
        return true;
    }

    // Discard the value stored under :key.
    // Returns whether or not a value was removed.
    bool
    remove(string const& key)
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        return entries_.erase(key) != 0;
    }

    void
    clear() override
    {
        entry_map evicted;
        {
            std::scoped_lock<std::mutex> lock(mutex_);
            evicted.swap(entries_);
        }
        notify_expired(evicted);
    }

    void
    sweep(cache_time now) override
    {
        entry_map evicted;
        {
            std::scoped_lock<std::mutex> lock(mutex_);
            for (auto i = entries_.begin(); i != entries_.end();)
            {
                if (i->second.expires_at <= now)
                {
                    evicted.insert(entries_.extract(i++));
                }
                else
                {
                    ++i;
                }
            }
        }
        notify_expired(evicted);
    }

    // Get a snapshot of all key/value pairs currently in the cache.
    std::vector<std::pair<string, Value>>
    get_all() const
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        std::vector<std::pair<string, Value>> values;
        values.reserve(entries_.size());
        for (auto const& [key, e] : entries_)
            values.emplace_back(key, e.value);
        return values;
    }

    std::size_t
    size() const override
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        return entries_.size();
    }

 private:
    struct entry
    {
        Value value;
        cache_time expires_at;
    };

    typedef std::unordered_map<string, entry> entry_map;

    void
    notify_expired(entry_map const& evicted)
    {
        if (!on_expired_)
            return;
        for (auto const& [key, e] : evicted)
            on_expired_(key, e.value, e.expires_at);
    }

    string name_;
    cache_duration default_ttl_;
    callback on_added_;
    callback on_expired_;

    entry_map entries_;

    // protects :entries_
    mutable std::mutex mutex_;
};

} // namespace strata

#endif
