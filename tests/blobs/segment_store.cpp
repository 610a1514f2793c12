#include <strata/blobs/segment_store.h>

#include <cppcoro/sync_wait.hpp>

#include <strata/storage/mock_store.h>
#include <strata/utilities/testing.h>

using namespace strata;

namespace {

blob_segment
make_segment(string const& blob_id, integer index, byte_vector buffer)
{
    blob_segment segment;
    segment.blob_id = blob_id;
    segment.index = index;
    segment.buffer = std::move(buffer);
    return segment;
}

struct segment_fixture
{
    cache_registry registry;
    mock_store store;
    cppcoro::static_thread_pool pool{2};
    segment_store segments{registry, store, pool, blob_store_config()};

    mock_table&
    table()
    {
        return store.get_table("blob_segments");
    }

    ttl_cache<segment_ptr>&
    cache()
    {
        return registry.get_cache<segment_ptr>(segments.cache_name());
    }

    segment_ptr
    get(string const& blob_id, integer index)
    {
        return cppcoro::sync_wait(segments.get_segment(blob_id, index));
    }
};

cache_time
far_future()
{
    return cache_clock::now() + std::chrono::hours(1);
}

} // namespace

TEST_CASE("missing segments", "[blobs][segments]")
{
    segment_fixture f;
    REQUIRE(!f.get("abc", 0));
    REQUIRE(f.cache().size() == 0);
}

TEST_CASE("segments are written back when flushed", "[blobs][segments]")
{
    segment_fixture f;
    f.segments.set_segment(make_segment("abc", 0, {1, 2, 3}));

    // The segment is served from the cache before it reaches the table.
    auto cached = f.get("abc", 0);
    REQUIRE(cached);
    REQUIRE(cached->dirty);
    REQUIRE(cached->buffer == byte_vector{1, 2, 3});
    REQUIRE(f.table().upsert_count() == 0);
    REQUIRE(f.table().select_count() == 0);

    f.registry.flush();
    REQUIRE(f.table().upsert_count() == 1);
    REQUIRE(f.table().row_count() == 1);

    auto stored = f.get("abc", 0);
    REQUIRE(stored);
    REQUIRE(!stored->dirty);
    REQUIRE(stored->buffer == byte_vector{1, 2, 3});
}

TEST_CASE("segments are written back when they expire", "[blobs][segments]")
{
    segment_fixture f;
    f.segments.set_segment(make_segment("abc", 0, {1}));
    f.segments.set_segment(make_segment("abc", 1, {2}));

    f.registry.sweep_all(cache_clock::now());
    REQUIRE(f.table().row_count() == 0);

    f.registry.sweep_all(far_future());
    REQUIRE(f.table().row_count() == 2);
    REQUIRE(f.cache().size() == 0);
}

TEST_CASE("clean segments aren't written back", "[blobs][segments]")
{
    segment_fixture f;
    f.table().upsert(
        {{"data", byte_vector{7, 8}}},
        {{"blob_id", string("abc")}, {"segment_index", integer(0)}});

    auto segment = f.get("abc", 0);
    REQUIRE(segment);
    REQUIRE(segment->buffer == byte_vector{7, 8});
    REQUIRE(f.cache().size() == 1);

    f.registry.sweep_all(far_future());
    f.registry.flush();
    REQUIRE(f.table().upsert_count() == 1);
}

TEST_CASE("failed write-backs are retried", "[blobs][segments]")
{
    segment_fixture f;
    f.registry.start();

    f.store.fail_writes(true);
    f.segments.set_segment(make_segment("abc", 0, {1, 2}));
    f.registry.sweep_all(far_future());
    REQUIRE(f.table().upsert_count() == 1);
    REQUIRE(f.table().row_count() == 0);
    // The segment is still available.
    REQUIRE(f.cache().size() == 1);
    REQUIRE(f.get("abc", 0)->buffer == byte_vector{1, 2});

    f.store.fail_writes(false);
    f.registry.sweep_all(far_future());
    REQUIRE(f.table().row_count() == 1);
    REQUIRE(f.cache().size() == 0);

    f.registry.stop();
}

TEST_CASE("write-back failures during shutdown", "[blobs][segments]")
{
    segment_fixture f;
    REQUIRE(!f.registry.is_running());

    f.store.fail_writes(true);
    f.segments.set_segment(make_segment("abc", 0, {1, 2}));
    f.registry.flush();
    // The segment is lost, but nothing is thrown.
    REQUIRE(f.cache().size() == 0);
    REQUIRE(f.table().row_count() == 0);
}

TEST_CASE("segment removal", "[blobs][segments]")
{
    segment_fixture f;
    f.segments.set_segment(make_segment("abc", 0, {1}));
    f.registry.flush();
    f.segments.set_segment(make_segment("abc", 1, {2}));
    REQUIRE(f.table().row_count() == 1);

    cppcoro::sync_wait(f.segments.remove_segment("abc", 0));
    cppcoro::sync_wait(f.segments.remove_segment("abc", 1));
    REQUIRE(f.table().row_count() == 0);
    REQUIRE(f.cache().size() == 0);

    // The buffered segment was discarded rather than written back.
    f.registry.flush();
    REQUIRE(f.table().row_count() == 0);
    REQUIRE(!f.get("abc", 0));
    REQUIRE(!f.get("abc", 1));
}

TEST_CASE(
    "retried write-backs replace clean copies", "[blobs][segments]")
{
    segment_fixture f;
    f.table().upsert(
        {{"data", byte_vector{1}}},
        {{"blob_id", string("abc")}, {"segment_index", integer(0)}});
    f.registry.start();

    f.segments.set_segment(make_segment("abc", 0, {2}));

    // While the dirty segment is out of the cache for its write-back, a
    // reader caches the stale stored copy. Then the write fails.
    bool read_during_write = false;
    f.store.on_write([&](string const&) {
        if (read_during_write)
            return;
        read_during_write = true;
        auto stale = cppcoro::sync_wait(f.segments.get_segment("abc", 0));
        REQUIRE(stale);
        REQUIRE(stale->buffer == byte_vector{1});
        REQUIRE(!stale->dirty);
    });
    f.store.fail_writes(true);
    f.registry.sweep_all(far_future());
    REQUIRE(read_during_write);

    // The dirty contents are what's cached now.
    auto cached = f.get("abc", 0);
    REQUIRE(cached->buffer == byte_vector{2});
    REQUIRE(cached->dirty);

    f.store.fail_writes(false);
    f.registry.sweep_all(far_future());
    auto row = f.table().select_one(
        {"data"}, {{"blob_id", string("abc")}, {"segment_index", integer(0)}});
    REQUIRE(row);
    REQUIRE(get_blob_cell(*row, "data") == byte_vector{2});

    f.registry.stop();
}

TEST_CASE("retried write-backs keep newer writes", "[blobs][segments]")
{
    segment_fixture f;
    f.registry.start();
    f.segments.set_segment(make_segment("abc", 0, {1}));

    // A newer write lands while the older one is being written back.
    bool written_during_write = false;
    f.store.on_write([&](string const&) {
        if (written_during_write)
            return;
        written_during_write = true;
        f.segments.set_segment(make_segment("abc", 0, {9}));
    });
    f.store.fail_writes(true);
    f.registry.sweep_all(far_future());
    REQUIRE(written_during_write);
    REQUIRE(f.get("abc", 0)->buffer == byte_vector{9});

    f.store.fail_writes(false);
    f.registry.flush();
    auto row = f.table().select_one(
        {"data"}, {{"blob_id", string("abc")}, {"segment_index", integer(0)}});
    REQUIRE(row);
    REQUIRE(get_blob_cell(*row, "data") == byte_vector{9});

    f.registry.stop();
}

TEST_CASE(
    "write-back failures while a segment store is destroyed",
    "[blobs][segments]")
{
    cache_registry registry;
    mock_store store;
    cppcoro::static_thread_pool pool{1};
    registry.start();

    string cache_name;
    {
        segment_store segments(registry, store, pool, blob_store_config());
        cache_name = segments.cache_name();
        segments.set_segment(make_segment("abc", 0, {1}));
        store.fail_writes(true);
    }
    // The failed write was attempted once and not put back anywhere.
    REQUIRE(!registry.has_cache(cache_name));
    REQUIRE(store.get_table("blob_segments").upsert_count() == 1);
    REQUIRE(store.get_table("blob_segments").row_count() == 0);

    // The registry carries on normally.
    store.fail_writes(false);
    segment_store segments(registry, store, pool, blob_store_config());
    segments.set_segment(make_segment("abc", 0, {2}));
    registry.flush();
    REQUIRE(store.get_table("blob_segments").row_count() == 1);
    registry.stop();
}
