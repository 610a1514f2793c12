#include <strata/blobs/metadata_store.h>

#include <cppcoro/sync_wait.hpp>

#include <strata/storage/mock_store.h>
#include <strata/utilities/testing.h>

using namespace strata;

namespace {

blob_descriptor
make_blob(string const& name, integer version, integer length = 10)
{
    blob_descriptor blob;
    blob.name = name;
    blob.version = version;
    blob.blob_id = name + "-" + std::to_string(version);
    blob.length = length;
    blob.segment_length = 4;
    blob.segment_count = (length + 3) / 4;
    blob.time_created = 1'600'000'000 + version;
    return blob;
}

struct metadata_fixture
{
    cache_registry registry;
    mock_store store;
    cppcoro::static_thread_pool pool{2};
    blob_metadata_store metadata{
        registry, store, pool, blob_store_config()};

    mock_table&
    table()
    {
        return store.get_table("blob_by_name");
    }

    void
    set(blob_descriptor const& blob)
    {
        cppcoro::sync_wait(metadata.set_blob(blob));
    }

    optional<blob_descriptor>
    get(string const& name, optional<integer> version = none)
    {
        return cppcoro::sync_wait(metadata.get_blob(name, version));
    }
};

} // namespace

TEST_CASE("metadata version lookups", "[blobs][metadata]")
{
    metadata_fixture f;
    f.set(make_blob("movie", 1));
    f.set(make_blob("movie", 2, 20));
    f.set(make_blob("movie", 3, 30));

    // Without a version, the latest is returned.
    auto latest = f.get("movie");
    REQUIRE(latest);
    REQUIRE(*latest == make_blob("movie", 3, 30));

    // An older version can still be found while a newer one is cached.
    auto older = f.get("movie", 2);
    REQUIRE(older);
    REQUIRE(*older == make_blob("movie", 2, 20));

    // Both are now served from the cache.
    auto selects = f.table().select_count();
    REQUIRE(f.get("movie")->version == 3);
    REQUIRE(f.get("movie", 2)->version == 2);
    REQUIRE(f.table().select_count() == selects);

    REQUIRE(!f.get("movie", 7));
    REQUIRE(!f.get("trailer"));
    REQUIRE(!f.get("trailer", 1));
}

TEST_CASE("metadata updates reach cached lists", "[blobs][metadata]")
{
    metadata_fixture f;
    f.set(make_blob("song", 1));
    REQUIRE(f.get("song")->version == 1);

    // A new version is seen by a latest lookup served from the cache.
    f.set(make_blob("song", 2));
    auto selects = f.table().select_count();
    REQUIRE(f.get("song")->version == 2);
    REQUIRE(f.table().select_count() == selects);

    // Rewriting a version replaces it.
    auto edited = make_blob("song", 2, 99);
    edited.metadata["title"] = "encore";
    f.set(edited);
    REQUIRE(*f.get("song", 2) == edited);
}

TEST_CASE("metadata writes are idempotent", "[blobs][metadata]")
{
    metadata_fixture f;
    auto blob = make_blob("clip", 1);
    f.set(blob);
    f.set(blob);
    REQUIRE(f.get("clip"));
    f.set(blob);
    REQUIRE(f.table().row_count() == 1);

    auto all = cppcoro::sync_wait(f.metadata.get_blobs("clip"));
    REQUIRE(all == std::vector<blob_descriptor>{blob});
}

TEST_CASE("metadata listing", "[blobs][metadata]")
{
    metadata_fixture f;
    REQUIRE(cppcoro::sync_wait(f.metadata.get_blobs("album")).empty());

    f.set(make_blob("album", 2));
    f.set(make_blob("album", 1));
    f.set(make_blob("album", 3));
    f.set(make_blob("other", 1));

    // Cache just the latest version, so the listing has to merge.
    REQUIRE(f.get("album")->version == 3);

    auto all = cppcoro::sync_wait(f.metadata.get_blobs("album"));
    REQUIRE(all.size() == 3);
    for (integer i = 0; i != 3; ++i)
        REQUIRE(all[i] == make_blob("album", i + 1));

    // The merged list is now cached.
    auto selects = f.table().select_count();
    REQUIRE(f.get("album", 1)->version == 1);
    REQUIRE(f.table().select_count() == selects);
}

TEST_CASE("metadata removal", "[blobs][metadata]")
{
    metadata_fixture f;
    for (integer v = 1; v <= 3; ++v)
        f.set(make_blob("track", v));
    REQUIRE(f.get("track")->version == 3);

    auto removed = cppcoro::sync_wait(f.metadata.remove_blob("track", 3));
    REQUIRE(removed == std::vector<blob_descriptor>{make_blob("track", 3)});
    REQUIRE(!f.get("track", 3));
    REQUIRE(f.get("track")->version == 2);

    removed = cppcoro::sync_wait(f.metadata.remove_blob("track"));
    REQUIRE(removed.size() == 2);
    REQUIRE(removed[0].version == 1);
    REQUIRE(removed[1].version == 2);
    REQUIRE(!f.get("track"));
    REQUIRE(f.table().row_count() == 0);

    REQUIRE(cppcoro::sync_wait(f.metadata.remove_blob("track")).empty());
}

TEST_CASE("malformed metadata is ignored", "[blobs][metadata]")
{
    metadata_fixture f;
    auto blob = make_blob("broken", 1);
    blob.metadata["x"] = 1;
    f.set(blob);
    f.table().upsert(
        {{"metadata", string("{not json")}},
        {{"name", string("broken")}, {"version", integer(1)}});

    auto found = f.get("broken");
    REQUIRE(found);
    REQUIRE(found->length == blob.length);
    REQUIRE(found->metadata == blob_metadata::object());
}

TEST_CASE("metadata read failures propagate", "[blobs][metadata]")
{
    metadata_fixture f;
    f.set(make_blob("flaky", 1));
    f.store.fail_reads(true);
    REQUIRE_THROWS_AS(f.get("flaky"), backing_store_failure);
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(f.metadata.get_blobs("flaky")),
        backing_store_failure);
    f.store.fail_reads(false);
    REQUIRE(f.get("flaky"));

    f.store.fail_writes(true);
    REQUIRE_THROWS_AS(f.set(make_blob("flaky", 2)), backing_store_failure);
    f.store.fail_writes(false);

    // The failed version never shows up, cached or not.
    auto selects = f.table().select_count();
    REQUIRE(f.get("flaky")->version == 1);
    REQUIRE(f.table().select_count() == selects);
    REQUIRE(!f.get("flaky", 2));
    auto all = cppcoro::sync_wait(f.metadata.get_blobs("flaky"));
    REQUIRE(all == std::vector<blob_descriptor>{make_blob("flaky", 1)});
    REQUIRE(f.table().row_count() == 1);
}
