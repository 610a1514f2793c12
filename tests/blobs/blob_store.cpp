#include <strata/blobs/blob_store.h>

#include <cppcoro/sync_wait.hpp>

#include <strata/storage/mock_store.h>
#include <strata/utilities/testing.h>

using namespace strata;

namespace {

struct store_fixture
{
    cache_registry registry;
    mock_store store;
    cppcoro::static_thread_pool pool{2};
    blob_store blobs{registry, store, pool, make_config()};

    static blob_store_config
    make_config()
    {
        blob_store_config config;
        config.table_prefix = "test_";
        config.default_segment_length = 8;
        return config;
    }

    blob_descriptor
    put(string const& name,
        byte_vector const& contents,
        optional<integer> version = none)
    {
        auto stream
            = cppcoro::sync_wait(blobs.create_stream(name, version));
        cppcoro::sync_wait(stream->write(contents));
        cppcoro::sync_wait(stream->close());
        return stream->descriptor();
    }
};

} // namespace

TEST_CASE("blob IDs", "[blobs][store]")
{
    auto a = generate_blob_id();
    auto b = generate_blob_id();
    REQUIRE(a.size() == 32);
    REQUIRE(a.find('-') == string::npos);
    REQUIRE(a != b);
}

TEST_CASE("blob versioning", "[blobs][store]")
{
    store_fixture f;
    REQUIRE(f.blobs.config().table_prefix == "test_");

    auto v1 = f.put("doc", make_byte_sequence(3));
    REQUIRE(v1.version == 1);
    REQUIRE(v1.time_created > 0);
    auto v2 = f.put("doc", make_byte_sequence(4));
    REQUIRE(v2.version == 2);
    REQUIRE(v2.blob_id != v1.blob_id);

    REQUIRE(f.put("doc", make_byte_sequence(5), 5).version == 5);
    REQUIRE(f.put("doc", make_byte_sequence(6)).version == 6);
    // Gaps can be filled explicitly.
    REQUIRE(f.put("doc", make_byte_sequence(1), 3).version == 3);

    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(f.blobs.create_stream("doc", 2)),
        blob_version_conflict);

    auto all = cppcoro::sync_wait(f.blobs.get_blobs("doc"));
    REQUIRE(all.size() == 5);
    REQUIRE(all.front() == v1);
    REQUIRE(all.back().version == 6);

    auto found = cppcoro::sync_wait(f.blobs.get_blob("doc", 2));
    REQUIRE(found);
    REQUIRE(*found == v2);
}

TEST_CASE("opening missing blobs", "[blobs][store]")
{
    store_fixture f;
    REQUIRE(!cppcoro::sync_wait(f.blobs.open_stream("nothing")));
    f.put("something", make_byte_sequence(3));
    REQUIRE(!cppcoro::sync_wait(f.blobs.open_stream("something", 2)));

    auto stream
        = cppcoro::sync_wait(f.blobs.open_stream("something", 1));
    REQUIRE(stream);
    REQUIRE(stream->mode() == blob_stream_mode::OPEN);
    REQUIRE(stream->state() == blob_stream_state::FRESH);
    REQUIRE(stream->is_alive());
}

TEST_CASE("empty blobs", "[blobs][store]")
{
    store_fixture f;
    auto stream = cppcoro::sync_wait(f.blobs.create_stream("empty"));
    REQUIRE(stream->mode() == blob_stream_mode::CREATE);
    cppcoro::sync_wait(stream->close());

    auto blob = cppcoro::sync_wait(f.blobs.get_blob("empty"));
    REQUIRE(blob);
    REQUIRE(blob->length == 0);
    REQUIRE(blob->segment_count == 0);
    REQUIRE(blob->segment_length == 8);

    auto reader = cppcoro::sync_wait(f.blobs.open_stream("empty"));
    REQUIRE(cppcoro::sync_wait(read_all(*reader)).empty());
}

TEST_CASE("blob removal", "[blobs][store]")
{
    store_fixture f;
    f.put("doc", make_byte_sequence(20));
    f.put("doc", make_byte_sequence(10));
    f.put("other", make_byte_sequence(1));
    f.registry.flush();

    auto& segments = f.store.get_table("test_blob_segments");
    auto& metadata = f.store.get_table("test_blob_by_name");
    REQUIRE(segments.row_count() == 6);
    REQUIRE(metadata.row_count() == 3);

    auto removed = cppcoro::sync_wait(f.blobs.remove_blob("doc", 1));
    REQUIRE(removed.size() == 1);
    REQUIRE(removed[0].version == 1);
    REQUIRE(segments.row_count() == 3);
    REQUIRE(!cppcoro::sync_wait(f.blobs.get_blob("doc", 1)));
    REQUIRE(cppcoro::sync_wait(f.blobs.get_blob("doc"))->version == 2);

    removed = cppcoro::sync_wait(f.blobs.remove_blob("doc"));
    REQUIRE(removed.size() == 1);
    REQUIRE(segments.row_count() == 1);
    REQUIRE(metadata.row_count() == 1);
    REQUIRE(cppcoro::sync_wait(f.blobs.get_blobs("doc")).empty());

    REQUIRE(cppcoro::sync_wait(f.blobs.remove_blob("doc")).empty());

    // The name can be reused.
    REQUIRE(f.put("doc", make_byte_sequence(2)).version == 1);
}

TEST_CASE("removing blobs that are still buffered", "[blobs][store]")
{
    store_fixture f;
    f.put("doc", make_byte_sequence(20));
    cppcoro::sync_wait(f.blobs.remove_blob("doc"));

    // Nothing is resurrected when the caches are flushed.
    f.registry.flush();
    REQUIRE(f.store.get_table("test_blob_segments").row_count() == 0);
    REQUIRE(f.store.get_table("test_blob_by_name").row_count() == 0);
}
