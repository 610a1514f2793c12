#include <strata/blobs/metadata_store.h>

#include <algorithm>

#include <spdlog/spdlog.h>

#include <strata/utilities/logging.h>
#include <strata/utilities/text.h>

namespace strata {

table_schema
blob_metadata_table_schema(string const& table_prefix)
{
    return table_schema{
        .name = table_prefix + "blob_by_name",
        .columns = {
            {"name", column_type::ASCII, column_role::PARTITION_KEY},
            {"version", column_type::INT, column_role::CLUSTER_KEY},
            {"blob_id", column_type::ASCII},
            {"length", column_type::BIGINT},
            {"segment_count", column_type::INT},
            {"segment_length", column_type::INT},
            {"time_created", column_type::BIGINT},
            {"metadata", column_type::TEXT}}};
}

static blob_descriptor
descriptor_from_row(table_row const& row)
{
    blob_descriptor blob;
    blob.name = get_string_cell(row, "name");
    blob.version = get_integer_cell(row, "version");
    blob.blob_id = get_string_cell(row, "blob_id");
    blob.length = get_integer_cell(row, "length");
    blob.segment_count = get_integer_cell(row, "segment_count");
    blob.segment_length = get_integer_cell(row, "segment_length");
    blob.time_created = get_integer_cell(row, "time_created");
    if (row.find("metadata") != row.end())
    {
        try
        {
            blob.metadata
                = parse_json_document(get_string_cell(row, "metadata"));
        }
        catch (parsing_error& e)
        {
            spdlog::get("strata")->warn(
                "ignoring malformed metadata for blob {} version {}: {}",
                blob.name,
                blob.version,
                e.what());
            blob.metadata = blob_metadata::object();
        }
    }
    return blob;
}

// Insert :blob into the version-sorted list :blobs, replacing any entry with
// the same version.
static void
upsert_version(std::vector<blob_descriptor>& blobs, blob_descriptor const& blob)
{
    auto i = std::ranges::lower_bound(
        blobs, blob.version, {}, &blob_descriptor::version);
    if (i != blobs.end() && i->version == blob.version)
        *i = blob;
    else
        blobs.insert(i, blob);
}

static optional<blob_descriptor>
find_version(
    std::vector<blob_descriptor> const& blobs, optional<integer> version)
{
    if (blobs.empty())
        return none;
    if (!version)
        return blobs.back();
    auto i = std::ranges::find(blobs, *version, &blob_descriptor::version);
    if (i == blobs.end())
        return none;
    return *i;
}

blob_metadata_store::blob_metadata_store(
    cache_registry& registry,
    backing_store& store,
    cppcoro::static_thread_pool& io_pool,
    blob_store_config const& config)
    : registry_(registry),
      cache_(registry.create_cache<std::vector<blob_descriptor>>(
        config.table_prefix + "blob_by_name",
        config.metadata_cache_ttl,
        config.sweep_interval)),
      table_(store.provision_table(
          blob_metadata_table_schema(config.table_prefix))),
      io_pool_(io_pool),
      ttl_(config.metadata_cache_ttl)
{
}

blob_metadata_store::~blob_metadata_store()
{
    registry_.delete_cache(cache_.name());
}

void
blob_metadata_store::merge_into_cache(
    blob_descriptor const& blob, bool only_if_cached)
{
    auto merge = [&](std::vector<blob_descriptor>& blobs) {
        upsert_version(blobs, blob);
    };
    if (cache_.modify(blob.name, merge) || only_if_cached)
        return;
    // If another list was cached in the meantime, set_or_get() keeps it, so
    // merge into whatever ended up there.
    cache_.set_or_get(blob.name, {blob}, ttl_);
    cache_.modify(blob.name, merge);
}

cppcoro::task<optional<blob_descriptor>>
blob_metadata_store::get_blob(string name, optional<integer> version)
{
    auto cached = cache_.get(name, ttl_);
    if (cached)
    {
        auto blob = find_version(*cached, version);
        if (blob)
            co_return blob;
        // A cached list always includes the latest version, but it may not
        // include older ones.
        if (!version)
            co_return none;
    }

    co_await io_pool_.schedule();
    std::vector<where_clause> where{{"name", name}};
    if (version)
        where.push_back({"version", *version});
    auto rows = table_.select({}, where);
    if (rows.empty())
        co_return none;

    auto blob = descriptor_from_row(rows.back());
    // Only a lookup of the latest version can establish a new cached list,
    // since an exact version might not be the latest.
    merge_into_cache(blob, version.has_value());
    co_return blob;
}

cppcoro::task<std::vector<blob_descriptor>>
blob_metadata_store::get_blobs(string name)
{
    co_await io_pool_.schedule();
    std::vector<blob_descriptor> stored;
    for (auto const& row : table_.select({}, {{"name", name}}))
        upsert_version(stored, descriptor_from_row(row));

    std::vector<blob_descriptor> blobs;
    bool cached = cache_.modify(name, [&](std::vector<blob_descriptor>& list) {
        // Cached descriptors take precedence over stored ones.
        for (auto const& blob : stored)
        {
            if (!find_version(list, blob.version))
                upsert_version(list, blob);
        }
        blobs = list;
    });
    if (!cached)
    {
        blobs = std::move(stored);
        if (!blobs.empty())
            cache_.set_or_get(name, blobs, ttl_);
    }
    co_return blobs;
}

cppcoro::task<>
blob_metadata_store::set_blob(blob_descriptor blob)
{
    STRATA_LOG_CALL(
        << STRATA_LOG_ARG(blob.name) << STRATA_LOG_ARG(blob.version)
        << STRATA_LOG_ARG(blob.length))

    co_await io_pool_.schedule();
    table_.upsert(
        {{"blob_id", blob.blob_id},
         {"length", blob.length},
         {"segment_count", blob.segment_count},
         {"segment_length", blob.segment_length},
         {"time_created", blob.time_created},
         {"metadata", write_json_document(blob.metadata)}},
        {{"name", blob.name}, {"version", blob.version}});

    // The cached list only ever reflects rows that made it into the table.
    cache_.modify(blob.name, [&](std::vector<blob_descriptor>& blobs) {
        upsert_version(blobs, blob);
    });
}

cppcoro::task<std::vector<blob_descriptor>>
blob_metadata_store::remove_blob(string name, optional<integer> version)
{
    STRATA_LOG_CALL(<< STRATA_LOG_ARG(name))

    cache_.remove(name);

    co_await io_pool_.schedule();
    std::vector<where_clause> where{{"name", name}};
    if (version)
        where.push_back({"version", *version});
    std::vector<blob_descriptor> removed;
    for (auto const& row : table_.select({}, where))
    {
        auto blob = descriptor_from_row(row);
        table_.remove({{"name", name}, {"version", blob.version}});
        removed.push_back(std::move(blob));
    }

    // A concurrent lookup may have repopulated the cache from rows that are
    // now gone.
    cache_.remove(name);

    co_return removed;
}

} // namespace strata
