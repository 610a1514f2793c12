#include <strata/blobs/segment_store.h>

#include <spdlog/spdlog.h>

#include <strata/utilities/text.h>

namespace strata {

table_schema
blob_segment_table_schema(string const& table_prefix)
{
    return table_schema{
        .name = table_prefix + "blob_segments",
        .columns = {
            {"blob_id", column_type::ASCII, column_role::PARTITION_KEY},
            {"segment_index", column_type::INT, column_role::PARTITION_KEY},
            {"data", column_type::BLOB}}};
}

string
segment_cache_key(string const& blob_id, integer index)
{
    return blob_id + "|" + lexical_cast<string>(index);
}

namespace detail {

void
segment_writer::persist(blob_segment const& segment)
{
    table_.upsert(
        {{"data", segment.buffer}},
        {{"blob_id", segment.blob_id}, {"segment_index", segment.index}});
}

void
segment_writer::erase(string const& blob_id, integer index)
{
    table_.remove({{"blob_id", blob_id}, {"segment_index", index}});
}

} // namespace detail

segment_store::segment_store(
    cache_registry& registry,
    backing_store& store,
    cppcoro::static_thread_pool& io_pool,
    blob_store_config const& config)
    : segment_store(
        registry,
        store.provision_table(blob_segment_table_schema(config.table_prefix)),
        io_pool,
        config)
{
}

segment_store::segment_store(
    cache_registry& registry,
    backing_table& table,
    cppcoro::static_thread_pool& io_pool,
    blob_store_config const& config)
    : registry_(registry),
      reader_(table),
      writer_(table),
      io_pool_(io_pool),
      ttl_(config.segment_cache_ttl),
      cache_(registry.create_cache<segment_ptr>(
          config.table_prefix + "blob_segments",
          config.segment_cache_ttl,
          config.sweep_interval,
          nullptr,
          [this](
              string const& key, segment_ptr const& segment, cache_time) {
              write_back(key, segment);
          }))
{
}

segment_store::~segment_store()
{
    closing_ = true;
    registry_.delete_cache(cache_.name());
}

void
segment_store::rearm(string const& key, segment_ptr const& segment)
{
    // A reader may have cached a clean copy from the table while this
    // segment was out of the cache. The dirty contents must win over that,
    // but not over a newer dirty write.
    auto replace_if_clean = [&](segment_ptr& cached) {
        if (!cached || !cached->dirty)
            cached = segment;
    };
    while (!cache_.modify(key, replace_if_clean))
    {
        if (cache_.set_or_get(key, segment, ttl_) == segment)
            break;
    }
}

void
segment_store::write_back(string const& key, segment_ptr const& segment)
{
    if (!segment || !segment->dirty)
        return;
    try
    {
        writer_.persist(*segment);
    }
    catch (std::exception& e)
    {
        if (registry_.is_running() && !closing_)
        {
            spdlog::get("strata")->error(
                "failed to write back segment {} (will retry): {}",
                key,
                e.what());
            rearm(key, segment);
        }
        else
        {
            spdlog::get("strata")->error(
                "failed to write back segment {} during shutdown: {}",
                key,
                e.what());
        }
    }
}

cppcoro::task<segment_ptr>
segment_store::get_segment(string blob_id, integer index)
{
    auto key = segment_cache_key(blob_id, index);
    auto cached = cache_.get(key);
    if (cached)
        co_return *cached;

    co_await io_pool_.schedule();
    auto row = reader_.select_one(
        {"data"}, {{"blob_id", blob_id}, {"segment_index", index}});
    if (!row)
        co_return nullptr;

    auto segment = std::make_shared<blob_segment>();
    segment->blob_id = std::move(blob_id);
    segment->index = index;
    segment->buffer = get_blob_cell(*row, "data");
    segment->dirty = false;
    // If the segment was cached while we were reading it, the cached copy
    // wins.
    co_return cache_.set_or_get(key, std::move(segment), ttl_);
}

void
segment_store::set_segment(blob_segment segment)
{
    segment.dirty = true;
    auto key = segment_cache_key(segment.blob_id, segment.index);
    cache_.set(
        key, std::make_shared<blob_segment>(std::move(segment)), ttl_);
}

cppcoro::task<>
segment_store::remove_segment(string blob_id, integer index)
{
    // Discard any buffered contents so that they aren't written back later.
    cache_.remove(segment_cache_key(blob_id, index));

    co_await io_pool_.schedule();
    writer_.erase(blob_id, index);
}

} // namespace strata
