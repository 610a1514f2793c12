#include <strata/blobs/blob_store.h>

#include <chrono>

#include <boost/algorithm/string/erase.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <spdlog/spdlog.h>

#include <strata/utilities/logging.h>

namespace strata {

string
generate_blob_id()
{
    thread_local boost::uuids::random_generator generator;
    auto id = boost::uuids::to_string(generator());
    boost::algorithm::erase_all(id, "-");
    return id;
}

static integer
current_unix_time()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

blob_store::blob_store(
    cache_registry& registry,
    backing_store& store,
    cppcoro::static_thread_pool& io_pool,
    blob_store_config config)
    : io_pool_(io_pool),
      config_(std::move(config)),
      metadata_(registry, store, io_pool, config_),
      segments_(registry, store, io_pool, config_)
{
}

cppcoro::task<std::unique_ptr<blob_stream>>
blob_store::open_stream(string name, optional<integer> version)
{
    auto blob = co_await metadata_.get_blob(name, version);
    if (!blob)
        co_return nullptr;
    co_return std::make_unique<blob_stream>(
        metadata_,
        segments_,
        io_pool_,
        timers_,
        std::move(*blob),
        blob_stream_mode::OPEN,
        config_.throttle_period);
}

cppcoro::task<std::unique_ptr<blob_stream>>
blob_store::create_stream(
    string name, optional<integer> version, optional<integer> segment_length)
{
    STRATA_LOG_CALL(<< STRATA_LOG_ARG(name))

    integer length
        = segment_length ? *segment_length : config_.default_segment_length;
    if (length <= 0)
    {
        STRATA_THROW(
            blob_stream_misuse()
            << blob_name_info(name)
            << internal_error_message_info("segment length must be positive"));
    }

    integer new_version;
    if (version)
    {
        if (co_await metadata_.get_blob(name, *version))
        {
            STRATA_THROW(
                blob_version_conflict()
                << blob_name_info(name) << blob_version_info(*version));
        }
        new_version = *version;
    }
    else
    {
        auto latest = co_await metadata_.get_blob(name);
        new_version = latest ? latest->version + 1 : 1;
    }

    blob_descriptor blob;
    blob.name = std::move(name);
    blob.version = new_version;
    blob.blob_id = generate_blob_id();
    blob.segment_length = length;
    blob.time_created = current_unix_time();
    co_return std::make_unique<blob_stream>(
        metadata_,
        segments_,
        io_pool_,
        timers_,
        std::move(blob),
        blob_stream_mode::CREATE,
        config_.throttle_period);
}

cppcoro::task<optional<blob_descriptor>>
blob_store::get_blob(string name, optional<integer> version)
{
    return metadata_.get_blob(std::move(name), version);
}

cppcoro::task<std::vector<blob_descriptor>>
blob_store::get_blobs(string name)
{
    return metadata_.get_blobs(std::move(name));
}

cppcoro::task<std::vector<blob_descriptor>>
blob_store::remove_blob(string name, optional<integer> version)
{
    auto removed = co_await metadata_.remove_blob(name, version);
    for (auto const& blob : removed)
    {
        for (integer i = 0; i != blob.segment_count; ++i)
            co_await segments_.remove_segment(blob.blob_id, i);
    }
    if (!removed.empty())
    {
        spdlog::get("strata")->info(
            "removed {} version(s) of blob {}", removed.size(), name);
    }
    co_return removed;
}

} // namespace strata
