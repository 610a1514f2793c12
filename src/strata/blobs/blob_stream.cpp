#include <strata/blobs/blob_stream.h>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace strata {

char const*
get_state_name(blob_stream_state state)
{
    switch (state)
    {
        case blob_stream_state::FRESH:
            return "fresh";
        case blob_stream_state::WRITING:
            return "writing";
        case blob_stream_state::FINALIZED:
            return "finalized";
        case blob_stream_state::READING:
            return "reading";
        case blob_stream_state::DRAINED:
            return "drained";
        case blob_stream_state::ERRORED:
            return "errored";
    }
    return "unknown";
}

blob_stream::blob_stream(
    blob_metadata_store& metadata,
    segment_store& segments,
    cppcoro::static_thread_pool& io_pool,
    timer_service& timers,
    blob_descriptor blob,
    blob_stream_mode mode,
    cache_duration throttle_period)
    : metadata_store_(metadata),
      segments_(segments),
      io_pool_(io_pool),
      blob_(std::move(blob)),
      mode_(mode),
      throttle_period_(throttle_period),
      throttle_timer_(timers)
{
    if (blob_.segment_length <= 0)
    {
        STRATA_THROW(
            blob_stream_misuse()
            << blob_name_info(blob_.name) << blob_version_info(blob_.version)
            << internal_error_message_info("segment length must be positive"));
    }
}

blob_stream::~blob_stream()
{
    throttle_timer_.cancel();
    if (state_ == blob_stream_state::WRITING)
    {
        spdlog::get("strata")->warn(
            "blob {} version {} was destroyed before being closed",
            blob_.name,
            blob_.version);
    }
}

bool
blob_stream::is_alive() const
{
    return state_ == blob_stream_state::FRESH
           || state_ == blob_stream_state::WRITING
           || state_ == blob_stream_state::READING;
}

void
blob_stream::set_rate_limit(optional<integer> bytes_per_second)
{
    if (bytes_per_second && *bytes_per_second <= 0)
    {
        STRATA_THROW(
            blob_stream_misuse() << internal_error_message_info(
                "rate limit must be positive"));
    }
    bytes_per_second_ = bytes_per_second;
    if (!bytes_per_second_)
        next_emission_ = none;
}

void
blob_stream::on_error(error_listener listener)
{
    error_listener_ = std::move(listener);
}

void
blob_stream::check_not_writing(char const* operation) const
{
    if (state_ == blob_stream_state::WRITING
        || state_ == blob_stream_state::FINALIZED)
    {
        STRATA_THROW(
            blob_stream_misuse()
            << blob_name_info(blob_.name) << blob_version_info(blob_.version)
            << internal_error_message_info(
                   string(operation) + " on a stream that's "
                   + get_state_name(state_)));
    }
}

// This must be called from within the catch block for :e.
void
blob_stream::fail(std::exception const& e)
{
    state_ = blob_stream_state::ERRORED;
    error_ = std::current_exception();
    spdlog::get("strata")->error(
        "stream for blob {} version {} failed: {}",
        blob_.name,
        blob_.version,
        e.what());
    if (error_listener_)
    {
        try
        {
            error_listener_(error_);
        }
        catch (std::exception& listener_error)
        {
            spdlog::get("strata")->error(
                "stream error listener failed: {}", listener_error.what());
        }
    }
}

// WRITING

cppcoro::task<>
blob_stream::load_writable_segment()
{
    segment_ptr existing;
    if (segment_index_ < blob_.segment_count)
        existing = co_await segments_.get_segment(blob_.blob_id, segment_index_);

    blob_segment segment;
    if (existing)
    {
        segment = *existing;
        writable_fill_ = integer(segment.buffer.size());
    }
    else
    {
        segment.blob_id = blob_.blob_id;
        segment.index = segment_index_;
        writable_fill_ = 0;
        blob_.segment_count = std::max(blob_.segment_count, segment_index_ + 1);
    }
    // Segments that were stored short are extended to full size while
    // they're being written.
    segment.buffer.resize(std::size_t(blob_.segment_length));
    writable_ = std::move(segment);
}

void
blob_stream::persist_writable_segment()
{
    writable_->buffer.resize(std::size_t(writable_fill_));
    segments_.set_segment(std::move(*writable_));
    writable_.reset();
    writable_fill_ = 0;
}

cppcoro::task<>
blob_stream::write(std::uint8_t const* data, std::size_t size)
{
    auto lock = co_await mutex_.scoped_lock_async();

    switch (state_)
    {
        case blob_stream_state::FINALIZED:
            spdlog::get("strata")->warn(
                "ignoring write to closed stream for blob {} version {}",
                blob_.name,
                blob_.version);
            co_return;
        case blob_stream_state::ERRORED:
            co_return;
        case blob_stream_state::READING:
        case blob_stream_state::DRAINED:
            STRATA_THROW(
                blob_stream_misuse()
                << blob_name_info(blob_.name)
                << blob_version_info(blob_.version)
                << internal_error_message_info(
                       string("write on a stream that's ")
                       + get_state_name(state_)));
        case blob_stream_state::FRESH:
        case blob_stream_state::WRITING:
            break;
    }
    state_ = blob_stream_state::WRITING;

    try
    {
        std::size_t consumed = 0;
        while (consumed != size)
        {
            if (!writable_)
                co_await load_writable_segment();

            auto space = std::size_t(blob_.segment_length - segment_offset_);
            auto n = std::min(space, size - consumed);
            std::copy(
                data + consumed,
                data + consumed + n,
                writable_->buffer.begin() + segment_offset_);
            consumed += n;
            segment_offset_ += integer(n);
            writable_fill_ = std::max(writable_fill_, segment_offset_);
            blob_.length = std::max(
                blob_.length,
                segment_index_ * blob_.segment_length + segment_offset_);

            if (segment_offset_ == blob_.segment_length)
            {
                persist_writable_segment();
                ++segment_index_;
                segment_offset_ = 0;
            }
        }
    }
    catch (std::exception& e)
    {
        fail(e);
        throw;
    }
}

cppcoro::task<>
blob_stream::close()
{
    // This happens before acquiring the lock so that a read that's waiting
    // on the throttle gives up (and releases the lock).
    throttle_timer_.cancel();

    auto lock = co_await mutex_.scoped_lock_async();

    switch (state_)
    {
        case blob_stream_state::FRESH:
            if (mode_ == blob_stream_mode::OPEN)
            {
                state_ = blob_stream_state::DRAINED;
                co_return;
            }
            break;
        case blob_stream_state::WRITING:
            break;
        case blob_stream_state::READING:
            state_ = blob_stream_state::DRAINED;
            co_return;
        case blob_stream_state::FINALIZED:
        case blob_stream_state::DRAINED:
        case blob_stream_state::ERRORED:
            co_return;
    }

    try
    {
        if (writable_)
            persist_writable_segment();
        co_await metadata_store_.set_blob(blob_);
    }
    catch (std::exception& e)
    {
        fail(e);
        throw;
    }
    state_ = blob_stream_state::FINALIZED;

    spdlog::get("strata")->debug(
        "finalized blob {} version {} ({} bytes in {} segments)",
        blob_.name,
        blob_.version,
        blob_.length,
        blob_.segment_count);
}

// READING

cppcoro::task<bool>
blob_stream::wait_for_throttle()
{
    if (!bytes_per_second_ || !next_emission_)
        co_return true;
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
        *next_emission_ - std::chrono::steady_clock::now());
    if (delay <= std::chrono::milliseconds::zero())
        co_return true;
    co_return co_await throttle_timer_.wait(io_pool_, delay);
}

cppcoro::task<optional<byte_vector>>
blob_stream::read()
{
    auto lock = co_await mutex_.scoped_lock_async();

    check_not_writing("read");
    if (state_ == blob_stream_state::DRAINED
        || state_ == blob_stream_state::ERRORED)
    {
        co_return none;
    }
    state_ = blob_stream_state::READING;

    try
    {
        if (!co_await wait_for_throttle())
            co_return none;

        while (segment_index_ < blob_.segment_count)
        {
            if (!readable_)
            {
                readable_ = co_await segments_.get_segment(
                    blob_.blob_id, segment_index_);
                if (!readable_)
                {
                    STRATA_THROW(
                        blob_stream_failure()
                        << blob_name_info(blob_.name)
                        << blob_version_info(blob_.version)
                        << internal_error_message_info(
                               "unexpected end of segments"));
                }
            }

            // The valid portion of the segment is limited by both its
            // buffer and the blob length.
            auto segment_end = std::min(
                integer(readable_->buffer.size()),
                blob_.length - segment_index_ * blob_.segment_length);
            auto available = segment_end - segment_offset_;
            if (available > 0)
            {
                auto n = available;
                if (bytes_per_second_)
                {
                    n = std::min(n, *bytes_per_second_);
                    next_emission_
                        = std::chrono::steady_clock::now() + throttle_period_;
                }
                auto begin = readable_->buffer.begin() + segment_offset_;
                byte_vector chunk(begin, begin + n);
                segment_offset_ += n;
                co_return chunk;
            }

            ++segment_index_;
            segment_offset_ = 0;
            readable_.reset();
        }
    }
    catch (std::exception& e)
    {
        fail(e);
        throw;
    }

    state_ = blob_stream_state::DRAINED;
    co_return none;
}

cppcoro::task<bool>
blob_stream::seek(integer offset)
{
    auto lock = co_await mutex_.scoped_lock_async();

    check_not_writing("seek");
    if (!is_alive() || offset < 0 || offset >= blob_.length)
        co_return false;

    segment_index_ = offset / blob_.segment_length;
    segment_offset_ = offset % blob_.segment_length;
    readable_.reset();
    state_ = blob_stream_state::READING;
    co_return true;
}

// HELPERS

cppcoro::task<byte_vector>
read_all(blob_stream& stream)
{
    byte_vector contents;
    while (auto chunk = co_await stream.read())
        contents.insert(contents.end(), chunk->begin(), chunk->end());
    co_return contents;
}

cppcoro::task<>
pipe(blob_stream& source, blob_stream& destination)
{
    while (auto chunk = co_await source.read())
        co_await destination.write(*chunk);
    co_await destination.close();
}

cppcoro::task<>
pipe(blob_stream& source, std::ostream& destination)
{
    while (auto chunk = co_await source.read())
    {
        destination.write(
            reinterpret_cast<char const*>(chunk->data()),
            std::streamsize(chunk->size()));
        if (!destination)
        {
            STRATA_THROW(
                blob_stream_failure()
                << blob_name_info(source.descriptor().name)
                << internal_error_message_info(
                       "failed to write to output stream"));
        }
    }
}

} // namespace strata
