#ifndef STRATA_BLOBS_BLOB_STREAM_H
#define STRATA_BLOBS_BLOB_STREAM_H

#include <exception>
#include <functional>
#include <ostream>

#include <cppcoro/async_mutex.hpp>
#include <cppcoro/static_thread_pool.hpp>
#include <cppcoro/task.hpp>

#include <strata/background/delay_timer.h>
#include <strata/blobs/metadata_store.h>
#include <strata/blobs/segment_store.h>

namespace strata {

// A blob stream reads or writes the contents of a single blob version by
// walking its segments in order.
//
// A stream is used in one direction only. Writers call write() any number of
// times and then close(), which persists the final partial segment and the
// blob's descriptor. Readers call read() until it returns an empty result
// (end of stream), optionally after a seek().
//
// Operations on a single stream are serialized: each one waits for the
// previous one (including any segment fetch it's doing) to finish, so writes
// are applied in call order and a segment is never fetched twice.
//
// If a fetch or persist fails (or the blob turns out to be inconsistent),
// the stream enters the ERRORED state. The error is thrown from the failing
// operation and passed to the on_error() listener, and the stream is no
// longer alive: later reads return nothing and later writes are ignored.

enum class blob_stream_state
{
    FRESH,
    WRITING,
    FINALIZED,
    READING,
    DRAINED,
    ERRORED
};

char const*
get_state_name(blob_stream_state state);

enum class blob_stream_mode
{
    // The stream is writing a new version.
    // Closing it always persists the descriptor, even if nothing was
    // written.
    CREATE,
    // The stream is bound to an existing version.
    OPEN
};

struct blob_stream : noncopyable
{
    typedef std::function<void(std::exception_ptr error)> error_listener;

    blob_stream(
        blob_metadata_store& metadata,
        segment_store& segments,
        cppcoro::static_thread_pool& io_pool,
        timer_service& timers,
        blob_descriptor blob,
        blob_stream_mode mode,
        cache_duration throttle_period = std::chrono::seconds(1));

    ~blob_stream();

    // the descriptor of the blob, as currently known to the stream
    blob_descriptor const&
    descriptor() const
    {
        return blob_;
    }

    // The blob's metadata can be edited up until the stream is closed.
    blob_metadata&
    metadata()
    {
        return blob_.metadata;
    }

    blob_stream_mode
    mode() const
    {
        return mode_;
    }

    blob_stream_state
    state() const
    {
        return state_;
    }

    bool
    is_alive() const;

    // Limit reads to :bytes_per_second per throttle period.
    // Passing none removes the limit.
    void
    set_rate_limit(optional<integer> bytes_per_second);

    // Append data to the blob.
    // The data must remain valid until the returned task completes.
    cppcoro::task<>
    write(std::uint8_t const* data, std::size_t size);

    cppcoro::task<>
    write(byte_vector const& data)
    {
        return write(data.data(), data.size());
    }

    cppcoro::task<>
    write(string const& data)
    {
        return write(
            reinterpret_cast<std::uint8_t const*>(data.data()), data.size());
    }

    // Finish the stream.
    // For a writer, this persists the final segment and the descriptor.
    // Any pending throttle delay is cancelled.
    cppcoro::task<>
    close();

    // Read the next chunk of the blob.
    // The result is empty at the end of the stream (or after it has been
    // closed or has failed).
    cppcoro::task<optional<byte_vector>>
    read();

    // Position the read cursor at byte :offset.
    // The result is false if :offset is outside the blob.
    cppcoro::task<bool>
    seek(integer offset);

    // Register a listener for the stream's terminal error.
    void
    on_error(error_listener listener);

    // the error that terminated the stream (if any)
    std::exception_ptr
    error() const
    {
        return error_;
    }

 private:
    cppcoro::task<>
    load_writable_segment();

    void
    persist_writable_segment();

    // Wait until the throttle allows another chunk to be emitted.
    // Returns false if the wait was cancelled.
    cppcoro::task<bool>
    wait_for_throttle();

    void
    check_not_writing(char const* operation) const;

    void
    fail(std::exception const& e);

    blob_metadata_store& metadata_store_;
    segment_store& segments_;
    cppcoro::static_thread_pool& io_pool_;

    blob_descriptor blob_;
    blob_stream_mode mode_;
    blob_stream_state state_ = blob_stream_state::FRESH;

    // serializes the stream's operations
    cppcoro::async_mutex mutex_;

    // the cursor
    integer segment_index_ = 0;
    integer segment_offset_ = 0;

    // the segment being written (if any) and the number of valid bytes in it
    optional<blob_segment> writable_;
    integer writable_fill_ = 0;

    // the segment being read (if any)
    segment_ptr readable_;

    optional<integer> bytes_per_second_;
    cache_duration throttle_period_;
    delay_timer throttle_timer_;
    optional<std::chrono::steady_clock::time_point> next_emission_;

    std::exception_ptr error_;
    error_listener error_listener_;
};

// Read the remainder of a stream into memory.
cppcoro::task<byte_vector>
read_all(blob_stream& stream);

// Copy the remainder of :source into :destination and close :destination.
cppcoro::task<>
pipe(blob_stream& source, blob_stream& destination);

// Copy the remainder of :source to an output stream.
cppcoro::task<>
pipe(blob_stream& source, std::ostream& destination);

} // namespace strata

#endif
