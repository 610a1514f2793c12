#ifndef STRATA_BACKGROUND_DELAY_TIMER_H
#define STRATA_BACKGROUND_DELAY_TIMER_H

#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <mutex>

#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <cppcoro/static_thread_pool.hpp>
#include <cppcoro/task.hpp>

#include <strata/background/timer_service.h>

namespace strata {

// A delay_timer lets a coroutine sleep for a while, with the option of being
// woken early by cancel().
//
// The wait itself happens on a timer_service's event thread, so no worker
// thread is held while sleeping. When the wait is over, the coroutine
// resumes on the supplied thread pool.
//
// Once cancelled, a timer stays cancelled (and every wait() completes
// immediately) until reset() is called. Only one wait() may be pending at a
// time, and the timer must not be destroyed while one is.
struct delay_timer : noncopyable
{
    explicit delay_timer(timer_service& service);

    // Waits for any cancellation that's still in flight on the event thread.
    ~delay_timer();

    // Wait for :duration and then resume on one of :pool's threads.
    // The result is true if the full duration elapsed and false if the timer
    // was cancelled.
    cppcoro::task<bool>
    wait(
        cppcoro::static_thread_pool& pool,
        std::chrono::milliseconds duration);

    void
    cancel();

    void
    reset();

    bool
    is_cancelled() const;

 private:
    struct timer_awaiter
    {
        delay_timer& timer;
        std::chrono::milliseconds duration;
        boost::system::error_code error;

        bool
        await_ready() const noexcept
        {
            return false;
        }

        void
        await_suspend(std::coroutine_handle<> waiter);

        bool
        await_resume() const noexcept
        {
            return !error;
        }
    };

    // Only ever touched on the timer service's thread.
    boost::asio::steady_timer timer_;

    bool cancelled_ = false;
    // the number of cancellations posted to the event thread but not yet run
    int pending_cancellations_ = 0;
    // protects the above
    mutable std::mutex mutex_;
    std::condition_variable cancellations_done_;
};

} // namespace strata

#endif
