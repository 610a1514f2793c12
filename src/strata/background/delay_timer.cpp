#include <strata/background/delay_timer.h>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace strata {

delay_timer::delay_timer(timer_service& service)
    : timer_(service.io_service())
{
}

delay_timer::~delay_timer()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cancellations_done_.wait(
        lock, [&] { return pending_cancellations_ == 0; });
}

void
delay_timer::timer_awaiter::await_suspend(std::coroutine_handle<> waiter)
{
    // Arming happens on the event thread, so it's ordered with respect to any
    // cancellation that's posted there afterwards.
    boost::asio::post(timer.timer_.get_executor(), [this, waiter] {
        if (timer.is_cancelled())
        {
            error = boost::asio::error::operation_aborted;
            waiter.resume();
            return;
        }
        timer.timer_.expires_after(duration);
        timer.timer_.async_wait(
            [this, waiter](boost::system::error_code const& ec) {
                error = ec;
                waiter.resume();
            });
    });
}

cppcoro::task<bool>
delay_timer::wait(
    cppcoro::static_thread_pool& pool, std::chrono::milliseconds duration)
{
    bool elapsed = co_await timer_awaiter{*this, duration, {}};
    co_await pool.schedule();
    co_return elapsed;
}

void
delay_timer::cancel()
{
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        cancelled_ = true;
        ++pending_cancellations_;
    }
    boost::asio::post(timer_.get_executor(), [this] {
        timer_.cancel();
        std::scoped_lock<std::mutex> lock(mutex_);
        --pending_cancellations_;
        cancellations_done_.notify_all();
    });
}

void
delay_timer::reset()
{
    std::scoped_lock<std::mutex> lock(mutex_);
    cancelled_ = false;
}

bool
delay_timer::is_cancelled() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return cancelled_;
}

} // namespace strata
