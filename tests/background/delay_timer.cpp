#include <strata/background/delay_timer.h>

#include <atomic>
#include <thread>

#include <cppcoro/sync_wait.hpp>

#include <strata/utilities/concurrency_testing.h>
#include <strata/utilities/testing.h>

using namespace strata;

using std::chrono::milliseconds;
using std::chrono::steady_clock;

TEST_CASE("delay timer elapses", "[background][delay_timer]")
{
    cppcoro::static_thread_pool pool(1);
    timer_service service;
    delay_timer timer(service);
    REQUIRE(!timer.is_cancelled());

    auto start = steady_clock::now();
    REQUIRE(cppcoro::sync_wait(timer.wait(pool, milliseconds(20))));
    REQUIRE(steady_clock::now() - start >= milliseconds(20));
}

TEST_CASE("delay timer cancellation", "[background][delay_timer]")
{
    cppcoro::static_thread_pool pool(2);
    timer_service service;
    delay_timer timer(service);

    std::atomic<bool> done = false;
    std::atomic<bool> elapsed = true;
    std::thread waiter([&] {
        elapsed = cppcoro::sync_wait(timer.wait(pool, milliseconds(60000)));
        done = true;
    });

    timer.cancel();
    REQUIRE(occurs_soon([&] { return done.load(); }));
    waiter.join();
    REQUIRE(!elapsed);
    REQUIRE(timer.is_cancelled());

    // A cancelled timer completes every wait immediately.
    REQUIRE(!cppcoro::sync_wait(timer.wait(pool, milliseconds(60000))));

    timer.reset();
    REQUIRE(!timer.is_cancelled());
    REQUIRE(cppcoro::sync_wait(timer.wait(pool, milliseconds(1))));
}

TEST_CASE("delay timers don't occupy pool threads", "[background][delay_timer]")
{
    // With a single pool thread, a long wait must not hold up a short one.
    cppcoro::static_thread_pool pool(1);
    timer_service service;
    delay_timer long_timer(service);
    delay_timer short_timer(service);

    std::atomic<bool> long_done = false;
    std::thread waiter([&] {
        cppcoro::sync_wait(long_timer.wait(pool, milliseconds(60000)));
        long_done = true;
    });

    std::atomic<bool> short_done = false;
    std::thread other([&] {
        short_done
            = cppcoro::sync_wait(short_timer.wait(pool, milliseconds(1)));
    });
    REQUIRE(occurs_soon([&] { return short_done.load(); }));
    other.join();
    REQUIRE(!long_done);

    long_timer.cancel();
    REQUIRE(occurs_soon([&] { return long_done.load(); }));
    waiter.join();
}
