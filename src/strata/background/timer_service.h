#ifndef STRATA_BACKGROUND_TIMER_SERVICE_H
#define STRATA_BACKGROUND_TIMER_SERVICE_H

#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_service.hpp>

#include <strata/core.h>

namespace strata {

// A timer_service runs an Asio event loop on a dedicated thread so that
// timers can be waited on without tying up a worker thread.
//
// Timers created on the service's io_service must be destroyed before the
// service is.
struct timer_service : noncopyable
{
    timer_service();
    ~timer_service();

    boost::asio::io_service&
    io_service()
    {
        return io_service_;
    }

 private:
    boost::asio::io_service io_service_;
    boost::asio::executor_work_guard<boost::asio::io_service::executor_type>
        work_;
    std::thread thread_;
};

} // namespace strata

#endif
