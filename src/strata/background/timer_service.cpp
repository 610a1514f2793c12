#include <strata/background/timer_service.h>

namespace strata {

timer_service::timer_service()
    : work_(boost::asio::make_work_guard(io_service_)),
      thread_([this] { io_service_.run(); })
{
}

timer_service::~timer_service()
{
    work_.reset();
    io_service_.stop();
    thread_.join();
}

} // namespace strata
