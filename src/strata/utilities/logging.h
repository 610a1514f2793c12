#ifndef STRATA_UTILITIES_LOGGING_H
#define STRATA_UTILITIES_LOGGING_H

#include <ostream>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <strata/core.h>

namespace strata {

struct logging_config
{
    // the minimum level that's logged ("trace", "debug", "info", "warn",
    // "error", "critical" or "off") - The default is "info".
    optional<string> level;

    // If this is set, log messages are also written to a rotating file at
    // this path.
    optional<string> log_file;
};

// Create and register the "strata" logger if it doesn't already exist.
// If the logger already exists, only its level is updated (and only if the
// config specifies one).
void
initialize_logging(logging_config const& config = logging_config());

namespace detail {

template<class Value>
struct arg_logger
{
    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << " " << arg.name << "=" << arg.value;
    return stream;
}

} // namespace detail

// Create a logger for a function call.
#define STRATA_LOG_CALL(args)                                                 \
    {                                                                         \
        auto logger = spdlog::get("strata");                                  \
        std::ostringstream stream;                                            \
        stream << __func__ args;                                              \
        logger->debug(stream.str());                                          \
    }

// Log an argument to a function call.
#define STRATA_LOG_ARG(arg)                                                   \
    strata::detail::arg_logger<std::remove_cvref_t<decltype(arg)>>{#arg, arg}

} // namespace strata

#endif
