#include <strata/utilities/logging.h>

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace strata {

void
initialize_logging(logging_config const& config)
{
    static std::mutex registration_mutex;
    std::scoped_lock<std::mutex> lock(registration_mutex);

    auto logger = spdlog::get("strata");
    if (!logger)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    *config.log_file, 262144, 2));
        }
        logger = std::make_shared<spdlog::logger>(
            "strata", begin(sinks), end(sinks));
        logger->set_level(spdlog::level::info);
        spdlog::register_logger(logger);
    }
    if (config.level)
        logger->set_level(spdlog::level::from_str(*config.level));
}

} // namespace strata
