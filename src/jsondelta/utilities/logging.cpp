#include <jsondelta/utilities/logging.h>

#include <mutex>

#include <spdlog/sinks/ansicolor_sink.h>

namespace jsondelta {

static std::mutex logger_registration_mutex;

std::shared_ptr<spdlog::logger>
get_logger()
{
    if (auto logger = spdlog::get("jsondelta"))
        return logger;

    // Registration has to be serialized since spdlog refuses to register two
    // loggers with the same name.
    std::lock_guard<std::mutex> lock(logger_registration_mutex);
    if (auto logger = spdlog::get("jsondelta"))
        return logger;
    auto logger = std::make_shared<spdlog::logger>(
        "jsondelta",
        std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
    logger->set_level(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

void
initialize_logging(delta_config const& config)
{
    auto logger = get_logger();
    if (config.log_level)
        logger->set_level(spdlog::level::from_str(*config.log_level));
}

} // namespace jsondelta
