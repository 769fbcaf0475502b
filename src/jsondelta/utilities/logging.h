#ifndef JSONDELTA_UTILITIES_LOGGING_H
#define JSONDELTA_UTILITIES_LOGGING_H

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <jsondelta/config.hpp>

namespace jsondelta {

// Get the "jsondelta" logger.
// If the application hasn't registered one, a default logger that writes to
// stderr at 'warn' level is registered on first use.
std::shared_ptr<spdlog::logger>
get_logger();

// Make sure the logger exists and apply the logging settings from :config.
void
initialize_logging(delta_config const& config);

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n  " << arg.name << ": " << arg.value;
    return stream;
}

} // namespace detail

// Log a function call at debug level.
// The arguments are only formatted if debug logging is enabled.
#define JSONDELTA_LOG_CALL(args)                                              \
    {                                                                         \
        auto logger = ::jsondelta::get_logger();                              \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define JSONDELTA_LOG_ARG(arg)                                                \
    ::jsondelta::detail::arg_logger<                                          \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace jsondelta

#endif
