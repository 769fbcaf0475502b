#ifndef JSONDELTA_CORE_EXCEPTION_HPP
#define JSONDELTA_CORE_EXCEPTION_HPP

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

#include <jsondelta/core/type_definitions.h>

namespace jsondelta {

// The following macros are simple wrappers around Boost.Exception to codify
// how that library should be used within jsondelta.

#define JSONDELTA_DEFINE_EXCEPTION(id)                                        \
    struct id : virtual boost::exception, virtual std::exception              \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

#define JSONDELTA_DEFINE_ERROR_INFO(T, id)                                    \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

JSONDELTA_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

#define JSONDELTA_THROW(x)                                                    \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << ::jsondelta::stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// get_required_error_info is just like get_error_info except that it requires
// the info to be present and returns a const reference to it. If the info is
// missing, it throws its own exception.
JSONDELTA_DEFINE_EXCEPTION(missing_error_info)
JSONDELTA_DEFINE_ERROR_INFO(string, error_info_id)
JSONDELTA_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)
template<class ErrorInfo, class Exception>
typename ErrorInfo::error_info::value_type const&
get_required_error_info(Exception const& e)
{
    typename ErrorInfo::error_info::value_type const* info
        = get_error_info<ErrorInfo>(e);
    if (!info)
    {
        JSONDELTA_THROW(
            missing_error_info()
            << error_info_id_info(typeid(ErrorInfo).name())
            << wrapped_exception_diagnostics_info(
                   boost::diagnostic_information(e)));
    }
    return *info;
}

// If an error occurs internally within a library that provides its own
// error messages, this is used to convey that message.
JSONDELTA_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace jsondelta

#endif
